#include "kmswitch/virtual_device.hpp"

#include <vector>

namespace kmswitch {

VirtualInputGroup::VirtualInputGroup(std::unique_ptr<VirtualDevice> kbd, std::unique_ptr<VirtualDevice> mouse)
    : kbd_(std::move(kbd)), mouse_(std::move(mouse)) {}

void VirtualInputGroup::track(int code, int value) {
    if (value == VALUE_UP) {
        held_.erase(code);
    } else {
        held_.insert(code);
    }
}

void VirtualInputGroup::write_key(int code, int value) {
    kbd_->write(EV_KEY, code, value);
    kbd_->syn();
    track(code, value);
}

void VirtualInputGroup::press_and_release_key(int code) {
    write_key(code, VALUE_DOWN);
    write_key(code, VALUE_UP);
}

void VirtualInputGroup::write_mouse_button(int code, int value) {
    mouse_->write(EV_KEY, code, value);
    mouse_->syn();
    track(code, value);
}

void VirtualInputGroup::queue_motion(int axis, int delta) {
    if (axis == REL_X) {
        move_x_ += delta;
    } else if (axis == REL_Y) {
        move_y_ += delta;
    }
}

bool VirtualInputGroup::commit_motion() {
    bool syn = false;
    if (move_x_ != 0) {
        mouse_->write(EV_REL, REL_X, move_x_);
        syn = true;
    }
    if (move_y_ != 0) {
        mouse_->write(EV_REL, REL_Y, move_y_);
        syn = true;
    }
    move_x_ = move_y_ = 0;
    if (syn) {
        mouse_->syn();
    }
    return syn;
}

void VirtualInputGroup::scroll(int axis, int value) {
    mouse_->write(EV_REL, axis, value);
    mouse_->syn();
}

void VirtualInputGroup::release_all() {
    std::vector<int> codes(held_.begin(), held_.end());
    for (int code : codes) {
        if (is_mouse_button(code)) {
            write_mouse_button(code, VALUE_UP);
        } else {
            write_key(code, VALUE_UP);
        }
    }
}

}  // namespace kmswitch
