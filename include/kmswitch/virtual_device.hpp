#pragma once

#include "kmswitch/input_event.hpp"

#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace kmswitch {

// An emulated evdev device. write() must raise SinkWriteFailed on error.
class VirtualDevice {
public:
    virtual ~VirtualDevice() = default;

    virtual const std::string& name() const = 0;
    virtual void write(uint16_t type, uint16_t code, int32_t value) = 0;

    void syn() { write(EV_SYN, SYN_REPORT, 0); }
};

class DeviceFactory {
public:
    virtual ~DeviceFactory() = default;

    virtual std::unique_ptr<VirtualDevice> create_keyboard(const std::string& target_name) = 0;
    virtual std::unique_ptr<VirtualDevice> create_mouse(const std::string& target_name) = 0;
};

/*
    One target's keyboard + mouse pair.

    Tracks the keys and buttons currently held down on the pair and batches
    REL_X/REL_Y motion until commit_motion().
*/
class VirtualInputGroup {
public:
    VirtualInputGroup(std::unique_ptr<VirtualDevice> kbd, std::unique_ptr<VirtualDevice> mouse);

    void write_key(int code, int value);
    void press_and_release_key(int code);
    void write_mouse_button(int code, int value);

    void queue_motion(int axis, int delta);
    // Returns true if anything was written.
    bool commit_motion();
    void scroll(int axis, int value);

    // Releases everything this group still holds.
    void release_all();

    bool holds(int code) const { return held_.count(code) != 0; }
    const std::set<int>& held_keys() const { return held_; }
    int pending_x() const { return move_x_; }
    int pending_y() const { return move_y_; }

private:
    void track(int code, int value);

    std::unique_ptr<VirtualDevice> kbd_;
    std::unique_ptr<VirtualDevice> mouse_;
    std::set<int> held_;
    int move_x_ = 0;
    int move_y_ = 0;
};

}  // namespace kmswitch
