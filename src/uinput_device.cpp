#include "kmswitch/uinput_device.hpp"

#include "kmswitch/errors.hpp"

#include <fcntl.h>
#include <libevdev/libevdev-uinput.h>
#include <libevdev/libevdev.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <fstream>
#include <iostream>

namespace kmswitch {

namespace {

constexpr int POINTER_BUTTONS[] = {BTN_LEFT, BTN_RIGHT, BTN_MIDDLE, BTN_SIDE,
                                   BTN_EXTRA, BTN_FORWARD, BTN_BACK, BTN_TASK};
constexpr int POINTER_AXES[] = {REL_X, REL_Y, REL_WHEEL, REL_HWHEEL};

std::string sanitize(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        if (!std::isalpha(static_cast<unsigned char>(c))) c = '_';
    }
    return out;
}

libevdev* pointer_template() {
    libevdev* dev = libevdev_new();
    if (!dev) return nullptr;
    libevdev_set_id_bustype(dev, BUS_VIRTUAL);
    libevdev_enable_event_type(dev, EV_SYN);
    libevdev_enable_event_code(dev, EV_SYN, SYN_REPORT, nullptr);
    libevdev_enable_event_type(dev, EV_KEY);
    for (int btn : POINTER_BUTTONS) {
        libevdev_enable_event_code(dev, EV_KEY, btn, nullptr);
    }
    libevdev_enable_event_type(dev, EV_REL);
    for (int axis : POINTER_AXES) {
        libevdev_enable_event_code(dev, EV_REL, axis, nullptr);
    }
    libevdev_enable_property(dev, INPUT_PROP_POINTER);
    return dev;
}

}  // namespace

UinputDevice::UinputDevice(std::string name, libevdev_uinput* uidev)
    : name_(std::move(name)), uidev_(uidev) {}

UinputDevice::~UinputDevice() {
    if (uidev_) libevdev_uinput_destroy(uidev_);
}

std::string UinputDevice::devnode() const {
    const char* node = libevdev_uinput_get_devnode(uidev_);
    return node ? std::string(node) : std::string();
}

void UinputDevice::write(uint16_t type, uint16_t code, int32_t value) {
    int rc = libevdev_uinput_write_event(uidev_, type, code, value);
    if (rc < 0) {
        throw SinkWriteFailed(name_, -rc);
    }
}

std::unique_ptr<UinputDevice> UinputDevice::create_from(libevdev* tmpl, const std::string& name) {
    libevdev_set_name(tmpl, name.c_str());
    libevdev_uinput* uidev = nullptr;
    int rc = libevdev_uinput_create_from_device(tmpl, LIBEVDEV_UINPUT_OPEN_MANAGED, &uidev);
    if (rc < 0) {
        throw DeviceUnavailable("/dev/uinput (" + name + ")", -rc);
    }
    return std::make_unique<UinputDevice>(name, uidev);
}

UinputFactory::UinputFactory(std::string kbd_path, std::string mouse_path, std::string devnode_dir)
    : kbd_path_(std::move(kbd_path)),
      mouse_path_(std::move(mouse_path)),
      devnode_dir_(std::move(devnode_dir)) {}

std::unique_ptr<VirtualDevice> UinputFactory::clone_device(const std::string& path, const std::string& name) {
    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        throw DeviceUnavailable(path, errno);
    }
    libevdev* dev = nullptr;
    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        close(fd);
        throw DeviceUnavailable(path, -rc);
    }
    std::unique_ptr<UinputDevice> out;
    try {
        out = UinputDevice::create_from(dev, name);
    } catch (...) {
        libevdev_free(dev);
        close(fd);
        throw;
    }
    libevdev_free(dev);
    close(fd);
    publish_devnode(*out);
    return out;
}

void UinputFactory::publish_devnode(const UinputDevice& dev) {
    std::string node = dev.devnode();
    std::cout << "[sink] " << dev.name() << " -> " << node << std::endl;
    if (devnode_dir_.empty()) return;
    std::string path = devnode_dir_ + "/" + sanitize(dev.name());
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << node;
    if (!out) {
        std::cerr << "[sink] failed to write devnode file: " << path << std::endl;
    }
}

std::unique_ptr<VirtualDevice> UinputFactory::create_keyboard(const std::string& target_name) {
    return clone_device(kbd_path_, target_name + "-virt-kbd");
}

std::unique_ptr<VirtualDevice> UinputFactory::create_mouse(const std::string& target_name) {
    const std::string name = target_name + "-virt-mouse";
    if (!mouse_path_.empty()) {
        return clone_device(mouse_path_, name);
    }
    libevdev* tmpl = pointer_template();
    if (!tmpl) {
        throw DeviceUnavailable("/dev/uinput (" + name + ")", ENOMEM);
    }
    std::unique_ptr<UinputDevice> out;
    try {
        out = UinputDevice::create_from(tmpl, name);
    } catch (...) {
        libevdev_free(tmpl);
        throw;
    }
    libevdev_free(tmpl);
    publish_devnode(*out);
    return out;
}

}  // namespace kmswitch
