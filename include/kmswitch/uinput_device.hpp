#pragma once

#include "kmswitch/virtual_device.hpp"

#include <string>

struct libevdev;
struct libevdev_uinput;

namespace kmswitch {

// A /dev/uinput device created through libevdev.
class UinputDevice : public VirtualDevice {
public:
    // Takes ownership of uidev.
    UinputDevice(std::string name, libevdev_uinput* uidev);
    ~UinputDevice() override;

    UinputDevice(const UinputDevice&) = delete;
    UinputDevice& operator=(const UinputDevice&) = delete;

    const std::string& name() const override { return name_; }
    std::string devnode() const;
    void write(uint16_t type, uint16_t code, int32_t value) override;

    // Clones the capabilities of `tmpl` under a new name.
    static std::unique_ptr<UinputDevice> create_from(libevdev* tmpl, const std::string& name);

private:
    std::string name_;
    libevdev_uinput* uidev_;
};

/*
    Creates the virtual keyboard and mouse of each target.

    The keyboard copies the capabilities of the physical keyboard, the mouse
    those of the physical mouse. With no mouse path a generic pointer is used.
*/
class UinputFactory : public DeviceFactory {
public:
    UinputFactory(std::string kbd_path, std::string mouse_path, std::string devnode_dir = {});

    std::unique_ptr<VirtualDevice> create_keyboard(const std::string& target_name) override;
    std::unique_ptr<VirtualDevice> create_mouse(const std::string& target_name) override;

private:
    std::unique_ptr<VirtualDevice> clone_device(const std::string& path, const std::string& name);
    void publish_devnode(const UinputDevice& dev);

    std::string kbd_path_;
    std::string mouse_path_;
    std::string devnode_dir_;
};

}  // namespace kmswitch
