#include "kmswitch/errors.hpp"
#include "kmswitch/input_source.hpp"

#include <fcntl.h>
#include <libevdev/libevdev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <iostream>

namespace kmswitch {

namespace {

constexpr size_t LONG_BITS = sizeof(unsigned long) * CHAR_BIT;
constexpr size_t KEY_WORDS = (KEY_MAX + LONG_BITS) / LONG_BITS;

}  // namespace

const char* source_kind_name(SourceKind kind) {
    return kind == SourceKind::Keyboard ? "keyboard" : "mouse";
}

EvdevSource::EvdevSource(std::string path, int fd, libevdev* dev)
    : path_(std::move(path)), fd_(fd), dev_(dev) {}

EvdevSource::~EvdevSource() {
    if (grabbed_) libevdev_grab(dev_, LIBEVDEV_UNGRAB);
    libevdev_free(dev_);
    close(fd_);
}

std::unique_ptr<EvdevSource> EvdevSource::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        throw DeviceUnavailable(path, errno);
    }
    libevdev* dev = nullptr;
    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        close(fd);
        throw DeviceUnavailable(path, -rc);
    }
    return std::unique_ptr<EvdevSource>(new EvdevSource(path, fd, dev));
}

void EvdevSource::read_events(std::vector<InputEvent>& out) {
    unsigned flags = LIBEVDEV_READ_FLAG_NORMAL;
    input_event ev;
    while (true) {
        int rc = libevdev_next_event(dev_, flags, &ev);
        if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
            out.push_back(from_input_event(ev));
        } else if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            // Dropped events: replay the resync delta, then resume.
            out.push_back(from_input_event(ev));
            flags = LIBEVDEV_READ_FLAG_SYNC;
        } else if (rc == -EAGAIN) {
            if (flags == LIBEVDEV_READ_FLAG_SYNC) {
                flags = LIBEVDEV_READ_FLAG_NORMAL;
                continue;
            }
            return;
        } else if (rc == -EINTR) {
            continue;
        } else {
            throw SourceDisconnected(path_);
        }
    }
}

bool EvdevSource::grab() {
    int rc = libevdev_grab(dev_, LIBEVDEV_GRAB);
    if (rc < 0) {
        std::cerr << "[source] " << GrabDenied(path_, -rc).what() << std::endl;
        return false;
    }
    grabbed_ = true;
    return true;
}

void EvdevSource::release() {
    if (libevdev_grab(dev_, LIBEVDEV_UNGRAB) < 0) {
        std::cerr << "[source] ungrab failed: " << path_ << std::endl;
    }
    grabbed_ = false;
}

bool EvdevSource::is_key_down(int code) const {
    if (code < 0 || code > KEY_MAX) return false;
    unsigned long bits[KEY_WORDS] = {0};
    if (ioctl(fd_, EVIOCGKEY(sizeof(bits)), bits) < 0) {
        return false;
    }
    return (bits[code / LONG_BITS] >> (code % LONG_BITS)) & 1UL;
}

void EvdevSource::set_led(int code, bool on) {
    if (!libevdev_has_event_code(dev_, EV_LED, code)) return;
    int rc = libevdev_kernel_set_led_value(dev_, code, on ? LIBEVDEV_LED_ON : LIBEVDEV_LED_OFF);
    if (rc < 0) {
        std::cerr << "[source] set led failed on " << path_ << std::endl;
    }
}

}  // namespace kmswitch
