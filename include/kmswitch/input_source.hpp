#pragma once

#include "kmswitch/input_event.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

struct libevdev;

namespace kmswitch {

enum class SourceKind { Keyboard, Mouse };

const char* source_kind_name(SourceKind kind);

/*
    A physical input device.

    read_events() appends every event that is available right now and returns
    without blocking; readiness is signalled through fd(). It throws
    SourceDisconnected once the device is gone.
*/
class InputSource {
public:
    virtual ~InputSource() = default;

    virtual const std::string& path() const = 0;
    virtual int fd() const = 0;
    virtual void read_events(std::vector<InputEvent>& out) = 0;

    // Best effort: a refusal is logged and reported as false.
    virtual bool grab() = 0;
    virtual void release() = 0;

    // Live hardware state, not derived from the events read so far.
    virtual bool is_key_down(int code) const = 0;
    virtual void set_led(int code, bool on) = 0;
};

using SourceOpener = std::function<std::unique_ptr<InputSource>(const std::string& path)>;

class EvdevSource : public InputSource {
public:
    ~EvdevSource() override;

    EvdevSource(const EvdevSource&) = delete;
    EvdevSource& operator=(const EvdevSource&) = delete;

    // Throws DeviceUnavailable.
    static std::unique_ptr<EvdevSource> open(const std::string& path);

    const std::string& path() const override { return path_; }
    int fd() const override { return fd_; }
    void read_events(std::vector<InputEvent>& out) override;

    bool grab() override;
    void release() override;

    bool is_key_down(int code) const override;
    void set_led(int code, bool on) override;

private:
    EvdevSource(std::string path, int fd, libevdev* dev);

    std::string path_;
    int fd_;
    libevdev* dev_;
    bool grabbed_ = false;
};

}  // namespace kmswitch
