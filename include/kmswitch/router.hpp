#pragma once

#include "kmswitch/input_event.hpp"
#include "kmswitch/input_source.hpp"
#include "kmswitch/reconnect.hpp"
#include "kmswitch/source_set.hpp"
#include "kmswitch/virtual_device.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace kmswitch {

// Code 0 (KEY_RESERVED) means "not configured" for every key setting below.
constexpr int NO_KEY = 0;

struct Target {
    int hotkey = NO_KEY;
    std::string name;
    int notify_key = NO_KEY;
    std::unique_ptr<VirtualInputGroup> group;
};

/*
    Grabs the physical keyboard and mouse and redirects their events to the
    virtual devices of the active target.

    Every incoming event is classified in this order:
      1. anything but EV_KEY / EV_REL is dropped
      2. the noswitch toggle flips noswitch mode (always intercepted)
      3. in noswitch mode everything except the modifier is routed as is
      4. a target hotkey switches targets, the release hotkey ungrabs
      5. keys with callbacks run all callbacks in registration order
      6. everything else is routed to the active target

    Routing keeps keys from getting stuck across a switch: a key-up goes to
    every target still holding that key, and a key-down is dropped while
    another target holds it. Repeats and the key-up of a press that was
    routed in noswitch mode, or handed to callbacks, take that same path even
    if the mode changed in between.

    set_active*(), deactivate(), inject_event() and inject_motion() may be
    called from other threads. Everything else belongs to the loop thread.
    Callbacks run on the loop thread with the router locked and may call the
    routing helpers directly.
*/
class Router {
public:
    using Callback = std::function<void(const InputEvent&)>;

    explicit Router(DeviceFactory& factory);
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Configuration, before run_loop()
    size_t add_source(std::unique_ptr<InputSource> source, SourceKind kind);
    void set_source_opener(SourceOpener opener,
                           std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
    Target& add_target(int hotkey, const std::string& name, int notify_key = NO_KEY);
    void add_callback(EventKind kind, int code, Callback callback);
    void set_passthrough_modifier(int code) { modifier_ = code; }
    void set_passthrough_toggle(int code) { toggle_ = code; }
    void set_release_hotkey(int code) { release_hotkey_ = code; }

    // Switch requests
    void set_active(const std::string& name);
    void set_active_hotkey(int hotkey);
    void deactivate();

    void inject_event(const InputEvent& ev);
    void inject_motion(int axis, int delta);

    // Event loop
    void handle_event(const InputEvent& ev);
    void commit_motion();
    // One poll + drain + commit. Returns true if any source was readable.
    bool run_once(int timeout_ms);
    void run_loop();
    void stop() { running_ = false; }

    // Routing helpers for callbacks
    void route_event(const InputEvent& ev);
    void broadcast_event(const InputEvent& ev);
    void route_to(const std::string& name, const InputEvent& ev);
    bool is_key_down(int code) const;
    bool is_passthrough() const;

    const Target* active() const;
    Target& target(const std::string& name);
    const std::vector<std::unique_ptr<Target>>& targets() const { return targets_; }
    bool passthrough_mode() const;
    SourceSet& sources() { return sources_; }
    ReconnectSupervisor& supervisor() { return *supervisor_; }

private:
    enum class PressPath { Routed, Callbacks };

    Target* find_hotkey(int code);
    bool held_anywhere(int code) const;
    void activate(Target& target);
    void release_grab();
    void route_key(const InputEvent& ev);
    void deliver(Target& target, const InputEvent& ev);
    bool run_callbacks(const InputEvent& ev);

    DeviceFactory& factory_;

    mutable std::recursive_mutex lock_;
    std::vector<std::unique_ptr<Target>> targets_;
    Target* active_ = nullptr;
    std::map<std::pair<EventKind, int>, std::vector<Callback>> callbacks_;
    std::map<int, PressPath> press_paths_;
    int modifier_ = NO_KEY;
    int toggle_ = NO_KEY;
    int release_hotkey_ = NO_KEY;
    bool passthrough_ = false;

    SourceSet sources_;
    std::unique_ptr<ReconnectSupervisor> supervisor_;
    std::atomic<bool> running_{true};
};

}  // namespace kmswitch
