#include "kmswitch/router.hpp"

#include "kmswitch/errors.hpp"

#include <poll.h>

#include <cerrno>
#include <iostream>
#include <system_error>
#include <thread>

namespace kmswitch {

namespace {

constexpr int LOOP_POLL_MS = 100;
constexpr auto LOOP_YIELD = std::chrono::milliseconds(5);

}  // namespace

Router::Router(DeviceFactory& factory) : factory_(factory) {
    set_source_opener([](const std::string& path) -> std::unique_ptr<InputSource> {
        return EvdevSource::open(path);
    });
}

Router::~Router() {
    supervisor_.reset();
    sources_.release_all();
}

size_t Router::add_source(std::unique_ptr<InputSource> source, SourceKind kind) {
    std::cout << "[source] " << source_kind_name(kind) << ": " << source->path() << std::endl;
    return sources_.add(std::move(source), kind);
}

void Router::set_source_opener(SourceOpener opener, std::chrono::milliseconds interval) {
    supervisor_.reset();
    supervisor_ = std::make_unique<ReconnectSupervisor>(sources_, std::move(opener), interval);
}

Target& Router::add_target(int hotkey, const std::string& name, int notify_key) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    for (const auto& t : targets_) {
        if (t->hotkey == hotkey) {
            throw ConfigError("hotkey " + std::to_string(hotkey) + " already used by target '" + t->name + "'");
        }
        if (t->name == name) {
            throw ConfigError("duplicate target name '" + name + "'");
        }
    }
    if (hotkey == NO_KEY) {
        throw ConfigError("target '" + name + "' has no hotkey");
    }
    auto t = std::make_unique<Target>();
    t->hotkey = hotkey;
    t->name = name;
    t->notify_key = notify_key;
    auto kbd = factory_.create_keyboard(name);
    auto mouse = factory_.create_mouse(name);
    t->group = std::make_unique<VirtualInputGroup>(std::move(kbd), std::move(mouse));
    targets_.push_back(std::move(t));
    return *targets_.back();
}

void Router::add_callback(EventKind kind, int code, Callback callback) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    callbacks_[std::make_pair(kind, code)].push_back(std::move(callback));
}

Target* Router::find_hotkey(int code) {
    for (auto& t : targets_) {
        if (t->hotkey == code) return t.get();
    }
    return nullptr;
}

Target& Router::target(const std::string& name) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    for (auto& t : targets_) {
        if (t->name == name) return *t;
    }
    throw ConfigError("unknown target '" + name + "'");
}

const Target* Router::active() const {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    return active_;
}

bool Router::passthrough_mode() const {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    return passthrough_;
}

//------------------------------------------------------------------------------
// Switching

void Router::activate(Target& target) {
    if (!active_) sources_.grab_all();
    active_ = &target;
    std::cout << "[switch] -> " << target.name << std::endl;
    if (target.notify_key != NO_KEY) {
        for (auto& t : targets_) {
            t->group->press_and_release_key(target.notify_key);
        }
    }
}

void Router::release_grab() {
    sources_.release_all();
    if (active_) std::cout << "[switch] released (was " << active_->name << ")" << std::endl;
    active_ = nullptr;
}

void Router::set_active(const std::string& name) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    activate(target(name));
}

void Router::set_active_hotkey(int hotkey) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    Target* t = find_hotkey(hotkey);
    if (!t) {
        throw ConfigError("no target for hotkey " + std::to_string(hotkey));
    }
    activate(*t);
}

void Router::deactivate() {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    release_grab();
}

//------------------------------------------------------------------------------
// Classification

bool Router::is_key_down(int code) const {
    return sources_.is_key_down(code);
}

bool Router::is_passthrough() const {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    return passthrough_ || (modifier_ != NO_KEY && sources_.is_key_down(modifier_));
}

bool Router::held_anywhere(int code) const {
    for (const auto& t : targets_) {
        if (t->group->holds(code)) return true;
    }
    return false;
}

void Router::handle_event(const InputEvent& ev) {
    std::lock_guard<std::recursive_mutex> guard(lock_);

    // ignore noise
    if (ev.kind != EventKind::Key && ev.kind != EventKind::RelativeMotion) return;

    const bool key = ev.kind == EventKind::Key;

    if (key && toggle_ != NO_KEY && ev.code == toggle_) {
        if (is_down_edge(ev)) {
            passthrough_ = !passthrough_;
            sources_.set_keyboard_led(LED_SCROLLL, passthrough_);
            std::cout << "[noswitch] " << (passthrough_ ? "ON" : "OFF") << std::endl;
        }
        return;
    }

    // repeats and the release follow the path their press took
    if (key && ev.value != VALUE_DOWN) {
        auto pressed = press_paths_.find(ev.code);
        if (pressed != press_paths_.end()) {
            const PressPath path = pressed->second;
            if (ev.value == VALUE_UP) press_paths_.erase(pressed);
            if (path == PressPath::Callbacks) {
                run_callbacks(ev);
            } else {
                route_event(ev);
            }
            return;
        }
    }

    const bool is_modifier = key && modifier_ != NO_KEY && ev.code == modifier_;
    if (!is_modifier && is_passthrough()) {
        if (is_down_edge(ev)) press_paths_[ev.code] = PressPath::Routed;
        route_event(ev);
        return;
    }

    if (key) {
        if (Target* t = find_hotkey(ev.code)) {
            if (is_down_edge(ev)) {
                activate(*t);
            } else if (held_anywhere(ev.code)) {
                route_event(ev);
            }
            return;
        }
        if (release_hotkey_ != NO_KEY && ev.code == release_hotkey_) {
            if (is_down_edge(ev)) {
                release_grab();
            } else if (held_anywhere(ev.code)) {
                route_event(ev);
            }
            return;
        }
    }

    if (run_callbacks(ev)) {
        if (is_down_edge(ev)) press_paths_[ev.code] = PressPath::Callbacks;
        return;
    }

    route_event(ev);
}

bool Router::run_callbacks(const InputEvent& ev) {
    auto it = callbacks_.find(std::make_pair(ev.kind, ev.code));
    if (it == callbacks_.end()) return false;
    for (const auto& cb : it->second) {
        cb(ev);
    }
    return true;
}

//------------------------------------------------------------------------------
// Routing

void Router::deliver(Target& target, const InputEvent& ev) {
    VirtualInputGroup& group = *target.group;
    if (ev.kind == EventKind::Key) {
        if (is_mouse_button(ev.code)) {
            group.write_mouse_button(ev.code, ev.value);
        } else {
            group.write_key(ev.code, ev.value);
        }
    } else if (ev.kind == EventKind::RelativeMotion) {
        if (is_motion_axis(ev.code)) {
            group.queue_motion(ev.code, ev.value);
        } else if (is_scroll_axis(ev.code)) {
            group.scroll(ev.code, ev.value);
        }
    }
}

void Router::route_key(const InputEvent& ev) {
    if (ev.value == VALUE_UP) {
        bool delivered = false;
        for (auto& t : targets_) {
            if (t->group->holds(ev.code)) {
                deliver(*t, ev);
                delivered = true;
            }
        }
        if (!delivered && active_) deliver(*active_, ev);
        return;
    }
    if (!active_) return;
    for (const auto& t : targets_) {
        // still held by a target we switched away from
        if (t.get() != active_ && t->group->holds(ev.code)) return;
    }
    deliver(*active_, ev);
}

void Router::route_event(const InputEvent& ev) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    if (ev.kind == EventKind::Key) {
        route_key(ev);
    } else if (ev.kind == EventKind::RelativeMotion && active_) {
        deliver(*active_, ev);
    }
}

void Router::broadcast_event(const InputEvent& ev) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    for (auto& t : targets_) {
        deliver(*t, ev);
    }
}

void Router::route_to(const std::string& name, const InputEvent& ev) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    deliver(target(name), ev);
}

void Router::inject_event(const InputEvent& ev) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    route_event(ev);
    if (ev.kind == EventKind::RelativeMotion && active_) {
        active_->group->commit_motion();
    }
}

void Router::inject_motion(int axis, int delta) {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    if (!active_) return;
    active_->group->queue_motion(axis, delta);
    active_->group->commit_motion();
}

void Router::commit_motion() {
    std::lock_guard<std::recursive_mutex> guard(lock_);
    for (auto& t : targets_) {
        t->group->commit_motion();
    }
}

//------------------------------------------------------------------------------
// Event loop

bool Router::run_once(int timeout_ms) {
    auto ready = sources_.connected_sources();
    if (ready.empty()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms < 0 ? LOOP_POLL_MS : timeout_ms));
        commit_motion();
        return false;
    }

    std::vector<pollfd> fds(ready.size());
    for (size_t i = 0; i < ready.size(); ++i) {
        fds[i].fd = ready[i].source->fd();
        fds[i].events = POLLIN;
        fds[i].revents = 0;
    }

    int rc = poll(fds.data(), fds.size(), timeout_ms);
    if (rc < 0) {
        if (errno == EINTR) return false;
        throw std::system_error(errno, std::generic_category(), "poll");
    }

    std::vector<InputEvent> events;
    for (size_t i = 0; i < ready.size(); ++i) {
        if (!(fds[i].revents & (POLLIN | POLLERR | POLLHUP | POLLNVAL))) continue;
        events.clear();
        bool disconnected = false;
        try {
            ready[i].source->read_events(events);
        } catch (const SourceDisconnected&) {
            disconnected = true;
        }
        for (const auto& ev : events) {
            handle_event(ev);
        }
        if (disconnected) {
            supervisor_->source_failed(ready[i].slot);
        }
    }

    // send a single mouse event consisting of multiple smaller ones
    commit_motion();
    return rc > 0;
}

void Router::run_loop() {
    while (running_) {
        run_once(LOOP_POLL_MS);
        std::this_thread::sleep_for(LOOP_YIELD);
    }
}

}  // namespace kmswitch
