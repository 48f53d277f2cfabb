#pragma once

#include "kmswitch/input_event.hpp"
#include "kmswitch/router.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace kmswitch {

/*
    Hotkey behaviours built on Router::add_callback().

    Each feature is a small state machine installed for one code; install()
    registers a callback that owns a copy of it.
*/

// Sends the key to every target (e.g. a push-to-talk key).
struct BroadcastKey {
    Router* router = nullptr;

    void operator()(const InputEvent& ev) const { router->broadcast_event(ev); }

    static void install(Router& router, int code);
};

// Rewrites the code, then routes normally or to every target.
struct KeyRemap {
    Router* router = nullptr;
    int to = NO_KEY;
    bool broadcast = false;

    void operator()(const InputEvent& ev) const;

    static void install(Router& router, int from, int to, bool broadcast = false);
};

// Sends the key to one fixed target no matter which one is active.
struct TargetKey {
    Router* router = nullptr;
    std::string target;

    void operator()(const InputEvent& ev) const { router->route_to(target, ev); }

    static void install(Router& router, int code, const std::string& target);
};

/*
    Remaps a key unless it is pressed together with a chord key.

    Remapping:      down with no chord key held -> broadcast `to` instead
    PassingThrough: down with a chord key held  -> route the key unchanged
                    until it is released, then back to Remapping

    With KEY_F4 / {KEY_LEFTALT, KEY_RIGHTALT} / KEY_KP4, Alt+F4 still closes
    windows on the active target and a bare F4 sends KP4 everywhere.
*/
struct ChordPassThroughRemap {
    enum class State { Remapping, PassingThrough };

    Router* router = nullptr;
    std::vector<int> chord;
    int to = NO_KEY;
    State state = State::Remapping;

    void operator()(const InputEvent& ev);

    static void install(Router& router, int code, std::vector<int> chord, int to);
};

// Turns key presses into scroll steps, e.g. keypad 4/6 for horizontal scrolling.
struct KeyToScroll {
    Router* router = nullptr;
    int axis = REL_HWHEEL;
    int step = 1;

    void operator()(const InputEvent& ev) const;

    static void install(Router& router, int code, int axis, int step);
};

/*
    Drops the chatter of a worn mouse button.

    Released:   down arriving within `window_usec` of the last up -> Suppressed
                (the down is dropped), otherwise routed -> Pressed
    Pressed:    up is routed -> Released
    Suppressed: the matching up is dropped -> Released
*/
struct ButtonDebounce {
    enum class State { Released, Pressed, Suppressed };

    Router* router = nullptr;
    uint64_t window_usec = 0;
    State state = State::Released;
    uint64_t last_up_usec = 0;
    bool seen_up = false;

    void operator()(const InputEvent& ev);

    static void install(Router& router, int code, uint64_t window_usec);
};

}  // namespace kmswitch
