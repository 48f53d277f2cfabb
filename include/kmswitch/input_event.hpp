#pragma once

#include <linux/input.h>

#include <cstdint>

namespace kmswitch {

enum class EventKind { Key, RelativeMotion, Sync, Other };

// Key values as reported by evdev.
constexpr int VALUE_UP = 0;
constexpr int VALUE_DOWN = 1;
constexpr int VALUE_REPEAT = 2;

struct InputEvent {
    EventKind kind = EventKind::Other;
    int code = 0;
    int value = 0;
    uint64_t time_usec = 0;
};

InputEvent from_input_event(const input_event& ev);

inline InputEvent key_event(int code, int value, uint64_t time_usec = 0) {
    return InputEvent{EventKind::Key, code, value, time_usec};
}

inline InputEvent rel_event(int code, int value, uint64_t time_usec = 0) {
    return InputEvent{EventKind::RelativeMotion, code, value, time_usec};
}

inline bool is_down_edge(const InputEvent& ev) {
    return ev.kind == EventKind::Key && ev.value == VALUE_DOWN;
}

inline bool is_mouse_button(int code) {
    return code >= BTN_MOUSE && code <= BTN_TASK;
}

inline bool is_motion_axis(int code) {
    return code == REL_X || code == REL_Y;
}

bool is_scroll_axis(int code);

}  // namespace kmswitch
