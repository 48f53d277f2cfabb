#include "kmswitch/key_features.hpp"

#include <memory>

namespace kmswitch {

namespace {

// std::function needs copyable targets; stateful features are shared.
template <typename Feature>
void install_stateful(Router& router, EventKind kind, int code, Feature feature) {
    auto state = std::make_shared<Feature>(std::move(feature));
    router.add_callback(kind, code, [state](const InputEvent& ev) { (*state)(ev); });
}

}  // namespace

void BroadcastKey::install(Router& router, int code) {
    router.add_callback(EventKind::Key, code, BroadcastKey{&router});
}

void KeyRemap::operator()(const InputEvent& ev) const {
    InputEvent out = ev;
    out.code = to;
    if (broadcast) {
        router->broadcast_event(out);
    } else {
        router->route_event(out);
    }
}

void KeyRemap::install(Router& router, int from, int to, bool broadcast) {
    router.add_callback(EventKind::Key, from, KeyRemap{&router, to, broadcast});
}

void TargetKey::install(Router& router, int code, const std::string& target) {
    // fail at configuration time, not on the first key press
    router.target(target);
    router.add_callback(EventKind::Key, code, TargetKey{&router, target});
}

void ChordPassThroughRemap::operator()(const InputEvent& ev) {
    if (state == State::Remapping && ev.value == VALUE_DOWN) {
        for (int key : chord) {
            if (router->is_key_down(key)) {
                state = State::PassingThrough;
                break;
            }
        }
    }

    if (state == State::PassingThrough) {
        router->route_event(ev);
        if (ev.value == VALUE_UP) state = State::Remapping;
        return;
    }

    InputEvent out = ev;
    out.code = to;
    router->broadcast_event(out);
}

void ChordPassThroughRemap::install(Router& router, int code, std::vector<int> chord, int to) {
    ChordPassThroughRemap feature;
    feature.router = &router;
    feature.chord = std::move(chord);
    feature.to = to;
    install_stateful(router, EventKind::Key, code, std::move(feature));
}

void KeyToScroll::operator()(const InputEvent& ev) const {
    // key-down only
    if (ev.value != VALUE_DOWN) return;
    router->route_event(rel_event(axis, step, ev.time_usec));
}

void KeyToScroll::install(Router& router, int code, int axis, int step) {
    router.add_callback(EventKind::Key, code, KeyToScroll{&router, axis, step});
}

void ButtonDebounce::operator()(const InputEvent& ev) {
    switch (state) {
        case State::Released:
            if (ev.value == VALUE_DOWN) {
                if (seen_up && ev.time_usec >= last_up_usec && ev.time_usec - last_up_usec < window_usec) {
                    state = State::Suppressed;
                    return;
                }
                state = State::Pressed;
            }
            router->route_event(ev);
            break;
        case State::Pressed:
            router->route_event(ev);
            if (ev.value == VALUE_UP) {
                state = State::Released;
                last_up_usec = ev.time_usec;
                seen_up = true;
            }
            break;
        case State::Suppressed:
            if (ev.value == VALUE_UP) state = State::Released;
            break;
    }
}

void ButtonDebounce::install(Router& router, int code, uint64_t window_usec) {
    ButtonDebounce feature;
    feature.router = &router;
    feature.window_usec = window_usec;
    install_stateful(router, EventKind::Key, code, std::move(feature));
}

}  // namespace kmswitch
