#include "kmswitch/input_event.hpp"

namespace kmswitch {

InputEvent from_input_event(const input_event& ev) {
    InputEvent out;
    switch (ev.type) {
        case EV_KEY:
            out.kind = EventKind::Key;
            break;
        case EV_REL:
            out.kind = EventKind::RelativeMotion;
            break;
        case EV_SYN:
            out.kind = EventKind::Sync;
            break;
        default:
            out.kind = EventKind::Other;
            break;
    }
    out.code = ev.code;
    out.value = ev.value;
    out.time_usec = static_cast<uint64_t>(ev.input_event_sec) * 1000000 +
                    static_cast<uint64_t>(ev.input_event_usec);
    return out;
}

bool is_scroll_axis(int code) {
    switch (code) {
        case REL_WHEEL:
        case REL_HWHEEL:
#ifdef REL_WHEEL_HI_RES
        case REL_WHEEL_HI_RES:
        case REL_HWHEEL_HI_RES:
#endif
            return true;
        default:
            return false;
    }
}

}  // namespace kmswitch
