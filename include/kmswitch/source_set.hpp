#pragma once

#include "kmswitch/input_source.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kmswitch {

/*
    The fixed set of physical sources.

    A slot is empty while its device is disconnected. The grab flag lives here
    so that a source attached later is grabbed under the same lock that grabs
    or releases the rest.
*/
class SourceSet {
public:
    struct Ready {
        size_t slot;
        InputSource* source;
    };

    size_t add(std::unique_ptr<InputSource> source, SourceKind kind);

    const std::string& path(size_t slot) const;
    bool connected(size_t slot) const;

    // Connected sources. Pointers stay valid until detach() of that slot.
    std::vector<Ready> connected_sources() const;

    // Closes the handle of a failed source.
    void detach(size_t slot);
    // Installs a reopened handle, grabbing it if the set is grabbed.
    void attach(size_t slot, std::unique_ptr<InputSource> source);

    void grab_all();
    void release_all();

    bool is_key_down(int code) const;
    void set_keyboard_led(int code, bool on);

private:
    struct Slot {
        std::string path;
        SourceKind kind;
        std::unique_ptr<InputSource> source;
    };

    mutable std::mutex lock_;
    std::vector<Slot> slots_;
    bool grabbed_ = false;
};

}  // namespace kmswitch
