#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace kmswitch {

struct Candidate {
    std::string path;
    std::string base;
    std::string name;
    bool has_rel_xy = false;
    bool has_keys = false;
};

// Scans the *-event-* symlinks of a /dev/input/by-id style directory.
std::vector<Candidate> scan_symlinks(const std::string& dir);

/*
    Picks a keyboard (want_mouse = false) or mouse among `pool`: the first
    device matching the ordered `rules`, then a keyword guess, then the first
    capable device. Returns an empty path if nothing fits; `reason` says why
    a device was chosen.
*/
std::string choose_device(const std::vector<Candidate>& pool, bool want_mouse,
                          const std::vector<std::string>& rules, std::string& reason);

// by-id first, then by-path. Empty if nothing fits.
std::string autodetect(bool want_mouse, const std::vector<std::string>& rules);

void print_candidates(std::ostream& out, const std::string& label, const std::vector<Candidate>& v);

}  // namespace kmswitch
