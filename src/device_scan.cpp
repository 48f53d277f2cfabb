#include "kmswitch/device_scan.hpp"

#include <fcntl.h>
#include <libevdev/libevdev.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace kmswitch {

namespace {

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool contains_ci(const std::string& hay, const std::string& needle) {
    return to_lower(hay).find(to_lower(needle)) != std::string::npos;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void read_capabilities(Candidate& c) {
    int fd = open(c.path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) return;
    libevdev* dev = nullptr;
    if (libevdev_new_from_fd(fd, &dev) == 0 && dev) {
        const char* nm = libevdev_get_name(dev);
        if (nm) c.name = nm;
        c.has_rel_xy = libevdev_has_event_code(dev, EV_REL, REL_X) && libevdev_has_event_code(dev, EV_REL, REL_Y);
        c.has_keys = libevdev_has_event_type(dev, EV_KEY);
        libevdev_free(dev);
    }
    close(fd);
}

bool matches(const Candidate& c, const std::string& needle) {
    return contains_ci(c.base, needle) || (!c.name.empty() && contains_ci(c.name, needle));
}

}  // namespace

std::vector<Candidate> scan_symlinks(const std::string& dir) {
    namespace fs = std::filesystem;
    std::vector<Candidate> v;
    std::error_code ec;
    if (!fs::exists(dir, ec)) return v;
    for (auto& de : fs::directory_iterator(dir, ec)) {
        if (ec) break;
        if (!de.is_symlink(ec)) continue;
        Candidate c;
        c.path = de.path().string();
        c.base = de.path().filename().string();
        if (c.base.find("event-") == std::string::npos) continue;
        read_capabilities(c);
        v.push_back(c);
    }
    std::sort(v.begin(), v.end(), [](const Candidate& a, const Candidate& b) { return a.base < b.base; });
    return v;
}

std::string choose_device(const std::vector<Candidate>& pool, bool want_mouse,
                          const std::vector<std::string>& rules, std::string& reason) {
    const std::string suffix = want_mouse ? "-event-mouse" : "-event-kbd";
    std::vector<const Candidate*> typed;
    for (const auto& c : pool) {
        if (!ends_with(c.base, suffix)) continue;
        if (want_mouse && !c.has_rel_xy) continue;
        if (!want_mouse && !c.has_keys) continue;
        typed.push_back(&c);
    }
    if (typed.empty()) return {};

    int rix = 0;
    for (const auto& r : rules) {
        ++rix;
        if (r.empty()) continue;
        for (const auto* pc : typed) {
            if (matches(*pc, r)) {
                reason = "rule " + std::to_string(rix) + " ('" + r + "')";
                return pc->path;
            }
        }
    }

    static const std::vector<std::string> mouse_kws = {"mouse", "trackball", "trackpoint", "touchpad"};
    static const std::vector<std::string> kbd_kws = {"keyboard", "kbd"};
    for (const auto& kw : want_mouse ? mouse_kws : kbd_kws) {
        for (const auto* pc : typed) {
            if (matches(*pc, kw)) {
                reason = "keyword '" + kw + "'";
                return pc->path;
            }
        }
    }
    reason = "first capable in order";
    return typed.front()->path;
}

std::string autodetect(bool want_mouse, const std::vector<std::string>& rules) {
    const char* label = want_mouse ? "mouse" : "kbd";
    for (const char* dir : {"/dev/input/by-id", "/dev/input/by-path"}) {
        std::string why;
        std::string guess = choose_device(scan_symlinks(dir), want_mouse, rules, why);
        if (!guess.empty()) {
            std::cout << "[auto] " << label << ": " << guess << " via " << why << std::endl;
            return guess;
        }
    }
    std::cerr << "[auto] no " << label << " found" << std::endl;
    return {};
}

void print_candidates(std::ostream& out, const std::string& label, const std::vector<Candidate>& v) {
    out << "[scan] " << label << ": " << v.size() << " candidates" << std::endl;
    for (size_t i = 0; i < v.size(); ++i) {
        const auto& c = v[i];
        out << "  [" << (i + 1) << "] " << c.path << "  name='" << c.name << "'  caps="
            << (c.has_rel_xy ? "relXY" : "-") << "," << (c.has_keys ? "keys" : "-") << std::endl;
    }
}

}  // namespace kmswitch
