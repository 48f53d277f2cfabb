#include "kmswitch/config.hpp"

#include "kmswitch/errors.hpp"
#include "kmswitch/key_features.hpp"

#include <libevdev/libevdev.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <ostream>
#include <sstream>

namespace kmswitch {

namespace {

const std::vector<std::string> FLAG_OPTIONS = {"list-devices", "help"};

std::string to_upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 0);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int require_int(const std::string& option, const std::string& s) {
    int v = 0;
    if (!parse_int(s, v)) {
        throw ConfigError("--" + option + ": not a number: '" + s + "'");
    }
    return v;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string part;
    std::istringstream in(s);
    while (std::getline(in, part, sep)) out.push_back(part);
    if (!s.empty() && s.back() == sep) out.emplace_back();
    return out;
}

// "a=b" -> {a, b}
std::pair<std::string, std::string> split_pair(const std::string& option, const std::string& s) {
    size_t eq = s.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == s.size()) {
        throw ConfigError("--" + option + ": expected <a>=<b>, got '" + s + "'");
    }
    return {s.substr(0, eq), s.substr(eq + 1)};
}

int code_from_name(unsigned type, const std::string& text, const std::vector<std::string>& prefixes) {
    int v = 0;
    if (parse_int(text, v)) return v;
    std::string upper = to_upper(text);
    int code = libevdev_event_code_from_name(type, upper.c_str());
    if (code >= 0) return code;
    for (const auto& p : prefixes) {
        code = libevdev_event_code_from_name(type, (p + upper).c_str());
        if (code >= 0) return code;
    }
    return -1;
}

std::string expand_home(const std::string& path) {
    if (path.size() < 2 || path.compare(0, 2, "~/") != 0) return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

}  // namespace

int parse_key_code(const std::string& text) {
    int code = code_from_name(EV_KEY, trim(text), {"KEY_", "BTN_"});
    if (code <= 0 || code > KEY_MAX) {
        throw ConfigError("unknown key: '" + text + "'");
    }
    return code;
}

int parse_rel_code(const std::string& text) {
    int code = code_from_name(EV_REL, trim(text), {"REL_"});
    if (code < 0 || code > REL_MAX) {
        throw ConfigError("unknown relative axis: '" + text + "'");
    }
    return code;
}

void apply_option(Config& c, const std::string& name, const std::string& value) {
    if (name == "kbd") {
        c.kbd_path = value;
    } else if (name == "mouse") {
        if (to_lower(value) == "none") {
            c.no_mouse = true;
            c.mouse_path.clear();
        } else {
            c.no_mouse = false;
            c.mouse_path = value;
        }
    } else if (name == "kbd-match") {
        c.kbd_matches.push_back(value);
    } else if (name == "mouse-match") {
        c.mouse_matches.push_back(value);
    } else if (name == "target") {
        // <hotkey>:<name>[:<notify>]
        auto parts = split(value, ':');
        if (parts.size() < 2 || parts.size() > 3 || parts[1].empty()) {
            throw ConfigError("--target: expected <hotkey>:<name>[:<notify>], got '" + value + "'");
        }
        TargetEntry t;
        t.hotkey = parse_key_code(parts[0]);
        t.name = parts[1];
        if (parts.size() == 3 && !parts[2].empty()) t.notify_key = parse_key_code(parts[2]);
        c.targets.push_back(t);
    } else if (name == "active") {
        c.active = value;
    } else if (name == "release-hotkey") {
        c.release_hotkey = parse_key_code(value);
    } else if (name == "noswitch-modifier") {
        c.noswitch_modifier = parse_key_code(value);
    } else if (name == "noswitch-toggle") {
        c.noswitch_toggle = parse_key_code(value);
    } else if (name == "broadcast") {
        c.broadcast_keys.push_back(parse_key_code(value));
    } else if (name == "remap") {
        auto kv = split_pair(name, value);
        RemapEntry r;
        r.from = parse_key_code(kv.first);
        r.to = parse_key_code(kv.second);
        c.remaps.push_back(r);
    } else if (name == "chord-remap") {
        // <from>=<to>[:<chord>,<chord>...]
        auto kv = split_pair(name, value);
        RemapEntry r;
        r.from = parse_key_code(kv.first);
        auto rhs = split(kv.second, ':');
        r.to = parse_key_code(rhs[0]);
        if (rhs.size() > 1) {
            for (const auto& k : split(rhs[1], ',')) r.chord.push_back(parse_key_code(k));
        } else {
            r.chord = {KEY_LEFTALT, KEY_RIGHTALT};
        }
        c.chord_remaps.push_back(r);
    } else if (name == "route-to") {
        auto kv = split_pair(name, value);
        c.routes.push_back(RouteEntry{parse_key_code(kv.first), kv.second});
    } else if (name == "key-scroll") {
        // <key>=<axis>:<step>
        auto kv = split_pair(name, value);
        auto rhs = split(kv.second, ':');
        if (rhs.size() != 2) {
            throw ConfigError("--key-scroll: expected <key>=<axis>:<step>, got '" + value + "'");
        }
        ScrollEntry s;
        s.code = parse_key_code(kv.first);
        s.axis = parse_rel_code(rhs[0]);
        s.step = require_int(name, rhs[1]);
        c.scroll_keys.push_back(s);
    } else if (name == "debounce") {
        auto kv = split_pair(name, value);
        DebounceEntry d;
        d.code = parse_key_code(kv.first);
        d.window_ms = require_int(name, kv.second);
        if (d.window_ms <= 0) throw ConfigError("--debounce: window must be positive");
        c.debounces.push_back(d);
    } else if (name == "listen") {
        c.listen_port = require_int(name, value);
        if (c.listen_port <= 0 || c.listen_port > 65535) throw ConfigError("--listen: bad port " + value);
    } else if (name == "auth-file") {
        c.auth_file = expand_home(value);
    } else if (name == "nudge") {
        auto kv = split_pair(name, value);
        c.nudges[kv.first] = require_int(name, kv.second);
    } else if (name == "devnode-dir") {
        c.devnode_dir = value;
    } else if (name == "reconnect-ms") {
        c.reconnect_ms = require_int(name, value);
        if (c.reconnect_ms <= 0) throw ConfigError("--reconnect-ms must be positive");
    } else if (name == "list-devices") {
        c.list_devices = value.empty() || value == "1" || to_lower(value) == "true" || to_lower(value) == "yes";
    } else if (name == "help") {
        c.help = true;
    } else if (name == "config") {
        load_config_file(c, value);
    } else {
        throw ConfigError("unknown option --" + name);
    }
}

void load_config_file(Config& c, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot read config file: " + path);
    }
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError(path + ":" + std::to_string(lineno) + ": expected NAME=value");
        }
        std::string key = to_lower(trim(line.substr(0, eq)));
        std::replace(key.begin(), key.end(), '_', '-');
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (key == "config") {
            throw ConfigError(path + ":" + std::to_string(lineno) + ": nested CONFIG is not allowed");
        }
        try {
            apply_option(c, key, value);
        } catch (const ConfigError& e) {
            throw ConfigError(path + ":" + std::to_string(lineno) + ": " + e.what());
        }
    }
}

Config parse_args(int argc, char** argv) {
    Config c;
    c.auth_file = expand_home("~/.windows-hotkey-server");
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h") arg = "--help";
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            throw ConfigError("unexpected argument '" + arg + "'");
        }
        std::string name = arg.substr(2);
        if (std::find(FLAG_OPTIONS.begin(), FLAG_OPTIONS.end(), name) != FLAG_OPTIONS.end()) {
            apply_option(c, name, "");
            continue;
        }
        if (i + 1 >= argc) {
            throw ConfigError("missing value for " + arg);
        }
        apply_option(c, name, argv[++i]);
    }
    return c;
}

void print_usage(std::ostream& out, const char* prog) {
    out << "Usage: " << prog
        << " --kbd <path>|auto [--mouse <path>|auto|none] --target <hotkey>:<name>[:<notify>] ... [options]\n\n"
        << "Devices:\n"
        << "  --kbd-match <substr>         Ordered match for the keyboard (repeatable)\n"
        << "  --mouse-match <substr>       Ordered match for the mouse (repeatable)\n"
        << "  --list-devices               List candidates and exit\n"
        << "  --devnode-dir <dir>          Write each virtual device node path to <dir>/<name>\n"
        << "  --reconnect-ms <N>           Retry interval for unplugged devices (default 1000)\n\n"
        << "Switching:\n"
        << "  --active <name>              Target active at startup (default: none, ungrabbed)\n"
        << "  --release-hotkey <key>       Ungrab and give input back to the host\n"
        << "  --noswitch-modifier <key>    While held, hotkeys go to the target\n"
        << "  --noswitch-toggle <key>      Toggles noswitch mode (Scroll Lock LED)\n\n"
        << "Key features:\n"
        << "  --broadcast <key>            Send key to every target\n"
        << "  --remap <from>=<to>          Replace a key\n"
        << "  --chord-remap <from>=<to>[:<chord>,...]\n"
        << "                               Replace a key unless a chord key (default Alt) is held\n"
        << "  --route-to <key>=<name>      Always send key to one target\n"
        << "  --key-scroll <key>=<axis>:<step>\n"
        << "                               Turn key presses into scroll steps\n"
        << "  --debounce <button>=<ms>     Ignore button chatter within <ms>\n\n"
        << "Control:\n"
        << "  --listen <port>              Accept switch requests on TCP <port>\n"
        << "  --auth-file <path>           Shared secret (default ~/.windows-hotkey-server)\n"
        << "  --nudge <name>=<dx>          Pointer nudge after a remote switch to <name>\n\n"
        << "  --config <file>              NAME=value lines, NAME = option in upper case (TARGET=F1:win:KP1)\n"
        << std::endl;
}

void configure_router(Router& router, const Config& c) {
    if (c.targets.empty()) {
        throw ConfigError("no targets configured (use --target)");
    }
    for (const auto& t : c.targets) {
        router.add_target(t.hotkey, t.name, t.notify_key);
    }
    router.set_passthrough_modifier(c.noswitch_modifier);
    router.set_passthrough_toggle(c.noswitch_toggle);
    router.set_release_hotkey(c.release_hotkey);

    auto broadcast = [&](int code) {
        return std::find(c.broadcast_keys.begin(), c.broadcast_keys.end(), code) != c.broadcast_keys.end();
    };
    auto remapped = [&](int code) {
        for (const auto& r : c.remaps) {
            if (r.from == code) return true;
        }
        return false;
    };

    for (int code : c.broadcast_keys) {
        // a remapped key is broadcast after remapping, not before
        if (!remapped(code)) BroadcastKey::install(router, code);
    }
    for (const auto& r : c.remaps) {
        KeyRemap::install(router, r.from, r.to, broadcast(r.to));
    }
    for (const auto& r : c.chord_remaps) {
        ChordPassThroughRemap::install(router, r.from, r.chord, r.to);
    }
    for (const auto& r : c.routes) {
        TargetKey::install(router, r.code, r.target);
    }
    for (const auto& s : c.scroll_keys) {
        KeyToScroll::install(router, s.code, s.axis, s.step);
    }
    for (const auto& d : c.debounces) {
        ButtonDebounce::install(router, d.code, static_cast<uint64_t>(d.window_ms) * 1000);
    }
}

}  // namespace kmswitch
