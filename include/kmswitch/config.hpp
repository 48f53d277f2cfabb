#pragma once

#include "kmswitch/router.hpp"

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace kmswitch {

struct TargetEntry {
    int hotkey = NO_KEY;
    std::string name;
    int notify_key = NO_KEY;
};

struct RemapEntry {
    int from = NO_KEY;
    int to = NO_KEY;
    std::vector<int> chord;
};

struct RouteEntry {
    int code = NO_KEY;
    std::string target;
};

struct ScrollEntry {
    int code = NO_KEY;
    int axis = REL_HWHEEL;
    int step = 1;
};

struct DebounceEntry {
    int code = NO_KEY;
    int window_ms = 0;
};

struct Config {
    std::string kbd_path;
    std::string mouse_path;
    bool no_mouse = false;
    std::vector<std::string> kbd_matches;
    std::vector<std::string> mouse_matches;
    bool list_devices = false;
    bool help = false;

    std::vector<TargetEntry> targets;
    std::string active;
    int release_hotkey = NO_KEY;
    int noswitch_modifier = NO_KEY;
    int noswitch_toggle = NO_KEY;

    std::vector<int> broadcast_keys;
    std::vector<RemapEntry> remaps;
    std::vector<RemapEntry> chord_remaps;
    std::vector<RouteEntry> routes;
    std::vector<ScrollEntry> scroll_keys;
    std::vector<DebounceEntry> debounces;

    int listen_port = 0;
    std::string auth_file;
    std::map<std::string, int> nudges;

    std::string devnode_dir;
    int reconnect_ms = 1000;
};

// "KEY_F1", "F1", "BTN_SIDE" or a number. Throws ConfigError.
int parse_key_code(const std::string& text);
// "REL_HWHEEL", "HWHEEL" or a number. Throws ConfigError.
int parse_rel_code(const std::string& text);

// Applies one option; `name` without the leading "--". Throws ConfigError.
void apply_option(Config& config, const std::string& name, const std::string& value);
// Reads an env-style file of NAME=value lines. Throws ConfigError.
void load_config_file(Config& config, const std::string& path);
Config parse_args(int argc, char** argv);

void print_usage(std::ostream& out, const char* prog);

// Registers targets, noswitch keys and key features. Throws ConfigError.
void configure_router(Router& router, const Config& config);

}  // namespace kmswitch
