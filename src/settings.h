#pragma once

#include <string>
#include <vector>

struct Settings {
    bool verbose{ };
    bool show_help{ };
    bool show_version{ };
    std::string config_path;
    std::string hosts_path;
    std::string command;
    std::vector<std::string> arguments;
};

// Defaults come from FOCUSBLOCK_CONFIG / FOCUSBLOCK_HOSTS, then flags.
bool interpret_commandline(Settings& settings, int argc, const char* argv[]);
void print_help_message(const char* argv0);
void print_version();
