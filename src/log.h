#pragma once

#include <sstream>
#include <string>

enum class Level {
    error,
    warning,
    info,
    debug,
};

void set_verbose(bool verbose);
bool is_verbose();
void write_log_line(Level level, const std::string& message);

template <typename... Args>
void log(Level level, Args&&... args){
    if(level == Level::debug && !is_verbose()) return;
    std::ostringstream line;
    (line << ... << args);
    write_log_line(level, line.str());
}
