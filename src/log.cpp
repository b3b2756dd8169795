#include "log.h"

#include <iostream>

static bool g_verbose = false;

void set_verbose(bool verbose){
    g_verbose = verbose;
}

bool is_verbose(){
    return g_verbose;
}

static const char* level_prefix(Level level){
    switch(level){
        case Level::error: return "[error] ";
        case Level::warning: return "[warn] ";
        case Level::info: return "";
        case Level::debug: return "[debug] ";
    }
    return "";
}

void write_log_line(Level level, const std::string& message){
    std::ostream& out = (level == Level::info) ? std::cout : std::cerr;
    out << level_prefix(level) << message << "\n";
}
