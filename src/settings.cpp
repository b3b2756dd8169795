#include "settings.h"
#include "block_list.h"
#include "platform.h"

#include <cstdio>
#include <cstdlib>
#include <string>

#if !defined(FOCUSBLOCK_VERSION)
#define FOCUSBLOCK_VERSION "dev"
#endif

static std::string env_or(const char* name, const std::string& fallback){
    const char* value = std::getenv(name);
    if(!value || *value == '\0'){
        return fallback;
    }
    return value;
}

bool interpret_commandline(Settings& settings, int argc, const char* argv[]){
    settings.config_path = env_or("FOCUSBLOCK_CONFIG", default_block_list_path());
    settings.hosts_path = env_or("FOCUSBLOCK_HOSTS", default_hosts_path());

    for(int i = 1; i < argc; i++){
        const std::string argument = argv[i];
        if(!settings.command.empty()){
            settings.arguments.push_back(argument);
        }else if(argument == "--config"){
            if(++i >= argc)
                return false;
            settings.config_path = argv[i];
        }else if(argument == "--hosts"){
            if(++i >= argc)
                return false;
            settings.hosts_path = argv[i];
        }else if(argument == "-v" || argument == "--verbose"){
            settings.verbose = true;
        }else if(argument == "-h" || argument == "--help" || argument == "help"){
            settings.show_help = true;
            return true;
        }else if(argument == "--version"){
            settings.show_version = true;
            return true;
        }else if(!argument.empty() && argument[0] == '-'){
            return false;
        }else{
            settings.command = argument;
        }
    }
    return !settings.command.empty();
}

void print_help_message(const char* argv0){
    std::string program = argv0 ? argv0 : "focusblock";
    if(auto i = program.find_last_of("/\\"); i != std::string::npos)
        program = program.substr(i + 1);

    std::printf(
        "focusblock %s\n"
        "Block distracting websites through the hosts file.\n"
        "\n"
        "Usage: %s [-options] <command> [domains...]\n"
        "\n"
        "Commands:\n"
        "  add <domains...>      add domains to the block list.\n"
        "  remove <domains...>   remove domains from the block list.\n"
        "  on                    turn focus mode on (needs sudo/Administrator).\n"
        "  off                   turn focus mode off (needs sudo/Administrator).\n"
        "  list                  print the block list and focus mode state.\n"
        "  status                print the domains currently blocked in the hosts file.\n"
        "  clear                 empty the block list and turn focus mode off.\n"
        "\n"
        "Options:\n"
        "  --config <file>       block list file (env FOCUSBLOCK_CONFIG).\n"
        "  --hosts <file>        hosts file (env FOCUSBLOCK_HOSTS).\n"
        "  -v, --verbose         print debug output.\n"
        "  --version             print the version.\n"
        "  -h, --help            print this help.\n"
        "\n", FOCUSBLOCK_VERSION, program.c_str());
}

void print_version(){
    std::printf("focusblock %s\n", FOCUSBLOCK_VERSION);
}
