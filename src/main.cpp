#include "commands.h"
#include "log.h"
#include "platform.h"
#include "settings.h"

#include <exception>

int main(int argc, const char* argv[]) try {
    Settings settings;
    if(!interpret_commandline(settings, argc, argv)){
        print_help_message(argc > 0 ? argv[0] : nullptr);
        return 1;
    }
    if(settings.show_help){
        print_help_message(argv[0]);
        return 0;
    }
    if(settings.show_version){
        print_version();
        return 0;
    }
    set_verbose(settings.verbose);

    SystemEnvironment env(settings.hosts_path);
    return run_command(settings, env);
}
catch (const std::exception& ex) {
    log(Level::error, ex.what());
    return 1;
}
