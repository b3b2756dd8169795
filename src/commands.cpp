#include "commands.h"
#include "block_list.h"
#include "hosts_section.h"
#include "log.h"

#include <set>
#include <sstream>
#include <string>
#include <vector>

using std::string;

static string join(const std::vector<string>& items){
    std::ostringstream out;
    for(size_t i = 0; i < items.size(); ++i){
        if(i) out << ", ";
        out << items[i];
    }
    return out.str();
}

static int report(const Error& err){
    log(Level::error, err.message);
    return 1;
}

static bool require_privilege(const HostsEnvironment& env){
    if(env.has_privilege()){
        return true;
    }
    log(Level::error, "this command requires administrative privileges; "
        "run with sudo on macOS/Linux or as Administrator on Windows");
    return false;
}

// re-render the hosts block from the stored list
static int reapply(const BlockList& list, HostsSection& hosts){
    Error err;
    std::vector<string> domains;
    if(!list.load(domains, err) || !hosts.apply(domains, err)){
        return report(err);
    }
    if(domains.empty()){
        log(Level::info, "Block list is empty, focus mode is OFF");
    }else{
        log(Level::info, "Hosts file updated, blocking: ", join(domains));
    }
    return 0;
}

// Focus state decides whether a list edit must also touch the hosts file,
// so privilege is checked before the list is changed.
static bool focus_state_for_edit(HostsSection& hosts, const HostsEnvironment& env, bool& out_on){
    Error err;
    if(!hosts.is_focus_mode_on(out_on, err)){
        report(err);
        return false;
    }
    if(out_on && !require_privilege(env)){
        return false;
    }
    return true;
}

static int cmd_add(const Settings& settings, HostsEnvironment& env){
    if(settings.arguments.empty()){
        log(Level::error, "add requires at least one domain");
        return 1;
    }
    BlockList list(settings.config_path);
    HostsSection hosts(env);
    bool on = false;
    if(!focus_state_for_edit(hosts, env, on)){
        return 1;
    }

    AddResult result;
    Error err;
    if(!list.add(settings.arguments, result, err)){
        return report(err);
    }
    for(const auto& bad : result.rejected){
        log(Level::warning, "skipping invalid domain: '", bad, "'");
    }
    if(result.already_present){
        if(result.rejected.size() == settings.arguments.size()){
            log(Level::error, "no valid domains given");
            return 1;
        }
        log(Level::info, "All provided websites are already in the block list.");
        return 0;
    }
    log(Level::info, "Added websites to block list: ", join(result.added));
    return on ? reapply(list, hosts) : 0;
}

static int cmd_remove(const Settings& settings, HostsEnvironment& env){
    if(settings.arguments.empty()){
        log(Level::error, "remove requires at least one domain");
        return 1;
    }
    BlockList list(settings.config_path);
    HostsSection hosts(env);
    bool on = false;
    if(!focus_state_for_edit(hosts, env, on)){
        return 1;
    }

    RemoveResult result;
    Error err;
    if(!list.remove(settings.arguments, result, err)){
        return report(err);
    }
    if(!result.matched){
        log(Level::info, "No matching websites found in the block list.");
        return 0;
    }
    log(Level::info, "Removed websites from block list: ", join(result.removed));
    return on ? reapply(list, hosts) : 0;
}

static int cmd_on(const Settings& settings, HostsEnvironment& env){
    if(!require_privilege(env)){
        return 1;
    }
    BlockList list(settings.config_path);
    HostsSection hosts(env);
    Error err;
    std::vector<string> domains;
    if(!list.load(domains, err)){
        return report(err);
    }
    if(domains.empty()){
        log(Level::info, "No websites in block list. Add websites using the \"add\" command.");
        return 0;
    }
    if(!hosts.apply(domains, err)){
        return report(err);
    }
    log(Level::info, "Focus mode is ON");
    log(Level::info, "Blocked websites: ", join(domains));
    log(Level::info, "If the websites are still reachable, restart the browser.");
    return 0;
}

static int cmd_off(const Settings&, HostsEnvironment& env){
    if(!require_privilege(env)){
        return 1;
    }
    HostsSection hosts(env);
    Error err;
    if(!hosts.clear(err)){
        return report(err);
    }
    log(Level::info, "Focus mode is OFF, all websites unblocked");
    return 0;
}

static int cmd_list(const Settings& settings, HostsEnvironment& env){
    BlockList list(settings.config_path);
    HostsSection hosts(env);
    Error err;
    std::vector<string> domains;
    bool on = false;
    if(!list.load(domains, err) || !hosts.is_focus_mode_on(on, err)){
        return report(err);
    }
    if(domains.empty()){
        log(Level::info, "No websites in the block list.");
        return 0;
    }
    log(Level::info, "Block list (focus mode: ", on ? "ON" : "OFF", "):");
    for(const auto& d : domains){
        log(Level::info, "- ", d);
    }
    return 0;
}

static int cmd_status(const Settings& settings, HostsEnvironment& env){
    HostsSection hosts(env);
    Error err;
    std::set<string> blocked;
    if(!hosts.currently_blocked_domains(blocked, err)){
        return report(err);
    }
    log(Level::info, "focus mode: ", blocked.empty() ? "OFF" : "ON");
    log(Level::info, "hosts file: ", settings.hosts_path);
    log(Level::info, "block list: ", settings.config_path);
    for(const auto& d : blocked){
        log(Level::info, "- ", d);
    }
    return 0;
}

static int cmd_clear(const Settings& settings, HostsEnvironment& env){
    if(!require_privilege(env)){
        return 1;
    }
    BlockList list(settings.config_path);
    HostsSection hosts(env);
    Error err;
    if(!list.clear(err) || !hosts.clear(err)){
        return report(err);
    }
    log(Level::info, "Cleared all blocked websites and the block list.");
    return 0;
}

int run_command(const Settings& settings, HostsEnvironment& env){
    const string& command = settings.command;
    log(Level::debug, "command '", command, "', list ", settings.config_path,
        ", hosts ", settings.hosts_path);
    if(command == "add") return cmd_add(settings, env);
    if(command == "remove") return cmd_remove(settings, env);
    if(command == "on") return cmd_on(settings, env);
    if(command == "off") return cmd_off(settings, env);
    if(command == "list") return cmd_list(settings, env);
    if(command == "status") return cmd_status(settings, env);
    if(command == "clear") return cmd_clear(settings, env);

    log(Level::error, "unknown command: ", command);
    return 1;
}
