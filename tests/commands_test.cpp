#include "block_list.h"
#include "commands.h"
#include "hosts_section.h"
#include "settings.h"
#include "test_support.h"

#include <set>
#include <string>
#include <vector>

using Domains = std::vector<std::string>;
using DomainSet = std::set<std::string>;

static std::filesystem::path g_dir;

static Settings make_settings(const std::string& list_name, const std::string& command,
                              const Domains& arguments = {}) {
    Settings settings;
    settings.config_path = (g_dir / list_name).string();
    settings.hosts_path = "(memory)";
    settings.command = command;
    settings.arguments = arguments;
    return settings;
}

static Domains stored(const Settings& settings) {
    Domains domains;
    Error err;
    BlockList(settings.config_path).load(domains, err);
    return domains;
}

// ==========================================
// COMMAND LINE
// ==========================================
void test_interpret_commandline() {
    std::cout << "\n=== Commands: Command Line ===\n";
    {
        const char* argv[] = { "focusblock", "--config", "/tmp/l.json", "--hosts", "/tmp/h", "-v",
                               "add", "a.com", "b.com" };
        Settings settings;
        ASSERT(interpret_commandline(settings, 9, argv), "Full command line parses");
        ASSERT(settings.config_path == "/tmp/l.json", "Config path taken from flag");
        ASSERT(settings.hosts_path == "/tmp/h", "Hosts path taken from flag");
        ASSERT(settings.verbose, "Verbose flag set");
        ASSERT(settings.command == "add", "Command recognized");
        ASSERT((settings.arguments == Domains{ "a.com", "b.com" }), "Arguments collected in order");
    }
    {
        const char* argv[] = { "focusblock", "list" };
        Settings settings;
        ASSERT(interpret_commandline(settings, 2, argv), "Bare command parses");
        ASSERT(!settings.config_path.empty(), "Config path has a default");
        ASSERT(!settings.hosts_path.empty(), "Hosts path has a default");
    }
    {
        const char* argv[] = { "focusblock" };
        Settings settings;
        ASSERT(!interpret_commandline(settings, 1, argv), "Missing command is rejected");
    }
    {
        const char* argv[] = { "focusblock", "--bogus", "on" };
        Settings settings;
        ASSERT(!interpret_commandline(settings, 3, argv), "Unknown option is rejected");
    }
    {
        const char* argv[] = { "focusblock", "--config" };
        Settings settings;
        ASSERT(!interpret_commandline(settings, 2, argv), "Option without value is rejected");
    }
    {
        const char* argv[] = { "focusblock", "--help" };
        Settings settings;
        ASSERT(interpret_commandline(settings, 2, argv) && settings.show_help, "Help flag recognized");
    }
}

// ==========================================
// COMMANDS
// ==========================================
void test_on_off() {
    std::cout << "\n=== Commands: On / Off ===\n";
    MemoryEnvironment env;
    env.hosts = "127.0.0.1 localhost\n";
    ASSERT(run_command(make_settings("onoff.json", "add", { "a.com", "b.com" }), env) == 0, "add exits 0");
    ASSERT(env.writes == 0, "add while OFF leaves hosts alone");

    ASSERT(run_command(make_settings("onoff.json", "on"), env) == 0, "on exits 0");
    ASSERT((parse_blocked_domains(env.hosts) == DomainSet{ "a.com", "b.com" }), "on blocks the stored list");

    ASSERT(run_command(make_settings("onoff.json", "status"), env) == 0, "status exits 0");
    ASSERT(run_command(make_settings("onoff.json", "list"), env) == 0, "list exits 0");

    ASSERT(run_command(make_settings("onoff.json", "off"), env) == 0, "off exits 0");
    ASSERT_STR_EQ(env.hosts, "127.0.0.1 localhost\n", "off restores the hosts file");
    ASSERT((stored(make_settings("onoff.json", "list")) == Domains{ "a.com", "b.com" }), "off keeps the list");
}

void test_on_with_empty_list() {
    std::cout << "\n=== Commands: On With Empty List ===\n";
    MemoryEnvironment env;
    env.hosts = "127.0.0.1 localhost\n";
    ASSERT(run_command(make_settings("empty.json", "on"), env) == 0, "on with empty list exits 0");
    ASSERT(env.writes == 0, "on with empty list writes nothing");
}

void test_remove_while_on_reapplies() {
    std::cout << "\n=== Commands: Remove While On ===\n";
    MemoryEnvironment env;
    env.hosts = "127.0.0.1 localhost\n";
    ASSERT(run_command(make_settings("remove_on.json", "add", { "a.com", "b.com" }), env) == 0, "seed list");
    ASSERT(run_command(make_settings("remove_on.json", "on"), env) == 0, "focus on");

    ASSERT(run_command(make_settings("remove_on.json", "remove", { "a.com" }), env) == 0, "remove exits 0");
    ASSERT((parse_blocked_domains(env.hosts) == DomainSet{ "b.com" }), "Only b.com stays blocked");
    ASSERT_STR_EQ(env.hosts, "127.0.0.1 localhost\n" + render_managed_block({ "b.com" }), "Block re-rendered for b.com");

    ASSERT(run_command(make_settings("remove_on.json", "remove", { "b.com" }), env) == 0, "remove last domain");
    ASSERT_STR_EQ(env.hosts, "127.0.0.1 localhost\n", "Emptied list turns focus off");
}

void test_add_while_on_reapplies() {
    std::cout << "\n=== Commands: Add While On ===\n";
    MemoryEnvironment env;
    ASSERT(run_command(make_settings("add_on.json", "add", { "a.com" }), env) == 0, "seed list");
    ASSERT(run_command(make_settings("add_on.json", "on"), env) == 0, "focus on");
    ASSERT(run_command(make_settings("add_on.json", "add", { "c.com" }), env) == 0, "add exits 0");
    ASSERT((parse_blocked_domains(env.hosts) == DomainSet{ "a.com", "c.com" }), "New domain is blocked immediately");

    const int writes = env.writes;
    ASSERT(run_command(make_settings("add_on.json", "add", { "c.com" }), env) == 0, "repeated add exits 0");
    ASSERT(env.writes == writes, "Already present add leaves hosts alone");
}

void test_remove_while_off() {
    std::cout << "\n=== Commands: Remove While Off ===\n";
    MemoryEnvironment env;
    env.privileged = false;
    ASSERT(run_command(make_settings("remove_off.json", "add", { "a.com", "b.com" }), env) == 0,
        "add without privilege while OFF");
    ASSERT(run_command(make_settings("remove_off.json", "remove", { "a.com" }), env) == 0,
        "remove without privilege while OFF");
    ASSERT(env.writes == 0, "hosts untouched");
    ASSERT((stored(make_settings("remove_off.json", "list")) == Domains{ "b.com" }), "list updated");
    ASSERT(run_command(make_settings("remove_off.json", "remove", { "zzz.com" }), env) == 0,
        "remove of unknown domain exits 0");
}

void test_privilege_required() {
    std::cout << "\n=== Commands: Privilege ===\n";
    MemoryEnvironment env;
    env.hosts = "127.0.0.1 localhost\n";
    ASSERT(run_command(make_settings("priv.json", "add", { "a.com" }), env) == 0, "seed list");

    env.privileged = false;
    ASSERT(run_command(make_settings("priv.json", "on"), env) == 1, "on without privilege exits 1");
    ASSERT(run_command(make_settings("priv.json", "off"), env) == 1, "off without privilege exits 1");
    ASSERT(run_command(make_settings("priv.json", "clear"), env) == 1, "clear without privilege exits 1");
    ASSERT(env.writes == 0, "nothing written without privilege");
    ASSERT((stored(make_settings("priv.json", "list")) == Domains{ "a.com" }), "clear without privilege keeps list");

    env.privileged = true;
    ASSERT(run_command(make_settings("priv.json", "on"), env) == 0, "focus on");
    env.privileged = false;
    ASSERT(run_command(make_settings("priv.json", "add", { "b.com" }), env) == 1,
        "add while ON without privilege exits 1");
    ASSERT((stored(make_settings("priv.json", "list")) == Domains{ "a.com" }), "list unchanged when privilege fails");
}

void test_clear() {
    std::cout << "\n=== Commands: Clear ===\n";
    MemoryEnvironment env;
    env.hosts = "127.0.0.1 localhost\n";
    ASSERT(run_command(make_settings("clear.json", "add", { "a.com" }), env) == 0, "seed list");
    ASSERT(run_command(make_settings("clear.json", "on"), env) == 0, "focus on");
    ASSERT(run_command(make_settings("clear.json", "clear"), env) == 0, "clear exits 0");
    ASSERT(stored(make_settings("clear.json", "list")).empty(), "list emptied");
    ASSERT_STR_EQ(env.hosts, "127.0.0.1 localhost\n", "hosts block removed");
}

void test_failures() {
    std::cout << "\n=== Commands: Failures ===\n";
    MemoryEnvironment env;
    ASSERT(run_command(make_settings("fail.json", "frobnicate"), env) == 1, "unknown command exits 1");
    ASSERT(run_command(make_settings("fail.json", "add"), env) == 1, "add without domains exits 1");
    ASSERT(run_command(make_settings("fail.json", "remove"), env) == 1, "remove without domains exits 1");
    ASSERT(run_command(make_settings("fail.json", "add", { "not a domain" }), env) == 1, "add of only invalid domains exits 1");

    write_file(g_dir / "broken.json", "{ broken");
    ASSERT(run_command(make_settings("broken.json", "list"), env) == 1, "malformed list exits 1");
    ASSERT(run_command(make_settings("broken.json", "on"), env) == 1, "on with malformed list exits 1");
    ASSERT(env.writes == 0, "hosts untouched on storage failure");

    env.fail_write = true;
    ASSERT(run_command(make_settings("fail.json", "add", { "a.com" }), env) == 0, "seed list");
    ASSERT(run_command(make_settings("fail.json", "on"), env) == 1, "hosts write failure exits 1");

    env.fail_read = true;
    ASSERT(run_command(make_settings("fail.json", "status"), env) == 1, "hosts read failure exits 1");
}

int main() {
    g_dir = make_temp_dir("commands");

    test_interpret_commandline();
    test_on_off();
    test_on_with_empty_list();
    test_remove_while_on_reapplies();
    test_add_while_on_reapplies();
    test_remove_while_off();
    test_privilege_required();
    test_clear();
    test_failures();

    std::filesystem::remove_all(g_dir);
    std::cout << "\nAll command tests passed.\n";
    return 0;
}
