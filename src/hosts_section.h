#pragma once

#include "common.h"
#include "platform.h"

#include <set>
#include <string>
#include <vector>

extern const char* const kBlockStart;
extern const char* const kBlockEnd;
extern const char* const kLoopbackV4;
extern const char* const kLoopbackV6;

// Text of every managed block in the document, markers included.
std::string extract_managed_blocks(const std::string& content);
// Removes each start marker through its nearest end marker (plus one
// trailing newline). An unterminated start marker is left in place.
std::string strip_managed_blocks(const std::string& content);
std::string render_managed_block(const std::vector<std::string>& domains);
std::set<std::string> parse_blocked_domains(const std::string& content);
std::string apply_to_content(const std::string& content, const std::vector<std::string>& domains);

// Owns the managed block inside the hosts file. Focus mode is derived
// from the file on every call, never cached.
class HostsSection {
public:
    explicit HostsSection(HostsEnvironment& env) : m_env(env) { }

    bool currently_blocked_domains(std::set<std::string>& out_domains, Error& err);
    bool is_focus_mode_on(bool& out_on, Error& err);
    // An empty list clears the block.
    bool apply(const std::vector<std::string>& domains, Error& err);
    bool clear(Error& err);

private:
    HostsEnvironment& m_env;
};
