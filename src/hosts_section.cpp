#include "hosts_section.h"
#include "log.h"

#include <cstring>
#include <sstream>

using std::string;

const char* const kBlockStart = "# FOCUSBLOCK_START";
const char* const kBlockEnd = "# FOCUSBLOCK_END";
const char* const kLoopbackV4 = "127.0.0.1";
const char* const kLoopbackV6 = "::1";

struct Span {
    size_t begin;
    size_t end;
};

// next start marker with an end marker after it; end is one past the marker
static bool find_block(const string& content, size_t from, Span& out){
    size_t start = content.find(kBlockStart, from);
    if(start == string::npos) return false;
    size_t end = content.find(kBlockEnd, start + std::strlen(kBlockStart));
    if(end == string::npos) return false;
    out.begin = start;
    out.end = end + std::strlen(kBlockEnd);
    return true;
}

std::string extract_managed_blocks(const std::string& content){
    string blocks;
    Span span{};
    for(size_t pos = 0; find_block(content, pos, span); pos = span.end){
        if(!blocks.empty()) blocks += "\n";
        blocks += content.substr(span.begin, span.end - span.begin);
    }
    return blocks;
}

std::string strip_managed_blocks(const std::string& content){
    string updated;
    size_t pos = 0;
    Span span{};
    while(find_block(content, pos, span)){
        updated += content.substr(pos, span.begin - pos);
        pos = span.end;
        if(pos < content.size() && content[pos] == '\n'){
            pos += 1;
        }
    }
    updated += content.substr(pos);
    return updated;
}

std::string render_managed_block(const std::vector<std::string>& domains){
    std::ostringstream out;
    std::set<string> seen;
    out << kBlockStart << "\n";
    for(const auto& raw : domains){
        string d = strip_www(raw);
        // anything but a bare hostname could smuggle markers or mappings in
        if(!is_valid_domain(d)){
            log(Level::warning, "not blocking invalid domain '", raw, "'");
            continue;
        }
        if(!seen.insert(d).second) continue;
        out << kLoopbackV4 << " " << d << "\n";
        out << kLoopbackV4 << " www." << d << "\n";
        out << kLoopbackV6 << " " << d << "\n";
        out << kLoopbackV6 << " www." << d << "\n";
    }
    out << kBlockEnd << "\n";
    return out.str();
}

std::set<std::string> parse_blocked_domains(const std::string& content){
    std::set<string> domains;
    std::istringstream lines(extract_managed_blocks(content));
    string line;
    while(std::getline(lines, line)){
        if(line.find(kLoopbackV4) == string::npos) continue;
        if(line.find(kBlockStart) != string::npos || line.find(kBlockEnd) != string::npos) continue;
        auto fields = split_fields(line);
        if(fields.size() < 2) continue;
        if(starts_with(fields[1], "www.")) continue;
        domains.insert(fields[1]);
    }
    return domains;
}

std::string apply_to_content(const std::string& content, const std::vector<std::string>& domains){
    string updated = strip_managed_blocks(content);
    if(domains.empty()){
        return updated;
    }
    if(!updated.empty() && updated.back() != '\n'){
        updated += "\n";
    }
    return updated + render_managed_block(domains);
}

bool HostsSection::currently_blocked_domains(std::set<std::string>& out_domains, Error& err){
    string content;
    if(!m_env.read_hosts(content, err)){
        return false;
    }
    out_domains = parse_blocked_domains(content);
    return true;
}

bool HostsSection::is_focus_mode_on(bool& out_on, Error& err){
    std::set<string> domains;
    if(!currently_blocked_domains(domains, err)){
        return false;
    }
    out_on = !domains.empty();
    return true;
}

bool HostsSection::apply(const std::vector<std::string>& domains, Error& err){
    string content;
    if(!m_env.read_hosts(content, err)){
        return false;
    }
    // no lock between read and write; a concurrent editor loses
    if(!m_env.write_hosts(apply_to_content(content, domains), err)){
        return false;
    }
    log(Level::debug, "hosts block now covers ", domains.size(), " domains");

    string reason;
    if(!m_env.flush_dns(reason)){
        log(Level::warning, "could not flush DNS cache: ", reason);
    }else{
        log(Level::debug, "DNS cache flushed");
    }
    return true;
}

bool HostsSection::clear(Error& err){
    return apply({}, err);
}
