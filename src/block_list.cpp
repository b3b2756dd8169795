#include "block_list.h"
#include "log.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#if !defined(_WIN32)
#include <pwd.h>
#endif

using std::string;

static const char* kAppDir = "focusblock";
static const char* kListFile = "blocklist.json";
static const char* kListKey = "websites";

static string get_home_dir(){
#if !defined(_WIN32)
    // under sudo keep using the invoking user's list
    const char* sudo_user = std::getenv("SUDO_USER");
    if(sudo_user && *sudo_user != '\0'){
        if(const passwd* pw = getpwnam(sudo_user)){
            if(pw->pw_dir && *pw->pw_dir != '\0'){
                return pw->pw_dir;
            }
        }
    }
    const char* home = std::getenv("HOME");
#else
    const char* home = std::getenv("USERPROFILE");
#endif
    if(!home || *home == '\0'){
        return "";
    }
    return home;
}

static string get_config_dir(){
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if(xdg && *xdg != '\0'){
        return (std::filesystem::path(xdg) / kAppDir).string();
    }
    string home = get_home_dir();
    if(home.empty()){
        return ".";
    }
    return (std::filesystem::path(home) / ".config" / kAppDir).string();
}

std::string default_block_list_path(){
    return (std::filesystem::path(get_config_dir()) / kListFile).string();
}

BlockList::BlockList(std::string path)
    : m_path(std::move(path)) {
}

bool BlockList::load(std::vector<std::string>& out_domains, Error& err) const {
    out_domains.clear();
    std::error_code ec;
    if(!std::filesystem::exists(m_path, ec)){
        if(ec){
            return fail(err, ErrorKind::storage_read,
                "unable to access " + m_path + " (" + ec.message() + ")");
        }
        return true;
    }

    std::ifstream in(m_path);
    if(!in.is_open()){
        return fail(err, ErrorKind::storage_read,
            "unable to read " + m_path + " (" + std::strerror(errno) + ")");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json doc;
    try{
        doc = nlohmann::json::parse(buffer.str());
    }catch(const nlohmann::json::parse_error& e){
        return fail(err, ErrorKind::storage_read,
            "malformed block list " + m_path + ": " + e.what());
    }
    if(!doc.is_object()){
        return fail(err, ErrorKind::storage_read,
            "malformed block list " + m_path + ": expected an object");
    }
    auto websites = doc.find(kListKey);
    if(websites == doc.end()){
        return true;
    }
    if(!websites->is_array()){
        return fail(err, ErrorKind::storage_read,
            "malformed block list " + m_path + ": \"websites\" is not an array");
    }

    std::set<string> seen;
    for(const auto& entry : *websites){
        if(!entry.is_string()){
            out_domains.clear();
            return fail(err, ErrorKind::storage_read,
                "malformed block list " + m_path + ": non-string entry " + entry.dump());
        }
        // hand edits may carry a www. prefix; anything else must be a bare hostname
        string domain = normalize_domain(entry.get<string>());
        if(!is_valid_domain(domain)){
            out_domains.clear();
            return fail(err, ErrorKind::storage_read,
                "malformed block list " + m_path + ": invalid domain " + entry.dump());
        }
        if(seen.insert(domain).second){
            out_domains.push_back(domain);
        }
    }
    return true;
}

bool BlockList::save(const std::vector<std::string>& domains, Error& err) const {
    const std::filesystem::path target(m_path);
    std::error_code ec;
    if(target.has_parent_path()){
        std::filesystem::create_directories(target.parent_path(), ec);
        if(ec){
            return fail(err, ErrorKind::storage_write,
                "unable to create " + target.parent_path().string() + " (" + ec.message() + ")");
        }
    }

    nlohmann::json doc;
    doc[kListKey] = domains;

    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if(!out.is_open()){
            return fail(err, ErrorKind::storage_write,
                "unable to write " + temp.string() + " (" + std::strerror(errno) + ")");
        }
        out << doc.dump(2) << "\n";
        out.close();
        if(out.fail()){
            std::filesystem::remove(temp, ec);
            return fail(err, ErrorKind::storage_write, "error while writing " + temp.string());
        }
    }
    std::filesystem::rename(temp, target, ec);
    if(ec){
        const string reason = ec.message();
        std::filesystem::remove(temp, ec);
        return fail(err, ErrorKind::storage_write,
            "unable to replace " + m_path + " (" + reason + ")");
    }
    log(Level::debug, "saved ", domains.size(), " domains to ", m_path);
    return true;
}

bool BlockList::add(const std::vector<std::string>& domains, AddResult& result, Error& err) const {
    result = AddResult{};
    std::vector<string> current;
    if(!load(current, err)){
        return false;
    }

    std::set<string> known(current.begin(), current.end());
    for(const auto& raw : domains){
        string cleaned = normalize_domain(raw);
        if(!is_valid_domain(cleaned)){
            result.rejected.push_back(raw);
            continue;
        }
        if(known.insert(cleaned).second){
            result.added.push_back(cleaned);
        }
    }

    if(result.added.empty()){
        result.already_present = true;
        return true;
    }
    current.insert(current.end(), result.added.begin(), result.added.end());
    return save(current, err);
}

bool BlockList::remove(const std::vector<std::string>& domains, RemoveResult& result, Error& err) const {
    result = RemoveResult{};
    std::vector<string> current;
    if(!load(current, err)){
        return false;
    }

    std::set<string> targets;
    for(const auto& raw : domains){
        targets.insert(normalize_domain(raw));
    }

    std::vector<string> filtered;
    for(const auto& d : current){
        if(targets.count(d)){
            result.removed.push_back(d);
        }else{
            filtered.push_back(d);
        }
    }

    if(result.removed.empty()){
        return true;
    }
    result.matched = true;
    return save(filtered, err);
}

bool BlockList::clear(Error& err) const {
    return save({}, err);
}
