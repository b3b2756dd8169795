#include "platform.h"
#include "log.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

using std::string;

#if defined(_WIN32)
static const char* kHostsPath = "C:\\Windows\\System32\\drivers\\etc\\hosts";
#else
static const char* kHostsPath = "/etc/hosts";
#endif

std::string default_hosts_path(){
    return kHostsPath;
}

SystemEnvironment::SystemEnvironment(std::string hosts_path)
    : m_hosts_path(std::move(hosts_path)) {
}

bool SystemEnvironment::has_privilege() const {
#if defined(_WIN32)
    return _access(m_hosts_path.c_str(), 2) == 0;
#else
    if(geteuid() == 0) return true;
    return access(m_hosts_path.c_str(), W_OK) == 0;
#endif
}

bool SystemEnvironment::read_hosts(std::string& out_content, Error& err){
    std::ifstream in(m_hosts_path, std::ios::binary);
    if(!in.is_open()){
        return fail(err, ErrorKind::hosts_read,
            "unable to read " + m_hosts_path + " (" + std::strerror(errno) + ")");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if(in.bad()){
        return fail(err, ErrorKind::hosts_read, "error while reading " + m_hosts_path);
    }
    out_content = buffer.str();
    return true;
}

bool SystemEnvironment::write_hosts(const std::string& content, Error& err){
    std::ofstream overwrite(m_hosts_path, std::ios::binary | std::ios::trunc);
    if(!overwrite.is_open()){
        return fail(err, ErrorKind::hosts_write,
            "unable to write " + m_hosts_path + " (" + std::strerror(errno) +
            "); run with sudo or as Administrator");
    }
    overwrite.write(content.data(), static_cast<std::streamsize>(content.size()));
    overwrite.close();
    if(overwrite.fail()){
        return fail(err, ErrorKind::hosts_write, "error while writing " + m_hosts_path);
    }
    return true;
}

static bool run_shell(const string& cmd){
    log(Level::debug, "running: ", cmd);
    return std::system(cmd.c_str()) == 0;
}

bool SystemEnvironment::flush_dns(std::string& out_msg){
#if defined(__APPLE__)
    if(!run_shell("/usr/bin/dscacheutil -flushcache")){
        out_msg = "dscacheutil -flushcache failed";
        return false;
    }
    if(!run_shell("/usr/bin/killall -HUP mDNSResponder")){
        out_msg = "killall -HUP mDNSResponder failed";
        return false;
    }
    return true;
#elif defined(_WIN32)
    if(!run_shell("ipconfig /flushdns >NUL")){
        out_msg = "ipconfig /flushdns failed";
        return false;
    }
    return true;
#else
    if(run_shell("resolvectl flush-caches >/dev/null 2>&1")){
        return true;
    }
    if(run_shell("systemd-resolve --flush-caches >/dev/null 2>&1")){
        return true;
    }
    out_msg = "neither resolvectl nor systemd-resolve could flush the cache";
    return false;
#endif
}
