#pragma once

#include "common.h"

#include <string>

// Everything the core needs from the operating system. The real
// implementation touches the hosts file and shells out; tests substitute
// an in-memory one.
class HostsEnvironment {
public:
    virtual ~HostsEnvironment() = default;

    virtual bool has_privilege() const = 0;
    virtual bool read_hosts(std::string& out_content, Error& err) = 0;
    // replaces the whole document in a single write
    virtual bool write_hosts(const std::string& content, Error& err) = 0;
    // best effort; out_msg describes the failure
    virtual bool flush_dns(std::string& out_msg) = 0;
};

class SystemEnvironment : public HostsEnvironment {
public:
    explicit SystemEnvironment(std::string hosts_path);

    const std::string& hosts_path() const { return m_hosts_path; }

    bool has_privilege() const override;
    bool read_hosts(std::string& out_content, Error& err) override;
    bool write_hosts(const std::string& content, Error& err) override;
    bool flush_dns(std::string& out_msg) override;

private:
    std::string m_hosts_path;
};

std::string default_hosts_path();
