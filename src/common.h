#pragma once

#include <string>
#include <vector>

enum class ErrorKind {
    none,
    storage_read,
    storage_write,
    hosts_read,
    hosts_write,
};

struct Error {
    ErrorKind kind = ErrorKind::none;
    std::string message;
};

bool fail(Error& err, ErrorKind kind, const std::string& message);
const char* error_kind_name(ErrorKind kind);

std::string trim(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
std::vector<std::string> split_fields(const std::string& line);
std::string strip_www(const std::string& domain);
std::string normalize_domain(const std::string& domain);
bool is_valid_domain(const std::string& domain);
