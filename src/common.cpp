#include "common.h"

static const char* kWwwPrefix = "www.";

bool fail(Error& err, ErrorKind kind, const std::string& message){
    err.kind = kind;
    err.message = message;
    return false;
}

const char* error_kind_name(ErrorKind kind){
    switch(kind){
        case ErrorKind::none: return "none";
        case ErrorKind::storage_read: return "storage read";
        case ErrorKind::storage_write: return "storage write";
        case ErrorKind::hosts_read: return "hosts read";
        case ErrorKind::hosts_write: return "hosts write";
    }
    return "unknown";
}

std::string trim(const std::string& s){
    size_t start = s.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool starts_with(const std::string& s, const std::string& prefix){
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split_fields(const std::string& line){
    std::vector<std::string> fields;
    size_t pos = 0;
    while(true){
        size_t begin = line.find_first_not_of(" \t\r", pos);
        if(begin == std::string::npos) break;
        size_t end = line.find_first_of(" \t\r", begin);
        if(end == std::string::npos){
            fields.push_back(line.substr(begin));
            break;
        }
        fields.push_back(line.substr(begin, end - begin));
        pos = end;
    }
    return fields;
}

std::string strip_www(const std::string& domain){
    if(starts_with(domain, kWwwPrefix)){
        return domain.substr(std::char_traits<char>::length(kWwwPrefix));
    }
    return domain;
}

std::string normalize_domain(const std::string& domain){
    return strip_www(trim(domain));
}

// letters, digits, '.', '-' and '_'; case is kept as typed
bool is_valid_domain(const std::string& domain){
    if(domain.empty() || domain.size() > 253) return false;
    if(domain.front() == '.' || domain.back() == '.') return false;
    if(domain.front() == '-' || domain.back() == '-') return false;
    for(char c : domain){
        bool ok = (c >= 'a' && c <= 'z') ||
                  (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') ||
                  c == '.' || c == '-' || c == '_';
        if(!ok) return false;
    }
    return true;
}
