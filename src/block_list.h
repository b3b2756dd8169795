#pragma once

#include "common.h"

#include <string>
#include <vector>

struct AddResult {
    std::vector<std::string> added;
    std::vector<std::string> rejected;
    bool already_present = false;
};

struct RemoveResult {
    std::vector<std::string> removed;
    bool matched = false;
};

// Persistent, ordered list of domains to block while focus mode is on.
// Stored as {"websites": [...]} at the given path.
class BlockList {
public:
    explicit BlockList(std::string path);

    const std::string& path() const { return m_path; }

    // A missing file reads as an empty list.
    bool load(std::vector<std::string>& out_domains, Error& err) const;
    bool save(const std::vector<std::string>& domains, Error& err) const;

    // Nothing is written when no input turns out to be new.
    bool add(const std::vector<std::string>& domains, AddResult& result, Error& err) const;
    // Nothing is written when no input matches an entry.
    bool remove(const std::vector<std::string>& domains, RemoveResult& result, Error& err) const;
    bool clear(Error& err) const;

private:
    std::string m_path;
};

std::string default_block_list_path();
