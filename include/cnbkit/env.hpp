#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cnbkit {

// An ordered set of environment variables. Ordering by name keeps
// rendered environments and test output deterministic.
class Env {
public:
    using Map = std::map<std::string, std::string>;

    Env() = default;

    // Snapshot of the current process environment
    static Env from_current();

    // Parse "KEY=VALUE" entries (entries without '=' are ignored)
    static Env from_entries(const std::vector<std::string>& entries);

    Env& insert(const std::string& key, const std::string& value);
    bool remove(const std::string& key);

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;
    size_t size() const;
    bool empty() const;

    // "KEY=VALUE" entries, e.g. for execve
    std::vector<std::string> to_entries() const;

    Map::const_iterator begin() const { return vars_.begin(); }
    Map::const_iterator end() const { return vars_.end(); }

    bool operator==(const Env& o) const { return vars_ == o.vars_; }
    bool operator!=(const Env& o) const { return vars_ != o.vars_; }

private:
    Map vars_;
};

} // namespace cnbkit
