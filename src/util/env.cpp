#include <cnbkit/env.hpp>

extern char** environ;

namespace cnbkit {

Env Env::from_current() {
    std::vector<std::string> entries;
    for (char** e = environ; e && *e; ++e) {
        entries.emplace_back(*e);
    }
    return from_entries(entries);
}

Env Env::from_entries(const std::vector<std::string>& entries) {
    Env env;
    for (const auto& entry : entries) {
        size_t eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env.vars_[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return env;
}

Env& Env::insert(const std::string& key, const std::string& value) {
    vars_[key] = value;
    return *this;
}

bool Env::remove(const std::string& key) {
    return vars_.erase(key) > 0;
}

std::optional<std::string> Env::get(const std::string& key) const {
    auto it = vars_.find(key);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

bool Env::contains(const std::string& key) const {
    return vars_.count(key) > 0;
}

size_t Env::size() const { return vars_.size(); }
bool Env::empty() const { return vars_.empty(); }

std::vector<std::string> Env::to_entries() const {
    std::vector<std::string> out;
    out.reserve(vars_.size());
    for (const auto& [k, v] : vars_) {
        out.push_back(k + "=" + v);
    }
    return out;
}

} // namespace cnbkit
