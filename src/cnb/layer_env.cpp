#include <cnbkit/layer_env.hpp>
#include <cnbkit/log.hpp>
#include <cnbkit/toml_file.hpp>

namespace fs = std::filesystem;

namespace cnbkit {

const char* behavior_name(ModificationBehavior b) {
    switch (b) {
        case ModificationBehavior::Delete:   return "delete";
        case ModificationBehavior::Override: return "override";
        case ModificationBehavior::Default:  return "default";
        case ModificationBehavior::Prepend:  return "prepend";
        case ModificationBehavior::Append:   return "append";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Scope
// ---------------------------------------------------------------------------

Scope Scope::all() { return Scope{All, ""}; }
Scope Scope::build() { return Scope{Build, ""}; }
Scope Scope::launch() { return Scope{Launch, ""}; }
Scope Scope::for_process(const ProcessType& type) { return Scope{Process, type.str()}; }

fs::path Scope::env_dir() const {
    switch (kind) {
        case All:     return "env";
        case Build:   return "env.build";
        case Launch:  return "env.launch";
        case Process: return fs::path("env.launch") / process;
    }
    return "env";
}

std::string Scope::to_string() const {
    switch (kind) {
        case All:     return "all";
        case Build:   return "build";
        case Launch:  return "launch";
        case Process: return "process:" + process;
    }
    return "all";
}

bool Scope::operator==(const Scope& o) const {
    return kind == o.kind && process == o.process;
}

bool Scope::operator!=(const Scope& o) const {
    return !(*this == o);
}

bool Scope::operator<(const Scope& o) const {
    if (kind != o.kind) return kind < o.kind;
    return process < o.process;
}

// Directories consulted, in order, when applying for `target`
static std::vector<Scope> applicable_scopes(const Scope& target) {
    switch (target.kind) {
        case Scope::All:     return {Scope::all()};
        case Scope::Build:   return {Scope::all(), Scope::build()};
        case Scope::Launch:  return {Scope::all(), Scope::launch()};
        case Scope::Process: return {Scope::all(), Scope::launch(), target};
    }
    return {};
}

// ---------------------------------------------------------------------------
// EnvDelta
// ---------------------------------------------------------------------------

void EnvDelta::insert(ModificationBehavior behavior, const std::string& name,
                      const std::string& value) {
    vars_[name].ops[behavior] = value;
}

void EnvDelta::set_delimiter(const std::string& name, const std::string& delim) {
    vars_[name].delimiter = delim;
}

void EnvDelta::apply(Env& env) const {
    for (const auto& [name, entry] : vars_) {
        std::string delim = entry.delimiter.value_or(DEFAULT_DELIMITER);
        // std::map iterates in ModificationBehavior order
        for (const auto& [behavior, value] : entry.ops) {
            auto current = env.get(name);
            switch (behavior) {
                case ModificationBehavior::Delete:
                    env.remove(name);
                    break;
                case ModificationBehavior::Override:
                    env.insert(name, value);
                    break;
                case ModificationBehavior::Default:
                    if (!current) env.insert(name, value);
                    break;
                case ModificationBehavior::Prepend:
                    if (current && !current->empty()) {
                        env.insert(name, value + delim + *current);
                    } else {
                        env.insert(name, value);
                    }
                    break;
                case ModificationBehavior::Append:
                    if (current && !current->empty()) {
                        env.insert(name, *current + delim + value);
                    } else {
                        env.insert(name, value);
                    }
                    break;
            }
        }
    }
}

static std::optional<ModificationBehavior> parse_suffix(const std::string& suffix) {
    if (suffix == "delete") return ModificationBehavior::Delete;
    if (suffix == "override") return ModificationBehavior::Override;
    if (suffix == "default") return ModificationBehavior::Default;
    if (suffix == "prepend") return ModificationBehavior::Prepend;
    if (suffix == "append") return ModificationBehavior::Append;
    return std::nullopt;
}

Result<EnvDelta> EnvDelta::read_from_dir(const fs::path& dir) {
    EnvDelta delta;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<EnvDelta>::ok(std::move(delta));
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        return CnbError{CnbError::IO,
            "cannot list env directory " + dir.string() + ": " + ec.message()};
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;

        std::string file_name = entry.path().filename().string();
        auto contents = read_file(entry.path());
        if (contents.is_err()) return std::move(contents).error();

        // Only a known suffix splits the name; "my.var" overrides my.var
        size_t dot = file_name.rfind('.');
        std::string name = file_name;
        std::string suffix;
        if (dot != std::string::npos) {
            suffix = file_name.substr(dot + 1);
            if (suffix == "delim" || parse_suffix(suffix)) name = file_name.substr(0, dot);
        }

        if (name == file_name) {
            delta.insert(ModificationBehavior::Override, file_name, contents.value());
        } else if (suffix == "delim") {
            delta.set_delimiter(name, contents.value());
        } else {
            delta.insert(*parse_suffix(suffix), name, contents.value());
        }
    }
    return Result<EnvDelta>::ok(std::move(delta));
}

Status EnvDelta::write_to_dir(const fs::path& dir) const {
    std::error_code ec;

    // Clear previous files, keeping process subdirectories of env.launch
    if (fs::is_directory(dir, ec)) {
        std::vector<fs::path> stale;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_directory(ec)) stale.push_back(entry.path());
        }
        for (const auto& p : stale) {
            fs::remove(p, ec);
            if (ec) {
                return CnbError{CnbError::IO,
                    "cannot remove " + p.string() + ": " + ec.message()};
            }
        }
        if (vars_.empty() && fs::is_empty(dir, ec)) {
            fs::remove(dir, ec);
        }
    }
    if (vars_.empty()) return ok_status();

    fs::create_directories(dir, ec);
    if (ec) {
        return CnbError{CnbError::IO,
            "cannot create env directory " + dir.string() + ": " + ec.message()};
    }

    for (const auto& [name, entry] : vars_) {
        bool has_delimited = false;
        for (const auto& [behavior, value] : entry.ops) {
            std::string file_name = name;
            if (behavior != ModificationBehavior::Override) {
                file_name += std::string(".") + behavior_name(behavior);
            }
            if (behavior == ModificationBehavior::Prepend ||
                behavior == ModificationBehavior::Append) {
                has_delimited = true;
            }
            CNBKIT_TRY(write_file(dir / file_name, value));
        }
        if (has_delimited && entry.delimiter && *entry.delimiter != DEFAULT_DELIMITER) {
            CNBKIT_TRY(write_file(dir / (name + ".delim"), *entry.delimiter));
        }
    }
    return ok_status();
}

bool EnvDelta::operator==(const EnvDelta& o) const {
    if (vars_.size() != o.vars_.size()) return false;
    for (const auto& [name, entry] : vars_) {
        auto it = o.vars_.find(name);
        if (it == o.vars_.end()) return false;
        if (entry.ops != it->second.ops) return false;
        if (entry.delimiter.value_or(DEFAULT_DELIMITER) !=
            it->second.delimiter.value_or(DEFAULT_DELIMITER)) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// LayerEnv
// ---------------------------------------------------------------------------

LayerEnv& LayerEnv::insert(Scope scope, ModificationBehavior behavior,
                           const std::string& name, const std::string& value) {
    deltas_[std::move(scope)].insert(behavior, name, value);
    return *this;
}

LayerEnv& LayerEnv::delimiter(Scope scope, const std::string& name, const std::string& delim) {
    deltas_[std::move(scope)].set_delimiter(name, delim);
    return *this;
}

void LayerEnv::add_layer_paths(const fs::path& layer_dir) {
    layer_paths_.clear();
    std::error_code ec;
    auto prepend_if_dir = [&](const Scope& scope, const char* sub, const char* var) {
        fs::path p = layer_dir / sub;
        if (fs::is_directory(p, ec)) {
            layer_paths_[scope].insert(ModificationBehavior::Prepend, var, p.string());
        }
    };
    prepend_if_dir(Scope::all(), "bin", "PATH");
    prepend_if_dir(Scope::all(), "lib", "LD_LIBRARY_PATH");
    prepend_if_dir(Scope::build(), "lib", "LIBRARY_PATH");
    prepend_if_dir(Scope::build(), "include", "CPATH");
    prepend_if_dir(Scope::build(), "pkgconfig", "PKG_CONFIG_PATH");
}

void LayerEnv::apply_to(const Scope& scope, Env& env) const {
    auto scopes = applicable_scopes(scope);
    for (const auto& s : scopes) {
        auto it = layer_paths_.find(s);
        if (it != layer_paths_.end()) it->second.apply(env);
    }
    for (const auto& s : scopes) {
        auto it = deltas_.find(s);
        if (it != deltas_.end()) it->second.apply(env);
    }
}

Env LayerEnv::apply(const Scope& scope, const Env& base) const {
    Env env = base;
    apply_to(scope, env);
    return env;
}

std::vector<Scope> LayerEnv::scopes() const {
    std::vector<Scope> out;
    for (const auto& [scope, delta] : deltas_) {
        if (!delta.empty()) out.push_back(scope);
    }
    return out;
}

const EnvDelta* LayerEnv::delta(const Scope& scope) const {
    auto it = deltas_.find(scope);
    return it == deltas_.end() ? nullptr : &it->second;
}

bool LayerEnv::empty() const {
    for (const auto& [scope, delta] : deltas_) {
        if (!delta.empty()) return false;
    }
    for (const auto& [scope, delta] : layer_paths_) {
        if (!delta.empty()) return false;
    }
    return true;
}

Result<LayerEnv> LayerEnv::read_from_layer_dir(const fs::path& layer_dir) {
    LayerEnv env;
    for (const auto& scope : {Scope::all(), Scope::build(), Scope::launch()}) {
        auto delta = EnvDelta::read_from_dir(layer_dir / scope.env_dir());
        if (delta.is_err()) return std::move(delta).error();
        if (!delta.value().empty()) env.deltas_[scope] = std::move(delta).value();
    }

    std::error_code ec;
    fs::path launch_dir = layer_dir / Scope::launch().env_dir();
    if (fs::is_directory(launch_dir, ec)) {
        for (const auto& entry : fs::directory_iterator(launch_dir, ec)) {
            if (!entry.is_directory(ec)) continue;
            auto type = ProcessType::parse(entry.path().filename().string());
            if (type.is_err()) {
                log::warn("ignoring env directory for invalid process type: %s",
                          entry.path().string().c_str());
                continue;
            }
            Scope scope = Scope::for_process(type.value());
            auto delta = EnvDelta::read_from_dir(entry.path());
            if (delta.is_err()) return std::move(delta).error();
            if (!delta.value().empty()) env.deltas_[scope] = std::move(delta).value();
        }
    }

    env.add_layer_paths(layer_dir);
    return Result<LayerEnv>::ok(std::move(env));
}

Status LayerEnv::write_to_env_dir(const Scope& scope, const fs::path& dir) const {
    auto it = deltas_.find(scope);
    if (it == deltas_.end()) return EnvDelta{}.write_to_dir(dir);
    return it->second.write_to_dir(dir);
}

Status LayerEnv::write_to_layer_dir(const fs::path& layer_dir) const {
    std::error_code ec;
    for (const auto& scope : {Scope::all(), Scope::build(), Scope::launch()}) {
        fs::remove_all(layer_dir / scope.env_dir(), ec);
        if (ec) {
            return CnbError{CnbError::IO,
                "cannot remove " + (layer_dir / scope.env_dir()).string() + ": " + ec.message()};
        }
    }
    for (const auto& [scope, delta] : deltas_) {
        CNBKIT_TRY(delta.write_to_dir(layer_dir / scope.env_dir()));
    }
    return ok_status();
}

} // namespace cnbkit
