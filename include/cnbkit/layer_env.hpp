#pragma once

#include <cnbkit/env.hpp>
#include <cnbkit/name.hpp>
#include <cnbkit/result.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cnbkit {

// Declaration order is application order within one layer
enum class ModificationBehavior {
    Delete,
    Override,
    Default,
    Prepend,
    Append,
};

const char* behavior_name(ModificationBehavior b);

inline constexpr const char* DEFAULT_DELIMITER = ":";

// Where a modification applies, and which env directory holds it:
// All -> env/, Build -> env.build/, Launch -> env.launch/,
// Process(type) -> env.launch/<type>/
struct Scope {
    enum Kind { All, Build, Launch, Process };

    Kind kind = All;
    std::string process;  // process type, only for Kind::Process

    static Scope all();
    static Scope build();
    static Scope launch();
    static Scope for_process(const ProcessType& type);

    std::filesystem::path env_dir() const;
    std::string to_string() const;

    bool operator==(const Scope& o) const;
    bool operator!=(const Scope& o) const;
    bool operator<(const Scope& o) const;
};

// Modifications for one scope, keyed by variable name
class EnvDelta {
public:
    struct Entry {
        std::map<ModificationBehavior, std::string> ops;
        std::optional<std::string> delimiter;
    };

    void insert(ModificationBehavior behavior, const std::string& name, const std::string& value);
    void set_delimiter(const std::string& name, const std::string& delim);

    // Apply every variable's operations to env
    void apply(Env& env) const;

    bool empty() const { return vars_.empty(); }
    const std::map<std::string, Entry>& vars() const { return vars_; }

    static Result<EnvDelta> read_from_dir(const std::filesystem::path& dir);

    // Replaces the regular files in dir (subdirectories are left alone).
    // An empty delta removes dir when nothing else lives in it.
    Status write_to_dir(const std::filesystem::path& dir) const;

    bool operator==(const EnvDelta& o) const;

private:
    std::map<std::string, Entry> vars_;
};

// Environment contributed by one layer
class LayerEnv {
public:
    LayerEnv& insert(Scope scope, ModificationBehavior behavior,
                     const std::string& name, const std::string& value);
    LayerEnv& delimiter(Scope scope, const std::string& name, const std::string& delim);

    // Modifications the lifecycle derives from the layer's own bin/, lib/,
    // include/ and pkgconfig/ directories
    void add_layer_paths(const std::filesystem::path& layer_dir);

    // Apply this layer's modifications for scope on top of env:
    // built-in layer paths first, then env/, then the scope directories
    void apply_to(const Scope& scope, Env& env) const;
    Env apply(const Scope& scope, const Env& base) const;

    // Scopes with explicit modifications
    std::vector<Scope> scopes() const;
    const EnvDelta* delta(const Scope& scope) const;

    bool empty() const;

    // Reads env dirs and built-in layer paths from a layer directory
    static Result<LayerEnv> read_from_layer_dir(const std::filesystem::path& layer_dir);

    // Writes one scope's modifications to an env directory
    Status write_to_env_dir(const Scope& scope, const std::filesystem::path& dir) const;

    // Rewrites env/, env.build/, env.launch/ (and process subdirectories)
    Status write_to_layer_dir(const std::filesystem::path& layer_dir) const;

private:
    std::map<Scope, EnvDelta> deltas_;
    std::map<Scope, EnvDelta> layer_paths_;
};

} // namespace cnbkit
