#pragma once

#include <cnbkit/name.hpp>
#include <cnbkit/result.hpp>
#include <cnbkit/version.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cnbkit {

struct License {
    std::optional<std::string> type;
    std::optional<std::string> uri;
};

// [buildpack] section
struct BuildpackInfo {
    BuildpackId id;
    std::string name;
    Version version;
    std::optional<std::string> homepage;
    bool clear_env = false;
    std::optional<std::string> description;
    std::vector<std::string> keywords;
    std::vector<License> licenses;
};

struct Distro {
    std::string name;
    std::string version;
};

// [[targets]] entry
struct TargetSpec {
    std::optional<std::string> os;
    std::optional<std::string> arch;
    std::optional<std::string> variant;
    std::vector<Distro> distros;
};

// [[stacks]] entry (deprecated in favor of targets, still accepted)
struct Stack {
    std::string id;                  // "*" matches any stack
    std::vector<std::string> mixins;
};

struct OrderGroup {
    BuildpackId id;
    Version version;
    bool optional = false;
};

// [[order]] entry of a composite buildpack
struct Order {
    std::vector<OrderGroup> group;
};

// buildpack.toml
struct BuildpackDescriptor {
    BuildpackApi api;
    BuildpackInfo buildpack;
    std::vector<TargetSpec> targets;
    std::vector<Stack> stacks;
    std::vector<Order> order;
    toml::table metadata;

    static Result<BuildpackDescriptor> parse(const std::string& toml_str);
    static Result<BuildpackDescriptor> load(const std::filesystem::path& path);

    // Composite buildpacks declare an order instead of targets/stacks
    bool is_composite() const;
};

// Reads only the `api` key of <buildpack_dir>/buildpack.toml, so the API
// version can be checked even when the rest of the descriptor does not
// match the supported schema.
Result<BuildpackApi> read_buildpack_api(const std::filesystem::path& buildpack_dir);

} // namespace cnbkit
