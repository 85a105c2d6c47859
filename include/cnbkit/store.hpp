#pragma once

#include <cnbkit/result.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <optional>

namespace cnbkit {

// <layers>/store.toml: metadata a buildpack carries from one build to the
// next without a layer
struct Store {
    toml::table metadata;

    toml::table to_toml() const;

    // nullopt when store.toml does not exist
    static Result<std::optional<Store>> load(const std::filesystem::path& path);
    Status save(const std::filesystem::path& path) const;
};

} // namespace cnbkit
