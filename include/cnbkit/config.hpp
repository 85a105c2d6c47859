#pragma once

#include <cnbkit/env.hpp>
#include <cnbkit/log.hpp>
#include <cnbkit/result.hpp>
#include <optional>

namespace cnbkit {

enum class ColorMode { Auto, Always, Never };

// Layered runtime configuration: defaults > process env > platform env.
// Later layers override earlier ones (the platform env wins, since that is
// where users put BP_/CNBKIT_ settings for a particular build).
struct RuntimeConfig {
    log::Level log_level = log::Info;
    ColorMode color = ColorMode::Auto;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool color_set = false;

    // Read CNBKIT_LOG_LEVEL, CNBKIT_LOG_COLOR and NO_COLOR from an env
    static Result<RuntimeConfig> from_env(const Env& env);

    // Merge another config on top (other's explicitly-set values win)
    void merge(const RuntimeConfig& other);

    static RuntimeConfig effective(const std::optional<RuntimeConfig>& process,
                                   const std::optional<RuntimeConfig>& platform);

    // Push the settings into cnbkit::log
    void apply() const;
};

} // namespace cnbkit
