#include <cnbkit/config.hpp>

namespace cnbkit {

Result<RuntimeConfig> RuntimeConfig::from_env(const Env& env) {
    RuntimeConfig cfg;

    if (auto v = env.get("CNBKIT_LOG_LEVEL")) {
        auto lvl = log::parse_level(*v);
        if (!lvl) {
            return CnbError{CnbError::InvalidArg,
                "invalid CNBKIT_LOG_LEVEL '" + *v + "'",
                "expected one of: trace, debug, info, warn, error"};
        }
        cfg.log_level = *lvl;
        cfg.log_level_set = true;
    }

    // NO_COLOR (https://no-color.org) disables color regardless of value;
    // an explicit CNBKIT_LOG_COLOR takes precedence over it.
    if (env.contains("NO_COLOR")) {
        cfg.color = ColorMode::Never;
        cfg.color_set = true;
    }

    if (auto v = env.get("CNBKIT_LOG_COLOR")) {
        if (*v == "always") {
            cfg.color = ColorMode::Always;
        } else if (*v == "never") {
            cfg.color = ColorMode::Never;
        } else if (*v == "auto") {
            cfg.color = ColorMode::Auto;
        } else {
            return CnbError{CnbError::InvalidArg,
                "invalid CNBKIT_LOG_COLOR '" + *v + "'",
                "expected one of: always, never, auto"};
        }
        cfg.color_set = true;
    }

    return Result<RuntimeConfig>::ok(std::move(cfg));
}

void RuntimeConfig::merge(const RuntimeConfig& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
}

RuntimeConfig RuntimeConfig::effective(const std::optional<RuntimeConfig>& process,
                                       const std::optional<RuntimeConfig>& platform) {
    RuntimeConfig result;
    if (process.has_value()) result.merge(process.value());
    if (platform.has_value()) result.merge(platform.value());
    return result;
}

void RuntimeConfig::apply() const {
    log::set_level(log_level);
    switch (color) {
        case ColorMode::Always: log::set_color_enabled(true); break;
        case ColorMode::Never:  log::set_color_enabled(false); break;
        case ColorMode::Auto:   break;
    }
}

} // namespace cnbkit
