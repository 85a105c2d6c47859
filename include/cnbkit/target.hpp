#pragma once

#include <cnbkit/env.hpp>
#include <cnbkit/result.hpp>
#include <optional>
#include <string>

namespace cnbkit {

// Target the buildpack is running for, as announced by the lifecycle
// through the CNB_TARGET_* variables.
struct Target {
    std::string os;
    std::string arch;
    std::optional<std::string> arch_variant;
    std::string distro_name;
    std::string distro_version;

    // CNB_TARGET_ARCH_VARIANT is optional, every other variable is required
    static Result<Target> from_env(const Env& env);
};

} // namespace cnbkit
