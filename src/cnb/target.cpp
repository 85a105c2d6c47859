#include <cnbkit/target.hpp>

namespace cnbkit {

static Result<std::string> required_var(const Env& env, const std::string& name) {
    auto value = env.get(name);
    if (!value) {
        return CnbError{CnbError::Contract,
            "required environment variable " + name + " is not set",
            "the CNB lifecycle sets CNB_TARGET_* for Buildpack API 0.10 and later"};
    }
    return Result<std::string>::ok(*value);
}

Result<Target> Target::from_env(const Env& env) {
    Target target;

    auto os = required_var(env, "CNB_TARGET_OS");
    if (os.is_err()) return std::move(os).error();
    target.os = std::move(os).value();

    auto arch = required_var(env, "CNB_TARGET_ARCH");
    if (arch.is_err()) return std::move(arch).error();
    target.arch = std::move(arch).value();

    target.arch_variant = env.get("CNB_TARGET_ARCH_VARIANT");

    auto distro_name = required_var(env, "CNB_TARGET_DISTRO_NAME");
    if (distro_name.is_err()) return std::move(distro_name).error();
    target.distro_name = std::move(distro_name).value();

    auto distro_version = required_var(env, "CNB_TARGET_DISTRO_VERSION");
    if (distro_version.is_err()) return std::move(distro_version).error();
    target.distro_version = std::move(distro_version).value();

    return Result<Target>::ok(std::move(target));
}

} // namespace cnbkit
