#pragma once

#include <cnbkit/build_plan.hpp>
#include <cnbkit/descriptor.hpp>
#include <cnbkit/env.hpp>
#include <cnbkit/env_accumulator.hpp>
#include <cnbkit/layer_store.hpp>
#include <cnbkit/platform.hpp>
#include <cnbkit/result.hpp>
#include <cnbkit/store.hpp>
#include <cnbkit/target.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cnbkit {

// ---------------------------------------------------------------------------
// Phase arguments (argv without the program name)
// ---------------------------------------------------------------------------

// detect <platform_dir> <build_plan_path>
struct DetectArgs {
    std::filesystem::path platform_dir;
    std::filesystem::path build_plan_path;

    static Result<DetectArgs> parse(const std::vector<std::string>& args);
};

// build <layers_dir> <platform_dir> <buildpack_plan_path>
struct BuildArgs {
    std::filesystem::path layers_dir;
    std::filesystem::path platform_dir;
    std::filesystem::path buildpack_plan_path;

    static Result<BuildArgs> parse(const std::vector<std::string>& args);
};

// ---------------------------------------------------------------------------
// Contract checks
// ---------------------------------------------------------------------------

// ApiMismatch unless api equals SUPPORTED_BUILDPACK_API
Status check_buildpack_api(const BuildpackApi& api);

// CNB_BUILDPACK_DIR
Result<std::filesystem::path> read_buildpack_dir(const Env& env);

// CNB_TARGET_* variables; a missing one is a Contract error
Result<Target> read_target(const Env& env);

// ---------------------------------------------------------------------------
// Contexts handed to author code
// ---------------------------------------------------------------------------

struct DetectContext {
    std::filesystem::path app_dir;
    std::filesystem::path buildpack_dir;
    BuildpackDescriptor buildpack;
    Target target;
    Platform platform;
    Env env;  // process environment
};

// Everything read from disk before a build starts
struct BuildInputs {
    std::filesystem::path layers_dir;
    std::filesystem::path app_dir;
    std::filesystem::path buildpack_dir;
    BuildpackDescriptor buildpack;
    Target target;
    Platform platform;
    BuildpackPlan buildpack_plan;
    std::optional<Store> store;
    Env env;
};

class BuildContext {
public:
    explicit BuildContext(BuildInputs inputs);

    const std::filesystem::path& layers_dir() const { return inputs_.layers_dir; }
    const std::filesystem::path& app_dir() const { return inputs_.app_dir; }
    const std::filesystem::path& buildpack_dir() const { return inputs_.buildpack_dir; }
    const BuildpackDescriptor& buildpack() const { return inputs_.buildpack; }
    const Target& target() const { return inputs_.target; }
    const Platform& platform() const { return inputs_.platform; }
    const BuildpackPlan& buildpack_plan() const { return inputs_.buildpack_plan; }
    const std::optional<Store>& store() const { return inputs_.store; }
    const Env& env() const { return inputs_.env; }

    LayerStore& layers() { return *layers_; }
    const LayerStore& layers() const { return *layers_; }
    const EnvAccumulator& accumulated_env() const { return *env_; }

    // Process environment with the build scope of every layer finalized so
    // far applied, for running build tools against earlier layers
    Env build_env() const;

private:
    BuildInputs inputs_;
    std::unique_ptr<EnvAccumulator> env_;
    std::unique_ptr<LayerStore> layers_;
};

// Buildpack dir from CNB_BUILDPACK_DIR, API check, descriptor, target and
// platform. Fails with Contract/ApiMismatch before any author code runs and
// never creates directories.
Result<DetectContext> read_detect_context(const DetectArgs& args, const Env& env,
                                          const std::filesystem::path& app_dir);

// As read_detect_context, plus the buildpack plan and store.toml
Result<BuildInputs> read_build_context_inputs(const BuildArgs& args, const Env& env,
                                              const std::filesystem::path& app_dir);

} // namespace cnbkit
