#include <cnbkit/context.hpp>
#include <cnbkit/log.hpp>

namespace fs = std::filesystem;

namespace cnbkit {

// ---------------------------------------------------------------------------
// Arguments
// ---------------------------------------------------------------------------

Result<DetectArgs> DetectArgs::parse(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CnbError{CnbError::Contract,
            "detect expects 2 arguments, got " + std::to_string(args.size()),
            "usage: detect <platform_dir> <build_plan_path>"};
    }
    return Result<DetectArgs>::ok(DetectArgs{args[0], args[1]});
}

Result<BuildArgs> BuildArgs::parse(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return CnbError{CnbError::Contract,
            "build expects 3 arguments, got " + std::to_string(args.size()),
            "usage: build <layers_dir> <platform_dir> <buildpack_plan_path>"};
    }
    return Result<BuildArgs>::ok(BuildArgs{args[0], args[1], args[2]});
}

// ---------------------------------------------------------------------------
// Contract checks
// ---------------------------------------------------------------------------

Status check_buildpack_api(const BuildpackApi& api) {
    if (api != SUPPORTED_BUILDPACK_API) {
        return CnbError{CnbError::ApiMismatch,
            "buildpack declares Buildpack API " + api.to_string()
                + " but this framework implements " + SUPPORTED_BUILDPACK_API.to_string(),
            "set api = \"" + SUPPORTED_BUILDPACK_API.to_string() + "\" in buildpack.toml"};
    }
    return ok_status();
}

Result<fs::path> read_buildpack_dir(const Env& env) {
    auto dir = env.get("CNB_BUILDPACK_DIR");
    if (!dir || dir->empty()) {
        return CnbError{CnbError::Contract,
            "CNB_BUILDPACK_DIR is not set",
            "the lifecycle sets it for every buildpack phase"};
    }
    return Result<fs::path>::ok(fs::path(*dir));
}

Result<Target> read_target(const Env& env) {
    auto target = Target::from_env(env);
    if (target.is_err()) {
        CnbError e = std::move(target).error();
        e.code = CnbError::Contract;
        return e;
    }
    return target;
}

// Reading shared by both phases, in contract order
static Status read_common(const Env& env, const fs::path& platform_dir,
                          fs::path& buildpack_dir, BuildpackDescriptor& descriptor,
                          Target& target, Platform& platform) {
    auto dir = read_buildpack_dir(env);
    if (dir.is_err()) return std::move(dir).error();
    buildpack_dir = std::move(dir).value();

    auto api = read_buildpack_api(buildpack_dir);
    if (api.is_err()) return std::move(api).error();
    CNBKIT_TRY(check_buildpack_api(api.value()));

    auto d = BuildpackDescriptor::load(buildpack_dir / "buildpack.toml");
    if (d.is_err()) return std::move(d).error();
    descriptor = std::move(d).value();

    auto t = read_target(env);
    if (t.is_err()) return std::move(t).error();
    target = std::move(t).value();

    auto p = Platform::from_path(platform_dir);
    if (p.is_err()) {
        CnbError e = std::move(p).error();
        e.code = CnbError::Contract;
        return e;
    }
    platform = std::move(p).value();

    log::debug("buildpack %s@%s (api %s), target %s/%s",
               descriptor.buildpack.id.str().c_str(),
               descriptor.buildpack.version.to_string().c_str(),
               descriptor.api.to_string().c_str(),
               target.os.c_str(), target.arch.c_str());
    return ok_status();
}

Result<DetectContext> read_detect_context(const DetectArgs& args, const Env& env,
                                          const fs::path& app_dir) {
    DetectContext ctx;
    ctx.app_dir = app_dir;
    ctx.env = env;
    CNBKIT_TRY(read_common(env, args.platform_dir, ctx.buildpack_dir, ctx.buildpack,
                           ctx.target, ctx.platform));
    return Result<DetectContext>::ok(std::move(ctx));
}

Result<BuildInputs> read_build_context_inputs(const BuildArgs& args, const Env& env,
                                              const fs::path& app_dir) {
    BuildInputs in;
    in.layers_dir = args.layers_dir;
    in.app_dir = app_dir;
    in.env = env;
    CNBKIT_TRY(read_common(env, args.platform_dir, in.buildpack_dir, in.buildpack,
                           in.target, in.platform));

    auto plan = BuildpackPlan::load(args.buildpack_plan_path);
    if (plan.is_err()) {
        CnbError e = std::move(plan).error();
        e.code = CnbError::Contract;
        e.message = "cannot read buildpack plan: " + e.message;
        return e;
    }
    in.buildpack_plan = std::move(plan).value();

    auto store = Store::load(args.layers_dir / "store.toml");
    if (store.is_err()) {
        CnbError e = std::move(store).error();
        e.code = CnbError::Contract;
        e.message = "cannot read store.toml: " + e.message;
        return e;
    }
    in.store = std::move(store).value();

    return Result<BuildInputs>::ok(std::move(in));
}

// ---------------------------------------------------------------------------
// BuildContext
// ---------------------------------------------------------------------------

BuildContext::BuildContext(BuildInputs inputs)
    : inputs_(std::move(inputs)),
      env_(std::make_unique<EnvAccumulator>()),
      layers_(std::make_unique<LayerStore>(inputs_.layers_dir, *env_)) {}

Env BuildContext::build_env() const {
    return env_->apply(Scope::build(), inputs_.env);
}

} // namespace cnbkit
