#include <cnbkit/runtime.hpp>
#include <cnbkit/config.hpp>
#include <cnbkit/exit_code.hpp>
#include <cnbkit/log.hpp>
#include <cnbkit/toml_file.hpp>

#include <exception>
#include <vector>

namespace fs = std::filesystem;

namespace cnbkit {

const char* phase_state_name(PhaseState state) {
    switch (state) {
        case PhaseState::Initializing:          return "initializing";
        case PhaseState::ContextBuilt:          return "context-built";
        case PhaseState::AuthorCallbackRunning: return "author-callback-running";
        case PhaseState::Success:               return "success";
        case PhaseState::AuthorError:           return "author-error";
        case PhaseState::FrameworkError:        return "framework-error";
        case PhaseState::Terminated:            return "terminated";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// PhaseOutcome
// ---------------------------------------------------------------------------

PhaseOutcome PhaseOutcome::success() {
    return PhaseOutcome{};
}

PhaseOutcome PhaseOutcome::detect_failed(std::string reason) {
    PhaseOutcome o;
    o.kind = DetectFailed;
    o.detail = std::move(reason);
    return o;
}

PhaseOutcome PhaseOutcome::failure(Kind kind, CnbError error) {
    PhaseOutcome o;
    o.kind = kind;
    o.error = std::move(error);
    return o;
}

PhaseOutcome PhaseOutcome::unexpected(std::string what) {
    PhaseOutcome o;
    o.kind = Unexpected;
    o.detail = std::move(what);
    return o;
}

const char* outcome_name(PhaseOutcome::Kind kind) {
    switch (kind) {
        case PhaseOutcome::Success:           return "success";
        case PhaseOutcome::DetectFailed:      return "detect-failed";
        case PhaseOutcome::ContractViolation: return "contract-violation";
        case PhaseOutcome::AuthorError:       return "author-error";
        case PhaseOutcome::FrameworkError:    return "framework-error";
        case PhaseOutcome::IoError:           return "io-error";
        case PhaseOutcome::Unexpected:        return "unexpected";
    }
    return "unknown";
}

int exit_code_for(const PhaseOutcome& outcome) {
    switch (outcome.kind) {
        case PhaseOutcome::Success:
            return exit_code::SUCCESS;
        case PhaseOutcome::DetectFailed:
            return exit_code::DETECT_FAILED;
        case PhaseOutcome::ContractViolation:
            if (outcome.error && outcome.error->code == CnbError::ApiMismatch) {
                return exit_code::API_MISMATCH;
            }
            return exit_code::CONTRACT_VIOLATION;
        case PhaseOutcome::AuthorError:
            return exit_code::GENERIC_FAILURE;
        case PhaseOutcome::FrameworkError:
            return exit_code::FRAMEWORK_MISUSE;
        case PhaseOutcome::IoError:
            return exit_code::IO_FAILURE;
        case PhaseOutcome::Unexpected:
            return exit_code::UNEXPECTED;
    }
    return exit_code::UNEXPECTED;
}

// ---------------------------------------------------------------------------
// Shared phase plumbing
// ---------------------------------------------------------------------------

namespace {

class PhaseMachine {
public:
    explicit PhaseMachine(const char* phase) : phase_(phase) {
        log::set_phase(phase);
        log::debug("state: %s", phase_state_name(state_));
    }

    void to(PhaseState next) {
        log::debug("state: %s -> %s", phase_state_name(state_), phase_state_name(next));
        state_ = next;
    }

    PhaseOutcome finish(PhaseOutcome outcome) {
        to(PhaseState::Terminated);
        log::debug("%s finished: %s", phase_, outcome_name(outcome.kind));
        return outcome;
    }

private:
    const char* phase_;
    PhaseState state_ = PhaseState::Initializing;
};

} // namespace

// Logging settings from the process env, then the platform env on top.
// Invalid values are reported and skipped; they never fail a phase.
static void apply_runtime_config(const Env& process_env, const Env* platform_env) {
    std::optional<RuntimeConfig> process;
    std::optional<RuntimeConfig> platform;

    auto p = RuntimeConfig::from_env(process_env);
    if (p.is_ok()) {
        process = p.value();
    } else {
        log::warn("ignoring process configuration: %s", p.error().message.c_str());
    }
    if (platform_env) {
        auto q = RuntimeConfig::from_env(*platform_env);
        if (q.is_ok()) {
            platform = q.value();
        } else {
            log::warn("ignoring platform configuration: %s", q.error().message.c_str());
        }
    }
    RuntimeConfig::effective(process, platform).apply();
}

static PhaseOutcome contract_failure(PhaseMachine& machine, CnbError error) {
    log::error("%s", error.format().c_str());
    machine.to(PhaseState::FrameworkError);
    return machine.finish(PhaseOutcome::failure(PhaseOutcome::ContractViolation, std::move(error)));
}

static PhaseOutcome framework_failure(PhaseMachine& machine, CnbError error) {
    log::error("framework misuse: %s", error.format().c_str());
    machine.to(PhaseState::FrameworkError);
    return machine.finish(PhaseOutcome::failure(PhaseOutcome::FrameworkError, std::move(error)));
}

static PhaseOutcome io_failure(PhaseMachine& machine, CnbError error) {
    log::error("%s", error.format().c_str());
    machine.to(PhaseState::FrameworkError);
    return machine.finish(PhaseOutcome::failure(PhaseOutcome::IoError, std::move(error)));
}

// An error returned by author code: framework misuse and layer store I/O
// bypass on_error, everything else is the author's and goes through the hook
static PhaseOutcome author_failure(PhaseMachine& machine, Buildpack& bp, CnbError error) {
    if (error.code == CnbError::FrameworkMisuse) {
        return framework_failure(machine, std::move(error));
    }
    if (error.code == CnbError::LayerIO) {
        return io_failure(machine, std::move(error));
    }
    machine.to(PhaseState::AuthorError);
    log::error("%s", error.format().c_str());
    bp.on_error(error);
    return machine.finish(PhaseOutcome::failure(PhaseOutcome::AuthorError, std::move(error)));
}

static PhaseOutcome unexpected_failure(PhaseMachine& machine, const std::string& what) {
    log::error("unexpected failure: %s", what.c_str());
    machine.to(PhaseState::FrameworkError);
    return machine.finish(PhaseOutcome::unexpected(what));
}

// ---------------------------------------------------------------------------
// Detect
// ---------------------------------------------------------------------------

PhaseOutcome run_detect(Buildpack& bp, const DetectArgs& args, const Env& env,
                        const fs::path& app_dir) {
    PhaseMachine machine("detect");
    apply_runtime_config(env, nullptr);

    auto ctx = read_detect_context(args, env, app_dir);
    if (ctx.is_err()) return contract_failure(machine, std::move(ctx).error());
    apply_runtime_config(env, &ctx.value().platform.env);
    machine.to(PhaseState::ContextBuilt);

    machine.to(PhaseState::AuthorCallbackRunning);
    std::optional<Result<DetectResult>> result;
    try {
        result.emplace(bp.detect(ctx.value()));
    } catch (const std::exception& e) {
        return unexpected_failure(machine, e.what());
    } catch (...) {
        return unexpected_failure(machine, "non-standard exception thrown from detect");
    }
    if (result->is_err()) return author_failure(machine, bp, std::move(*result).error());

    machine.to(PhaseState::Success);
    const DetectResult& detected = result->value();

    if (auto fail = std::get_if<DetectFail>(&detected)) {
        std::string reason = fail->reason.value_or("");
        if (!reason.empty()) log::info("detection failed: %s", reason.c_str());
        return machine.finish(PhaseOutcome::detect_failed(std::move(reason)));
    }

    const auto& pass = std::get<DetectPass>(detected);
    toml::table plan = pass.plan ? pass.plan->to_toml() : toml::table{};
    auto st = write_toml_file(plan, args.build_plan_path);
    if (st.is_err()) {
        CnbError e = std::move(st).error();
        e.message = "writing build plan failed: " + e.message;
        return io_failure(machine, std::move(e));
    }
    return machine.finish(PhaseOutcome::success());
}

// ---------------------------------------------------------------------------
// Build
// ---------------------------------------------------------------------------

static Status write_sboms(const std::vector<Sbom>& sboms, const fs::path& layers_dir,
                          const std::string& base_name) {
    for (const auto& sbom : sboms) {
        auto st = write_file(sbom_path(sbom.format, layers_dir, base_name), sbom.data);
        if (st.is_err()) {
            CnbError e = std::move(st).error();
            e.message = "writing " + base_name + " SBOM failed: " + e.message;
            return e;
        }
    }
    return ok_status();
}

// Everything the lifecycle reads back after build; layers are already on disk
static Status persist_build_result(const BuildContext& ctx, const BuildResult& result) {
    const fs::path& layers_dir = ctx.layers_dir();

    // Idempotent for layers finalize already wrote
    CNBKIT_TRY(ctx.accumulated_env().write_to_disk(layers_dir));

    if (result.launch && !result.launch->empty()) {
        auto st = write_toml_file(result.launch->to_toml(), layers_dir / "launch.toml");
        if (st.is_err()) {
            CnbError e = std::move(st).error();
            e.message = "writing launch.toml failed: " + e.message;
            return e;
        }
    }

    if (!result.unmet.empty()) {
        auto st = write_toml_file(result.build_toml(), layers_dir / "build.toml");
        if (st.is_err()) {
            CnbError e = std::move(st).error();
            e.message = "writing build.toml failed: " + e.message;
            return e;
        }
    }

    CNBKIT_TRY(write_sboms(result.build_sboms, layers_dir, "build"));
    CNBKIT_TRY(write_sboms(result.launch_sboms, layers_dir, "launch"));

    if (result.store) {
        auto st = result.store->save(layers_dir / "store.toml");
        if (st.is_err()) {
            CnbError e = std::move(st).error();
            e.message = "writing store.toml failed: " + e.message;
            return e;
        }
    }
    return ok_status();
}

// Every layer the result references must have been finalized here
static Status check_result_layers(const BuildContext& ctx, const BuildResult& result) {
    const auto& finalized = ctx.layers().finalized();
    for (const auto& layer : result.layers) {
        auto it = finalized.find(layer.name);
        if (it == finalized.end()) {
            return CnbError{CnbError::FrameworkMisuse,
                "build result references layer '" + layer.name.str()
                    + "' that was not finalized in this build"};
        }
        if (it->second.disposition != layer.disposition) {
            return CnbError{CnbError::FrameworkMisuse,
                "build result references a stale handle for layer '" + layer.name.str() + "'"};
        }
    }
    for (const auto& [name, layer] : finalized) {
        log::debug("layer '%s': %s", name.str().c_str(), disposition_name(layer.disposition));
    }
    return ok_status();
}

PhaseOutcome run_build(Buildpack& bp, const BuildArgs& args, const Env& env,
                       const fs::path& app_dir) {
    PhaseMachine machine("build");
    apply_runtime_config(env, nullptr);

    auto inputs = read_build_context_inputs(args, env, app_dir);
    if (inputs.is_err()) return contract_failure(machine, std::move(inputs).error());
    BuildContext ctx(std::move(inputs).value());
    apply_runtime_config(env, &ctx.platform().env);
    machine.to(PhaseState::ContextBuilt);

    machine.to(PhaseState::AuthorCallbackRunning);
    std::optional<Result<BuildResult>> result;
    try {
        result.emplace(bp.build(ctx));
    } catch (const std::exception& e) {
        return unexpected_failure(machine, e.what());
    } catch (...) {
        return unexpected_failure(machine, "non-standard exception thrown from build");
    }
    if (result->is_err()) return author_failure(machine, bp, std::move(*result).error());

    const BuildResult& built = result->value();
    auto check = check_result_layers(ctx, built);
    if (check.is_err()) return framework_failure(machine, std::move(check).error());

    machine.to(PhaseState::Success);
    auto st = persist_build_result(ctx, built);
    if (st.is_err()) return io_failure(machine, std::move(st).error());

    return machine.finish(PhaseOutcome::success());
}

// ---------------------------------------------------------------------------
// Entry point
// ---------------------------------------------------------------------------

int run_main(Buildpack& bp, int argc, char** argv) {
    Env env = Env::from_current();
    apply_runtime_config(env, nullptr);

    if (argc < 1 || !argv[0]) {
        log::error("missing executable name");
        return exit_code::UNKNOWN_EXECUTABLE;
    }
    std::string exe = fs::path(argv[0]).filename().string();
    std::vector<std::string> args(argv + 1, argv + argc);

    std::error_code ec;
    fs::path app_dir = fs::current_path(ec);
    if (ec) {
        log::error("cannot determine the app directory: %s", ec.message().c_str());
        return exit_code::CONTRACT_VIOLATION;
    }

    PhaseOutcome outcome;
    if (exe == "detect") {
        auto parsed = DetectArgs::parse(args);
        if (parsed.is_err()) {
            log::error("%s", parsed.error().format().c_str());
            return exit_code::CONTRACT_VIOLATION;
        }
        outcome = run_detect(bp, parsed.value(), env, app_dir);
    } else if (exe == "build") {
        auto parsed = BuildArgs::parse(args);
        if (parsed.is_err()) {
            log::error("%s", parsed.error().format().c_str());
            return exit_code::CONTRACT_VIOLATION;
        }
        outcome = run_build(bp, parsed.value(), env, app_dir);
    } else {
        log::error("unexpected executable name '%s'", exe.c_str());
        log::error("the buildpack binary must be invoked as bin/detect or bin/build");
        return exit_code::UNKNOWN_EXECUTABLE;
    }

    return exit_code_for(outcome);
}

} // namespace cnbkit
