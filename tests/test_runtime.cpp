#include <catch2/catch.hpp>
#include <cnbkit/exit_code.hpp>
#include <cnbkit/runtime.hpp>
#include <cnbkit/toml_file.hpp>
#include "test_support.hpp"

#include <functional>
#include <stdexcept>

using namespace cnbkit;

namespace {

// Buildpack whose callbacks are set per test
struct ScriptedBuildpack : Buildpack {
    std::function<Result<DetectResult>(DetectContext&)> on_detect;
    std::function<Result<BuildResult>(BuildContext&)> on_build;
    bool detect_called = false;
    bool build_called = false;
    std::vector<CnbError> errors_seen;

    Result<DetectResult> detect(DetectContext& ctx) override {
        detect_called = true;
        return on_detect(ctx);
    }

    Result<BuildResult> build(BuildContext& ctx) override {
        build_called = true;
        return on_build(ctx);
    }

    void on_error(const CnbError& error) override {
        errors_seen.push_back(error);
    }
};

struct PhaseDirs {
    TempDir td;
    fs::path buildpack = td.path / "buildpack";
    fs::path platform = td.path / "platform";
    fs::path layers = td.path / "layers";
    fs::path app = td.path / "app";
    fs::path plan = td.path / "plan.toml";

    PhaseDirs() {
        td.write_file("buildpack/buildpack.toml", MINIMAL_DESCRIPTOR);
        td.write_file("bp-plan.toml", "[[entries]]\nname = \"greeting\"\n");
        fs::create_directories(platform);
        fs::create_directories(layers);
        fs::create_directories(app);
    }

    Env env() const { return lifecycle_env(buildpack); }
    DetectArgs detect_args() const { return DetectArgs{platform, plan}; }
    BuildArgs build_args() const { return BuildArgs{layers, platform, td.path / "bp-plan.toml"}; }
};

int detect_exit(ScriptedBuildpack& bp, const PhaseDirs& dirs) {
    return exit_code_for(run_detect(bp, dirs.detect_args(), dirs.env(), dirs.app));
}

int build_exit(ScriptedBuildpack& bp, const PhaseDirs& dirs) {
    return exit_code_for(run_build(bp, dirs.build_args(), dirs.env(), dirs.app));
}

} // namespace

// ===== Exit codes =====

TEST_CASE("outcome kinds map to exit codes", "[runtime]") {
    REQUIRE(exit_code_for(PhaseOutcome::success()) == 0);
    REQUIRE(exit_code_for(PhaseOutcome::detect_failed("")) == 100);
    REQUIRE(exit_code_for(PhaseOutcome::failure(PhaseOutcome::ContractViolation,
        CnbError{CnbError::Contract, "x"})) == 2);
    REQUIRE(exit_code_for(PhaseOutcome::failure(PhaseOutcome::ContractViolation,
        CnbError{CnbError::ApiMismatch, "x"})) == 254);
    REQUIRE(exit_code_for(PhaseOutcome::failure(PhaseOutcome::AuthorError,
        CnbError{CnbError::Buildpack, "x"})) == 1);
    REQUIRE(exit_code_for(PhaseOutcome::failure(PhaseOutcome::FrameworkError,
        CnbError{CnbError::FrameworkMisuse, "x"})) == 3);
    REQUIRE(exit_code_for(PhaseOutcome::failure(PhaseOutcome::IoError,
        CnbError{CnbError::IO, "x"})) == 4);
    REQUIRE(exit_code_for(PhaseOutcome::unexpected("boom")) == 5);
}

// ===== Detect =====

TEST_CASE("detect pass writes the build plan", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_detect = [](DetectContext&) -> Result<DetectResult> {
        auto plan = BuildPlanBuilder().provides("greeting").requires_("greeting").build();
        CNBKIT_TRY(plan);
        return DetectResultBuilder::pass().build_plan(std::move(plan).value()).build();
    };

    REQUIRE(detect_exit(bp, dirs) == exit_code::SUCCESS);
    auto doc = read_toml_file(dirs.plan);
    REQUIRE(doc.is_ok());
    REQUIRE(doc.value()["provides"][0]["name"].value<std::string>().value() == "greeting");
    REQUIRE(doc.value()["requires"][0]["name"].value<std::string>().value() == "greeting");
}

TEST_CASE("detect pass without a plan writes an empty file", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_detect = [](DetectContext&) { return DetectResultBuilder::pass().build(); };

    REQUIRE(detect_exit(bp, dirs) == 0);
    REQUIRE(dirs.td.exists("plan.toml"));
    REQUIRE(read_toml_file(dirs.plan).value().empty());
}

TEST_CASE("detect fail exits 100 without a plan", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_detect = [](DetectContext&) {
        return DetectResultBuilder::fail_with_message("no greeting.txt").build();
    };

    auto outcome = run_detect(bp, dirs.detect_args(), dirs.env(), dirs.app);
    REQUIRE(outcome.kind == PhaseOutcome::DetectFailed);
    REQUIRE(outcome.detail == "no greeting.txt");
    REQUIRE(exit_code_for(outcome) == 100);
    REQUIRE_FALSE(dirs.td.exists("plan.toml"));
    REQUIRE(bp.errors_seen.empty());
}

TEST_CASE("API mismatch stops before author code", "[runtime]") {
    PhaseDirs dirs;
    dirs.td.write_file("buildpack/buildpack.toml",
        "api = \"0.8\"\n[buildpack]\nid = \"examples/greeter\"\nversion = \"1.0.0\"\n");
    ScriptedBuildpack bp;
    bp.on_detect = [](DetectContext&) { return DetectResultBuilder::pass().build(); };
    bp.on_build = [](BuildContext&) { return BuildResultBuilder().build(); };

    REQUIRE(detect_exit(bp, dirs) == exit_code::API_MISMATCH);
    REQUIRE(build_exit(bp, dirs) == exit_code::API_MISMATCH);
    REQUIRE_FALSE(bp.detect_called);
    REQUIRE_FALSE(bp.build_called);
    REQUIRE(bp.errors_seen.empty());
    REQUIRE_FALSE(dirs.td.exists("plan.toml"));
}

TEST_CASE("missing lifecycle variables are contract violations", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_detect = [](DetectContext&) { return DetectResultBuilder::pass().build(); };

    Env env = dirs.env();
    env.remove("CNB_TARGET_OS");
    auto outcome = run_detect(bp, dirs.detect_args(), env, dirs.app);
    REQUIRE(outcome.kind == PhaseOutcome::ContractViolation);
    REQUIRE(exit_code_for(outcome) == exit_code::CONTRACT_VIOLATION);
    REQUIRE_FALSE(bp.detect_called);
}

TEST_CASE("author errors reach on_error and exit 1", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_detect = [](DetectContext&) -> Result<DetectResult> {
        return CnbError{CnbError::Buildpack, "greeting.txt is unreadable"};
    };

    REQUIRE(detect_exit(bp, dirs) == exit_code::GENERIC_FAILURE);
    REQUIRE(bp.errors_seen.size() == 1);
    REQUIRE(bp.errors_seen[0].message == "greeting.txt is unreadable");
}

TEST_CASE("framework misuse skips on_error and exits 3", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_detect = [](DetectContext&) {
        // Empty requirement names are rejected by the builder
        return DetectResultBuilder::pass()
            .build_plan(BuildPlan{{}, {Require("")}, {}})
            .build();
    };

    auto outcome = run_detect(bp, dirs.detect_args(), dirs.env(), dirs.app);
    REQUIRE(outcome.kind == PhaseOutcome::FrameworkError);
    REQUIRE(exit_code_for(outcome) == exit_code::FRAMEWORK_MISUSE);
    REQUIRE(bp.errors_seen.empty());
}

TEST_CASE("exceptions from author code exit 5", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_detect = [](DetectContext&) -> Result<DetectResult> {
        throw std::runtime_error("unexpected state");
    };

    auto outcome = run_detect(bp, dirs.detect_args(), dirs.env(), dirs.app);
    REQUIRE(outcome.kind == PhaseOutcome::Unexpected);
    REQUIRE(outcome.detail == "unexpected state");
    REQUIRE(exit_code_for(outcome) == exit_code::UNEXPECTED);
}

// ===== Build =====

TEST_CASE("build persists launch, store and SBOMs", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_build = [](BuildContext& ctx) -> Result<BuildResult> {
        REQUIRE(ctx.buildpack_plan().contains("greeting"));
        REQUIRE_FALSE(ctx.store().has_value());

        auto layer = ctx.layers().finalize("greeter",
            ReplaceLayer{{}, LayerTypes{true, false, false},
                [](const fs::path& dir, LayerOutput& out) -> Status {
                    out.env.insert(Scope::launch(), ModificationBehavior::Default,
                                   "GREETING", "hello");
                    return write_file(dir / "greet", "#!/bin/sh\necho hi\n");
                }});
        CNBKIT_TRY(layer);

        auto web = ProcessBuilder(ProcessType::parse("web").value(), "greet").default_().build();
        CNBKIT_TRY(web);
        auto launch = LaunchBuilder().process(std::move(web).value()).build();
        CNBKIT_TRY(launch);

        return BuildResultBuilder()
            .layer(std::move(layer).value())
            .launch(std::move(launch).value())
            .launch_sbom(Sbom::from_bytes(SbomFormat::CycloneDxJson, "{}"))
            .store(Store{toml::table{{"builds", 1}}})
            .build();
    };

    REQUIRE(build_exit(bp, dirs) == exit_code::SUCCESS);

    auto launch = read_toml_file(dirs.layers / "launch.toml");
    REQUIRE(launch.is_ok());
    REQUIRE(launch.value()["processes"][0]["type"].value<std::string>().value() == "web");
    REQUIRE(launch.value()["processes"][0]["default"].value<bool>().value());

    REQUIRE(dirs.td.read_file("layers/greeter/env.launch/GREETING.default") == "hello");
    REQUIRE(dirs.td.exists("layers/greeter.toml"));
    REQUIRE(dirs.td.read_file("layers/launch.sbom.cdx.json") == "{}");
    REQUIRE_FALSE(dirs.td.exists("layers/build.toml"));

    auto store = Store::load(dirs.layers / "store.toml");
    REQUIRE(store.is_ok());
    REQUIRE(store.value()->metadata["builds"].value<int64_t>().value() == 1);
}

TEST_CASE("build without processes writes no launch.toml", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_build = [](BuildContext&) {
        return BuildResultBuilder().unmet("greeting").build();
    };

    REQUIRE(build_exit(bp, dirs) == 0);
    REQUIRE_FALSE(dirs.td.exists("layers/launch.toml"));
    REQUIRE_FALSE(dirs.td.exists("layers/store.toml"));

    auto build_toml = read_toml_file(dirs.layers / "build.toml");
    REQUIRE(build_toml.is_ok());
    REQUIRE(build_toml.value()["unmet"][0]["name"].value<std::string>().value() == "greeting");
}

TEST_CASE("build result must reference layers finalized in this build", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_build = [](BuildContext& ctx) {
        FinalizedLayer forged{LayerName::parse("ghost").value(), FinalizedLayer::Replaced,
                              LayerTypes{true, false, false}, ctx.layers_dir() / "ghost"};
        return BuildResultBuilder().layer(forged).build();
    };

    REQUIRE(build_exit(bp, dirs) == exit_code::FRAMEWORK_MISUSE);
    REQUIRE(bp.errors_seen.empty());
}

TEST_CASE("failing layer populate is an author error", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_build = [](BuildContext& ctx) -> Result<BuildResult> {
        auto layer = ctx.layers().finalize("greeter",
            ReplaceLayer{{}, LayerTypes{true, false, false},
                [](const fs::path&, LayerOutput&) -> Status {
                    return CnbError{CnbError::Buildpack, "download failed"};
                }});
        CNBKIT_TRY(layer);
        return BuildResultBuilder().layer(std::move(layer).value()).build();
    };

    REQUIRE(build_exit(bp, dirs) == exit_code::GENERIC_FAILURE);
    REQUIRE(bp.errors_seen.size() == 1);
    REQUIRE_FALSE(dirs.td.exists("layers/greeter"));
    REQUIRE_FALSE(dirs.td.exists("layers/greeter.toml"));
}

TEST_CASE("layer store I/O failure exits 4 without on_error", "[runtime]") {
    PhaseDirs dirs;
    // A non-empty directory where the metadata file goes cannot be removed,
    // even by root
    dirs.td.write_file("layers/greeter.toml/stuck", "x");
    ScriptedBuildpack bp;
    bp.on_build = [](BuildContext& ctx) -> Result<BuildResult> {
        auto layer = ctx.layers().finalize("greeter",
            ReplaceLayer{{}, LayerTypes{true, false, false},
                [](const fs::path&, LayerOutput&) -> Status { return ok_status(); }});
        CNBKIT_TRY(layer);
        return BuildResultBuilder().layer(std::move(layer).value()).build();
    };

    auto outcome = run_build(bp, dirs.build_args(), dirs.env(), dirs.app);
    REQUIRE(outcome.kind == PhaseOutcome::IoError);
    REQUIRE(outcome.error->code == CnbError::LayerIO);
    REQUIRE(exit_code_for(outcome) == exit_code::IO_FAILURE);
    REQUIRE(bp.build_called);
    REQUIRE(bp.errors_seen.empty());
}

TEST_CASE("IO errors from populate stay author errors", "[runtime]") {
    PhaseDirs dirs;
    ScriptedBuildpack bp;
    bp.on_build = [](BuildContext& ctx) -> Result<BuildResult> {
        auto layer = ctx.layers().finalize("greeter",
            ReplaceLayer{{}, LayerTypes{true, false, false},
                [](const fs::path&, LayerOutput&) -> Status {
                    return CnbError{CnbError::IO, "cannot read greeting.txt"};
                }});
        CNBKIT_TRY(layer);
        return BuildResultBuilder().layer(std::move(layer).value()).build();
    };

    REQUIRE(build_exit(bp, dirs) == exit_code::GENERIC_FAILURE);
    REQUIRE(bp.errors_seen.size() == 1);
    REQUIRE(bp.errors_seen[0].code == CnbError::IO);
}

TEST_CASE("unreadable buildpack plan fails build before author code", "[runtime]") {
    PhaseDirs dirs;
    dirs.td.write_file("bp-plan.toml", "[[entries]\n");
    ScriptedBuildpack bp;
    bp.on_build = [](BuildContext&) { return BuildResultBuilder().build(); };

    REQUIRE(build_exit(bp, dirs) == exit_code::CONTRACT_VIOLATION);
    REQUIRE_FALSE(bp.build_called);
}

// ===== Entry point =====

TEST_CASE("run_main dispatches on the executable name", "[runtime]") {
    ScriptedBuildpack bp;
    bp.on_detect = [](DetectContext&) { return DetectResultBuilder::pass().build(); };
    bp.on_build = [](BuildContext&) { return BuildResultBuilder().build(); };

    char exe_unknown[] = "/cnb/buildpacks/x/bin/generate";
    char* argv_unknown[] = {exe_unknown, nullptr};
    REQUIRE(run_main(bp, 1, argv_unknown) == exit_code::UNKNOWN_EXECUTABLE);

    // Wrong argument count
    char exe_detect[] = "/cnb/buildpacks/x/bin/detect";
    char* argv_detect[] = {exe_detect, nullptr};
    REQUIRE(run_main(bp, 1, argv_detect) == exit_code::CONTRACT_VIOLATION);
    REQUIRE_FALSE(bp.detect_called);
}
