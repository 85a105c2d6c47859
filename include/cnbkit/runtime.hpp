#pragma once

#include <cnbkit/buildpack.hpp>
#include <cnbkit/context.hpp>
#include <cnbkit/env.hpp>
#include <cnbkit/error.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace cnbkit {

enum class PhaseState {
    Initializing,
    ContextBuilt,
    AuthorCallbackRunning,
    Success,
    AuthorError,
    FrameworkError,
    Terminated,
};

const char* phase_state_name(PhaseState state);

// What a phase ended with. Only run_main turns this into an exit code.
struct PhaseOutcome {
    enum Kind {
        Success,
        DetectFailed,
        ContractViolation,  // includes Buildpack API mismatch
        AuthorError,
        FrameworkError,
        IoError,
        Unexpected,
    };

    Kind kind = Success;
    std::optional<CnbError> error;
    std::string detail;  // detect fail reason, exception message

    static PhaseOutcome success();
    static PhaseOutcome detect_failed(std::string reason);
    static PhaseOutcome failure(Kind kind, CnbError error);
    static PhaseOutcome unexpected(std::string what);

    bool ok() const { return kind == Success || kind == DetectFailed; }
};

const char* outcome_name(PhaseOutcome::Kind kind);

int exit_code_for(const PhaseOutcome& outcome);

PhaseOutcome run_detect(Buildpack& bp, const DetectArgs& args, const Env& env,
                        const std::filesystem::path& app_dir);

PhaseOutcome run_build(Buildpack& bp, const BuildArgs& args, const Env& env,
                       const std::filesystem::path& app_dir);

// Entry point: dispatches on the executable name (bin/detect, bin/build)
// and returns the process exit code
int run_main(Buildpack& bp, int argc, char** argv);

} // namespace cnbkit

#define CNBKIT_BUILDPACK_MAIN(Type)              \
    int main(int argc, char** argv) {            \
        Type buildpack;                          \
        return ::cnbkit::run_main(buildpack, argc, argv); \
    }
