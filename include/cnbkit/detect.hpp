#pragma once

#include <cnbkit/build_plan.hpp>
#include <cnbkit/result.hpp>
#include <optional>
#include <string>
#include <variant>

namespace cnbkit {

// Detection passed; the plan file is written even without a plan
struct DetectPass {
    std::optional<BuildPlan> plan;
};

struct DetectFail {
    std::optional<std::string> reason;
};

using DetectResult = std::variant<DetectPass, DetectFail>;

class DetectResultBuilder {
public:
    class PassBuilder {
    public:
        PassBuilder& build_plan(BuildPlan plan);
        Result<DetectResult> build() const;

    private:
        std::optional<BuildPlan> plan_;
    };

    class FailBuilder {
    public:
        explicit FailBuilder(std::optional<std::string> reason = std::nullopt)
            : reason_(std::move(reason)) {}
        Result<DetectResult> build() const;

    private:
        std::optional<std::string> reason_;
    };

    static PassBuilder pass();
    static FailBuilder fail();
    static FailBuilder fail_with_message(std::string reason);
};

} // namespace cnbkit
