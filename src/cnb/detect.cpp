#include <cnbkit/detect.hpp>

namespace cnbkit {

DetectResultBuilder::PassBuilder& DetectResultBuilder::PassBuilder::build_plan(BuildPlan plan) {
    plan_ = std::move(plan);
    return *this;
}

Result<DetectResult> DetectResultBuilder::PassBuilder::build() const {
    if (plan_) {
        for (const auto& p : plan_->provides) {
            if (p.name.empty()) {
                return CnbError{CnbError::FrameworkMisuse, "build plan provide has an empty name"};
            }
        }
        for (const auto& r : plan_->requires_) {
            if (r.name.empty()) {
                return CnbError{CnbError::FrameworkMisuse, "build plan require has an empty name"};
            }
        }
        for (const auto& alt : plan_->ors) {
            if (alt.provides.empty() && alt.requires_.empty()) {
                return CnbError{CnbError::FrameworkMisuse, "build plan [[or]] alternative is empty"};
            }
        }
    }
    return Result<DetectResult>::ok(DetectPass{plan_});
}

Result<DetectResult> DetectResultBuilder::FailBuilder::build() const {
    return Result<DetectResult>::ok(DetectFail{reason_});
}

DetectResultBuilder::PassBuilder DetectResultBuilder::pass() {
    return PassBuilder{};
}

DetectResultBuilder::FailBuilder DetectResultBuilder::fail() {
    return FailBuilder{};
}

DetectResultBuilder::FailBuilder DetectResultBuilder::fail_with_message(std::string reason) {
    return FailBuilder{std::move(reason)};
}

} // namespace cnbkit
