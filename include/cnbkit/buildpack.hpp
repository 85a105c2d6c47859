#pragma once

#include <cnbkit/build.hpp>
#include <cnbkit/context.hpp>
#include <cnbkit/detect.hpp>
#include <cnbkit/error.hpp>
#include <cnbkit/result.hpp>

namespace cnbkit {

// Implemented by buildpack authors. Errors returned from detect/build are
// author errors and reach on_error; framework contract violations do not.
class Buildpack {
public:
    virtual ~Buildpack() = default;

    virtual Result<DetectResult> detect(DetectContext& ctx) = 0;
    virtual Result<BuildResult> build(BuildContext& ctx) = 0;

    // Observation point for author errors; cannot change the exit code
    virtual void on_error(const CnbError& error) {
        (void)error;
    }
};

} // namespace cnbkit
