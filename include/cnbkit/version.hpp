#pragma once

#include <cnbkit/result.hpp>
#include <string>

namespace cnbkit {

// Buildpack version: major.minor.micro[-label], no leading zeroes
struct Version {
    int major = 0;
    int minor = 0;
    int micro = 0;
    std::string label;  // e.g. "alpha", "rc1", empty for release

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
};

// Buildpack API version: "<major>.<minor>" or "<major>" (minor defaults to 0)
struct BuildpackApi {
    int major = 0;
    int minor = 0;

    static Result<BuildpackApi> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const BuildpackApi& o) const;
    bool operator!=(const BuildpackApi& o) const;
};

// The Buildpack API this framework implements
inline const BuildpackApi SUPPORTED_BUILDPACK_API{0, 10};

} // namespace cnbkit
