#pragma once

#include <cnbkit/result.hpp>
#include <string>

namespace cnbkit {

// Layer name: [a-z0-9._-]+, excluding names the lifecycle owns in the
// layers directory (build, launch, store, env, sbom, exec.d).
struct LayerName {
    static Result<LayerName> parse(const std::string& raw);

    const std::string& str() const;

    bool operator==(const LayerName& o) const;
    bool operator!=(const LayerName& o) const;
    bool operator<(const LayerName& o) const;

private:
    std::string value_;
};

// Process type: [A-Za-z0-9._-]+
struct ProcessType {
    static Result<ProcessType> parse(const std::string& raw);

    const std::string& str() const;

    bool operator==(const ProcessType& o) const;
    bool operator!=(const ProcessType& o) const;

private:
    std::string value_;
};

// Buildpack id: [A-Za-z0-9./-]+, not "app" or "config"
struct BuildpackId {
    static Result<BuildpackId> parse(const std::string& raw);

    const std::string& str() const;

    bool operator==(const BuildpackId& o) const;
    bool operator!=(const BuildpackId& o) const;

private:
    std::string value_;
};

} // namespace cnbkit
