#pragma once

#include <cnbkit/launch.hpp>
#include <cnbkit/layer.hpp>
#include <cnbkit/result.hpp>
#include <cnbkit/sbom.hpp>
#include <cnbkit/store.hpp>
#include <toml++/toml.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cnbkit {

struct BuildResult {
    std::vector<FinalizedLayer> layers;
    std::optional<Launch> launch;
    std::vector<Sbom> build_sboms;
    std::vector<Sbom> launch_sboms;
    std::optional<Store> store;
    std::vector<std::string> unmet;  // buildpack plan entries not provided

    // build.toml: [[unmet]] name = "..."
    toml::table build_toml() const;
};

class BuildResultBuilder {
public:
    BuildResultBuilder& layer(FinalizedLayer layer);
    BuildResultBuilder& launch(Launch launch);
    BuildResultBuilder& build_sbom(Sbom sbom);
    BuildResultBuilder& launch_sbom(Sbom sbom);
    BuildResultBuilder& store(Store store);
    BuildResultBuilder& unmet(std::string name);

    // Re-validates the launch (single default process) and rejects
    // duplicate layer references and duplicate SBOM formats
    Result<BuildResult> build() const;

private:
    BuildResult result_;
};

} // namespace cnbkit
