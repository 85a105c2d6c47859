#include <cnbkit/build.hpp>

#include <set>

namespace cnbkit {

toml::table BuildResult::build_toml() const {
    toml::table tbl;
    if (!unmet.empty()) {
        toml::array arr;
        for (const auto& name : unmet) {
            arr.push_back(toml::table{{"name", name}});
        }
        tbl.insert("unmet", std::move(arr));
    }
    return tbl;
}

BuildResultBuilder& BuildResultBuilder::layer(FinalizedLayer layer) {
    result_.layers.push_back(std::move(layer));
    return *this;
}

BuildResultBuilder& BuildResultBuilder::launch(Launch launch) {
    result_.launch = std::move(launch);
    return *this;
}

BuildResultBuilder& BuildResultBuilder::build_sbom(Sbom sbom) {
    result_.build_sboms.push_back(std::move(sbom));
    return *this;
}

BuildResultBuilder& BuildResultBuilder::launch_sbom(Sbom sbom) {
    result_.launch_sboms.push_back(std::move(sbom));
    return *this;
}

BuildResultBuilder& BuildResultBuilder::store(Store store) {
    result_.store = std::move(store);
    return *this;
}

BuildResultBuilder& BuildResultBuilder::unmet(std::string name) {
    result_.unmet.push_back(std::move(name));
    return *this;
}

static Status check_sbom_formats(const std::vector<Sbom>& sboms, const char* scope) {
    std::set<SbomFormat> seen;
    for (const auto& sbom : sboms) {
        if (!seen.insert(sbom.format).second) {
            return CnbError{CnbError::FrameworkMisuse,
                std::string(scope) + " SBOM in format " + sbom_file_suffix(sbom.format)
                    + " was supplied more than once"};
        }
    }
    return ok_status();
}

Result<BuildResult> BuildResultBuilder::build() const {
    std::set<std::string> layer_names;
    for (const auto& layer : result_.layers) {
        if (!layer_names.insert(layer.name.str()).second) {
            return CnbError{CnbError::FrameworkMisuse,
                "layer '" + layer.name.str() + "' is referenced more than once in the build result"};
        }
    }

    if (result_.launch) {
        CNBKIT_TRY(validate_launch(*result_.launch));
    }

    CNBKIT_TRY(check_sbom_formats(result_.build_sboms, "build"));
    CNBKIT_TRY(check_sbom_formats(result_.launch_sboms, "launch"));

    for (const auto& name : result_.unmet) {
        if (name.empty()) {
            return CnbError{CnbError::FrameworkMisuse, "unmet plan entry has an empty name"};
        }
    }

    return Result<BuildResult>::ok(result_);
}

} // namespace cnbkit
