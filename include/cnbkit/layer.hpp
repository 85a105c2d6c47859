#pragma once

#include <cnbkit/layer_env.hpp>
#include <cnbkit/name.hpp>
#include <cnbkit/result.hpp>
#include <cnbkit/sbom.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cnbkit {

// [types] table of <layers>/<name>.toml
struct LayerTypes {
    bool launch = false;
    bool build = false;
    bool cache = false;

    // A layer with no type set is deleted on finalize
    bool any() const { return launch || build || cache; }

    toml::table to_toml() const;
    static LayerTypes from_toml(const toml::table& tbl);

    bool operator==(const LayerTypes& o) const {
        return launch == o.launch && build == o.build && cache == o.cache;
    }
    bool operator!=(const LayerTypes& o) const { return !(*this == o); }
};

// ---------------------------------------------------------------------------
// Previous state of a layer, as found on disk
// ---------------------------------------------------------------------------

// Directory or metadata file missing (either one alone counts as missing)
struct LayerNotPresent {};

struct LayerPresent {
    // The lifecycle strips [types] when restoring a cached layer
    std::optional<LayerTypes> types;
    toml::table metadata;
    std::filesystem::path path;
};

// Metadata could not be parsed (or converted to the author's type). The
// author decides what to do; the raw table is empty when the TOML itself
// was unreadable.
struct LayerMetadataInvalid {
    std::string reason;
    toml::table raw;
    std::filesystem::path path;
};

using LayerState = std::variant<LayerNotPresent, LayerPresent, LayerMetadataInvalid>;

template<typename M>
struct TypedLayerPresent {
    std::optional<LayerTypes> types;
    M metadata;
    std::filesystem::path path;
};

template<typename M>
using TypedLayerState = std::variant<LayerNotPresent, TypedLayerPresent<M>, LayerMetadataInvalid>;

// ---------------------------------------------------------------------------
// Decisions
// ---------------------------------------------------------------------------

// Filled in by a populate function next to the layer contents
struct LayerOutput {
    LayerEnv env;
    std::vector<Sbom> sboms;
    // exec.d program name -> executable to copy into <layer>/exec.d/
    std::map<std::string, std::filesystem::path> exec_d;
};

using PopulateFn = std::function<Status(const std::filesystem::path& layer_dir, LayerOutput& out)>;

// Reuse the existing contents and metadata. `env` replaces the env
// directories when set; otherwise they are read back from disk.
struct KeepLayer {
    LayerTypes types;
    std::optional<LayerEnv> env;
};

// Recreate the layer from scratch through `populate`
struct ReplaceLayer {
    toml::table metadata;
    LayerTypes types;
    PopulateFn populate;
};

// Modify the existing contents in place through `update`, then rewrite
// metadata, env, SBOMs and exec.d from its output. Valid for a present
// layer and for one whose metadata is invalid; with a no-op update it
// migrates the metadata of an otherwise reusable layer.
struct UpdateLayer {
    toml::table metadata;
    LayerTypes types;
    PopulateFn update;
};

struct DeleteLayer {};

using LayerDecision = std::variant<KeepLayer, ReplaceLayer, UpdateLayer, DeleteLayer>;

// ReplaceLayer from an author metadata type providing to_toml()
template<typename M>
ReplaceLayer replace_layer(const M& metadata, LayerTypes types, PopulateFn populate) {
    return ReplaceLayer{metadata.to_toml(), types, std::move(populate)};
}

template<typename M>
UpdateLayer update_layer(const M& metadata, LayerTypes types, PopulateFn update) {
    return UpdateLayer{metadata.to_toml(), types, std::move(update)};
}

// Handle to a layer finalized during this build, referenced from the
// build result by name
struct FinalizedLayer {
    enum Disposition { Kept, Replaced, Updated, Deleted };

    LayerName name;
    Disposition disposition = Kept;
    LayerTypes types;
    std::filesystem::path path;
};

const char* disposition_name(FinalizedLayer::Disposition d);

} // namespace cnbkit
