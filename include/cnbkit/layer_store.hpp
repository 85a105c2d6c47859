#pragma once

#include <cnbkit/env_accumulator.hpp>
#include <cnbkit/layer.hpp>
#include <cnbkit/result.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

namespace cnbkit {

// Owns <layers>/<name>/ and <layers>/<name>.toml for one build.
//
// Write ordering on Replace: metadata file removed, old directory removed,
// contents populated, env/SBOM/exec.d written, metadata file written last
// through a temp-file rename. A process killed at any point therefore
// leaves either no metadata file or a complete layer, and retrieve()
// reports a directory without metadata as not present. Update follows the
// same order without removing the directory.
class LayerStore {
public:
    LayerStore(std::filesystem::path layers_dir, EnvAccumulator& env);

    const std::filesystem::path& layers_dir() const { return layers_dir_; }
    std::filesystem::path layer_dir(const LayerName& name) const;
    std::filesystem::path metadata_path(const LayerName& name) const;

    Result<LayerState> retrieve(const LayerName& name) const;
    Result<LayerState> retrieve(const std::string& name) const;

    // retrieve() plus conversion through M::from_toml. A conversion
    // failure is reported as LayerMetadataInvalid, not as an error.
    template<typename M>
    Result<TypedLayerState<M>> retrieve_as(const LayerName& name) const;

    // Each layer can be finalized once per build
    Result<FinalizedLayer> finalize(const LayerName& name, LayerDecision decision);
    Result<FinalizedLayer> finalize(const std::string& name, LayerDecision decision);

    using DecideFn = std::function<LayerDecision(const LayerState&)>;

    // retrieve() followed by finalize(decide(state))
    Result<FinalizedLayer> handle(const LayerName& name, const DecideFn& decide);
    Result<FinalizedLayer> handle(const std::string& name, const DecideFn& decide);

    bool is_finalized(const LayerName& name) const;
    const std::map<LayerName, FinalizedLayer>& finalized() const { return finalized_; }

private:
    Result<FinalizedLayer> keep(const LayerName& name, KeepLayer decision);
    Result<FinalizedLayer> replace(const LayerName& name, ReplaceLayer decision);
    Result<FinalizedLayer> update(const LayerName& name, UpdateLayer decision);
    Result<FinalizedLayer> remove(const LayerName& name);

    // Env, SBOMs and exec.d of a populated or updated layer
    Status write_outputs(const LayerName& name, LayerOutput& output) const;
    Status write_metadata(const LayerName& name, const LayerTypes& types,
                          const toml::table& metadata) const;

    std::filesystem::path layers_dir_;
    EnvAccumulator& env_;
    std::map<LayerName, FinalizedLayer> finalized_;
};

// Author-supplied layer names are framework-contract input: an invalid one
// is FrameworkMisuse
Result<LayerName> parse_layer_name(const std::string& name);

template<typename M>
Result<TypedLayerState<M>> LayerStore::retrieve_as(const LayerName& name) const {
    auto state = retrieve(name);
    if (state.is_err()) return std::move(state).error();

    if (auto present = std::get_if<LayerPresent>(&state.value())) {
        Result<M> converted = M::from_toml(present->metadata);
        if (converted.is_err()) {
            return Result<TypedLayerState<M>>::ok(LayerMetadataInvalid{
                converted.error().message, present->metadata, present->path});
        }
        return Result<TypedLayerState<M>>::ok(TypedLayerPresent<M>{
            present->types, std::move(converted).value(), present->path});
    }
    if (auto invalid = std::get_if<LayerMetadataInvalid>(&state.value())) {
        return Result<TypedLayerState<M>>::ok(std::move(*invalid));
    }
    return Result<TypedLayerState<M>>::ok(LayerNotPresent{});
}

} // namespace cnbkit
