#pragma once

#include <cnbkit/layer_env.hpp>
#include <cnbkit/name.hpp>
#include <filesystem>
#include <map>

namespace cnbkit {

// Collects the environment contributed by every finalized layer of one
// build and applies it in ascending layer-name order, independent of the
// order layers were finalized in. A later layer's prepend therefore lands
// in front of an earlier layer's: a prepends /a, b prepends /b, base
// /usr/bin gives /b:/a:/usr/bin.
class EnvAccumulator {
public:
    // Contributing the same layer again replaces its earlier contribution
    void contribute(const LayerName& layer, LayerEnv env);
    bool remove(const LayerName& layer);

    Env apply(const Scope& scope, const Env& base) const;

    // Rewrite <layers>/<layer>/<env dir of scope> for every contributor
    Status write_to_disk(const Scope& scope, const std::filesystem::path& layers_dir) const;

    // Rewrite every env directory of every contributor
    Status write_to_disk(const std::filesystem::path& layers_dir) const;

    const std::map<LayerName, LayerEnv>& contributions() const { return layers_; }
    bool empty() const { return layers_.empty(); }

private:
    std::map<LayerName, LayerEnv> layers_;
};

} // namespace cnbkit
