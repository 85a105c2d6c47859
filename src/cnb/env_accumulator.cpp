#include <cnbkit/env_accumulator.hpp>
#include <cnbkit/log.hpp>

namespace fs = std::filesystem;

namespace cnbkit {

void EnvAccumulator::contribute(const LayerName& layer, LayerEnv env) {
    if (!layers_.insert_or_assign(layer, std::move(env)).second) {
        log::debug("layer '%s' env contribution replaced", layer.str().c_str());
    }
}

bool EnvAccumulator::remove(const LayerName& layer) {
    return layers_.erase(layer) > 0;
}

Env EnvAccumulator::apply(const Scope& scope, const Env& base) const {
    Env env = base;
    for (const auto& [name, layer_env] : layers_) {
        layer_env.apply_to(scope, env);
    }
    return env;
}

Status EnvAccumulator::write_to_disk(const Scope& scope, const fs::path& layers_dir) const {
    for (const auto& [name, layer_env] : layers_) {
        fs::path layer_dir = layers_dir / name.str();
        std::error_code ec;
        if (!fs::is_directory(layer_dir, ec)) {
            return CnbError{CnbError::IO,
                "cannot write " + scope.to_string() + " env for layer '" + name.str()
                    + "': layer directory " + layer_dir.string() + " is missing"};
        }
        auto st = layer_env.write_to_env_dir(scope, layer_dir / scope.env_dir());
        if (st.is_err()) {
            CnbError e = std::move(st).error();
            e.message = "layer '" + name.str() + "': " + e.message;
            return e;
        }
    }
    return ok_status();
}

Status EnvAccumulator::write_to_disk(const fs::path& layers_dir) const {
    for (const auto& [name, layer_env] : layers_) {
        fs::path layer_dir = layers_dir / name.str();
        std::error_code ec;
        if (!fs::is_directory(layer_dir, ec)) {
            return CnbError{CnbError::IO,
                "cannot write env for layer '" + name.str()
                    + "': layer directory " + layer_dir.string() + " is missing"};
        }
        auto st = layer_env.write_to_layer_dir(layer_dir);
        if (st.is_err()) {
            CnbError e = std::move(st).error();
            e.message = "layer '" + name.str() + "': " + e.message;
            return e;
        }
    }
    return ok_status();
}

} // namespace cnbkit
