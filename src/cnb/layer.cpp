#include <cnbkit/layer.hpp>

namespace cnbkit {

toml::table LayerTypes::to_toml() const {
    return toml::table{
        {"launch", launch},
        {"build", build},
        {"cache", cache},
    };
}

LayerTypes LayerTypes::from_toml(const toml::table& tbl) {
    LayerTypes types;
    types.launch = tbl["launch"].value_or(false);
    types.build = tbl["build"].value_or(false);
    types.cache = tbl["cache"].value_or(false);
    return types;
}

const char* disposition_name(FinalizedLayer::Disposition d) {
    switch (d) {
        case FinalizedLayer::Kept:     return "kept";
        case FinalizedLayer::Replaced: return "replaced";
        case FinalizedLayer::Updated:  return "updated";
        case FinalizedLayer::Deleted:  return "deleted";
    }
    return "unknown";
}

} // namespace cnbkit
