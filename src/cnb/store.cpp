#include <cnbkit/store.hpp>
#include <cnbkit/toml_file.hpp>

namespace fs = std::filesystem;

namespace cnbkit {

toml::table Store::to_toml() const {
    toml::table tbl;
    tbl.insert("metadata", metadata);
    return tbl;
}

Result<std::optional<Store>> Store::load(const fs::path& path) {
    auto doc = read_toml_file(path);
    if (doc.is_err()) {
        if (doc.error().code == CnbError::NotFound) {
            return Result<std::optional<Store>>::ok(std::nullopt);
        }
        return std::move(doc).error();
    }

    Store store;
    if (auto md = doc.value()["metadata"].as_table()) {
        store.metadata = *md;
    }
    return Result<std::optional<Store>>::ok(std::move(store));
}

Status Store::save(const fs::path& path) const {
    return write_toml_file(to_toml(), path);
}

} // namespace cnbkit
