#include <cnbkit/layer_store.hpp>
#include <cnbkit/log.hpp>
#include <cnbkit/toml_file.hpp>

namespace fs = std::filesystem;

namespace cnbkit {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

Result<LayerName> parse_layer_name(const std::string& name) {
    auto parsed = LayerName::parse(name);
    if (parsed.is_err()) {
        CnbError e = std::move(parsed).error();
        e.code = CnbError::FrameworkMisuse;
        return e;
    }
    return parsed;
}

// Filesystem failures of the store itself are LayerIO so the runner can
// tell them apart from IO errors returned by author populate code
static CnbError io_error(const LayerName& name, const std::string& op,
                         const std::error_code& ec) {
    return CnbError{CnbError::LayerIO,
        "layer '" + name.str() + "': " + op + " failed: " + ec.message()};
}

static CnbError store_error(const LayerName& name, const std::string& op, CnbError e) {
    if (e.code == CnbError::IO || e.code == CnbError::NotFound) e.code = CnbError::LayerIO;
    e.message = "layer '" + name.str() + "': " + op + " failed: " + e.message;
    return e;
}

// Remove a layer directory even when the previous build left read-only
// directories inside it
static Status remove_layer_dir(const LayerName& name, const fs::path& dir) {
    std::error_code ec;
    auto st = fs::symlink_status(dir, ec);
    if (!fs::exists(st)) return ok_status();

    if (fs::is_directory(st)) {
        std::error_code perm_ec;
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, perm_ec);

        // Directories are visited before they are descended into
        fs::recursive_directory_iterator it(dir, ec), end;
        while (!ec && it != end) {
            if (it->is_directory(perm_ec) && !it->is_symlink(perm_ec)) {
                fs::permissions(it->path(), fs::perms::owner_all,
                                fs::perm_options::add, perm_ec);
            }
            it.increment(ec);
        }
        ec.clear();
    }

    fs::remove_all(dir, ec);
    if (ec) return io_error(name, "removing directory " + dir.string(), ec);
    return ok_status();
}

static Status remove_file(const LayerName& name, const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) return io_error(name, "removing " + path.string(), ec);
    return ok_status();
}

static Status remove_layer_sboms(const LayerName& name, const fs::path& layers_dir) {
    for (auto format : SBOM_FORMATS) {
        CNBKIT_TRY(remove_file(name, sbom_path(format, layers_dir, name.str())));
    }
    return ok_status();
}

static Status write_exec_d(const LayerName& name, const fs::path& layer_dir,
                           const std::map<std::string, fs::path>& programs) {
    if (programs.empty()) return ok_status();

    fs::path exec_d = layer_dir / "exec.d";
    std::error_code ec;
    fs::create_directories(exec_d, ec);
    if (ec) return io_error(name, "creating " + exec_d.string(), ec);

    for (const auto& [program, source] : programs) {
        if (program.empty() || program == "." || program == ".." ||
            program.find('/') != std::string::npos) {
            return CnbError{CnbError::FrameworkMisuse,
                "layer '" + name.str() + "': invalid exec.d program name '" + program + "'"};
        }
        if (!fs::is_regular_file(source, ec)) {
            return CnbError{CnbError::Buildpack,
                "layer '" + name.str() + "': exec.d program '" + program + "' source "
                    + source.string() + " is not a file"};
        }
        fs::path dest = exec_d / program;
        fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
        if (ec) return io_error(name, "copying exec.d program " + source.string(), ec);
        fs::permissions(dest,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add, ec);
        if (ec) return io_error(name, "making " + dest.string() + " executable", ec);
    }
    return ok_status();
}

// Removes a half-built layer unless released
class PartialLayerGuard {
public:
    PartialLayerGuard(const LayerName& name, fs::path dir, fs::path metadata)
        : name_(name), dir_(std::move(dir)), metadata_(std::move(metadata)) {}

    ~PartialLayerGuard() {
        if (!armed_) return;
        std::error_code ec;
        fs::remove(metadata_, ec);
        auto st = remove_layer_dir(name_, dir_);
        if (st.is_err()) {
            log::error("cleanup of layer '%s' failed: %s",
                       name_.str().c_str(), st.error().message.c_str());
        }
    }

    void release() { armed_ = false; }

private:
    LayerName name_;
    fs::path dir_;
    fs::path metadata_;
    bool armed_ = true;
};

// ---------------------------------------------------------------------------
// LayerStore
// ---------------------------------------------------------------------------

LayerStore::LayerStore(fs::path layers_dir, EnvAccumulator& env)
    : layers_dir_(std::move(layers_dir)), env_(env) {}

fs::path LayerStore::layer_dir(const LayerName& name) const {
    return layers_dir_ / name.str();
}

fs::path LayerStore::metadata_path(const LayerName& name) const {
    return layers_dir_ / (name.str() + ".toml");
}

Result<LayerState> LayerStore::retrieve(const LayerName& name) const {
    fs::path dir = layer_dir(name);
    fs::path toml_path = metadata_path(name);

    std::error_code ec;
    bool has_dir = fs::is_directory(dir, ec);
    bool has_toml = fs::is_regular_file(toml_path, ec);
    if (!has_dir || !has_toml) {
        if (has_dir || has_toml) {
            log::debug("layer '%s' is incomplete (directory: %s, metadata: %s), "
                       "treating it as not present",
                       name.str().c_str(), has_dir ? "yes" : "no", has_toml ? "yes" : "no");
        }
        return Result<LayerState>::ok(LayerNotPresent{});
    }

    auto doc = read_toml_file(toml_path);
    if (doc.is_err()) {
        if (doc.error().code == CnbError::Parse) {
            return Result<LayerState>::ok(LayerMetadataInvalid{
                doc.error().message, toml::table{}, dir});
        }
        return store_error(name, "reading metadata", std::move(doc).error());
    }
    const toml::table& tbl = doc.value();

    LayerPresent present;
    present.path = dir;

    if (auto types_node = tbl.get("types")) {
        auto types_tbl = types_node->as_table();
        if (!types_tbl) {
            return Result<LayerState>::ok(LayerMetadataInvalid{
                "[types] is not a table", tbl, dir});
        }
        present.types = LayerTypes::from_toml(*types_tbl);
    }

    if (auto md_node = tbl.get("metadata")) {
        auto md_tbl = md_node->as_table();
        if (!md_tbl) {
            return Result<LayerState>::ok(LayerMetadataInvalid{
                "[metadata] is not a table", tbl, dir});
        }
        present.metadata = *md_tbl;
    }

    return Result<LayerState>::ok(std::move(present));
}

Result<LayerState> LayerStore::retrieve(const std::string& name) const {
    auto parsed = parse_layer_name(name);
    if (parsed.is_err()) return std::move(parsed).error();
    return retrieve(parsed.value());
}

Result<FinalizedLayer> LayerStore::finalize(const LayerName& name, LayerDecision decision) {
    if (is_finalized(name)) {
        return CnbError{CnbError::FrameworkMisuse,
            "layer '" + name.str() + "' was already finalized in this build",
            "each layer can be finalized once"};
    }

    Result<FinalizedLayer> result = CnbError{CnbError::FrameworkMisuse, "no decision"};
    if (auto keep_decision = std::get_if<KeepLayer>(&decision)) {
        result = keep(name, std::move(*keep_decision));
    } else if (auto replace_decision = std::get_if<ReplaceLayer>(&decision)) {
        result = replace(name, std::move(*replace_decision));
    } else if (auto update_decision = std::get_if<UpdateLayer>(&decision)) {
        result = update(name, std::move(*update_decision));
    } else {
        result = remove(name);
    }

    if (result.is_ok()) {
        const auto& layer = result.value();
        log::debug("layer '%s' %s", name.str().c_str(), disposition_name(layer.disposition));
        finalized_.insert_or_assign(name, layer);
    }
    return result;
}

Result<FinalizedLayer> LayerStore::finalize(const std::string& name, LayerDecision decision) {
    auto parsed = parse_layer_name(name);
    if (parsed.is_err()) return std::move(parsed).error();
    return finalize(parsed.value(), std::move(decision));
}

Result<FinalizedLayer> LayerStore::handle(const LayerName& name, const DecideFn& decide) {
    auto state = retrieve(name);
    if (state.is_err()) return std::move(state).error();
    return finalize(name, decide(state.value()));
}

Result<FinalizedLayer> LayerStore::handle(const std::string& name, const DecideFn& decide) {
    auto parsed = parse_layer_name(name);
    if (parsed.is_err()) return std::move(parsed).error();
    return handle(parsed.value(), decide);
}

bool LayerStore::is_finalized(const LayerName& name) const {
    return finalized_.count(name) > 0;
}

Status LayerStore::write_metadata(const LayerName& name, const LayerTypes& types,
                                  const toml::table& metadata) const {
    toml::table doc;
    doc.insert("types", types.to_toml());
    doc.insert("metadata", metadata);
    auto st = write_toml_file(doc, metadata_path(name));
    if (st.is_err()) return store_error(name, "writing metadata", std::move(st).error());
    return ok_status();
}

Result<FinalizedLayer> LayerStore::keep(const LayerName& name, KeepLayer decision) {
    if (!decision.types.any()) {
        return remove(name);
    }

    auto state = retrieve(name);
    if (state.is_err()) return std::move(state).error();
    auto present = std::get_if<LayerPresent>(&state.value());
    if (!present) {
        return CnbError{CnbError::FrameworkMisuse,
            "cannot keep layer '" + name.str() + "': no valid previous layer exists",
            "replace the layer when retrieve() does not report it as present"};
    }

    fs::path dir = layer_dir(name);
    LayerEnv env;
    if (decision.env) {
        env = std::move(*decision.env);
        env.add_layer_paths(dir);
        auto st = env.write_to_layer_dir(dir);
        if (st.is_err()) return store_error(name, "writing env", std::move(st).error());
    } else {
        auto read = LayerEnv::read_from_layer_dir(dir);
        if (read.is_err()) return store_error(name, "reading env", std::move(read).error());
        env = std::move(read).value();
    }

    CNBKIT_TRY(write_metadata(name, decision.types, present->metadata));
    env_.contribute(name, std::move(env));

    return Result<FinalizedLayer>::ok(
        FinalizedLayer{name, FinalizedLayer::Kept, decision.types, dir});
}

Result<FinalizedLayer> LayerStore::replace(const LayerName& name, ReplaceLayer decision) {
    if (!decision.types.any()) {
        log::debug("layer '%s' has no types set, deleting it", name.str().c_str());
        return remove(name);
    }

    fs::path dir = layer_dir(name);
    fs::path toml_path = metadata_path(name);

    // Metadata goes first so an interrupted replace reads as not present
    CNBKIT_TRY(remove_file(name, toml_path));
    CNBKIT_TRY(remove_layer_dir(name, dir));
    CNBKIT_TRY(remove_layer_sboms(name, layers_dir_));

    PartialLayerGuard guard(name, dir, toml_path);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return io_error(name, "creating directory " + dir.string(), ec);

    LayerOutput output;
    if (decision.populate) {
        auto st = decision.populate(dir, output);
        if (st.is_err()) {
            log::debug("populating layer '%s' failed", name.str().c_str());
            return std::move(st).error();
        }
    }

    CNBKIT_TRY(write_outputs(name, output));
    CNBKIT_TRY(write_metadata(name, decision.types, decision.metadata));

    guard.release();
    env_.contribute(name, std::move(output.env));

    return Result<FinalizedLayer>::ok(
        FinalizedLayer{name, FinalizedLayer::Replaced, decision.types, dir});
}

Result<FinalizedLayer> LayerStore::update(const LayerName& name, UpdateLayer decision) {
    if (!decision.types.any()) {
        log::debug("layer '%s' has no types set, deleting it", name.str().c_str());
        return remove(name);
    }

    auto state = retrieve(name);
    if (state.is_err()) return std::move(state).error();
    if (std::holds_alternative<LayerNotPresent>(state.value())) {
        return CnbError{CnbError::FrameworkMisuse,
            "cannot update layer '" + name.str() + "': no previous layer exists",
            "replace the layer when retrieve() reports it as not present"};
    }

    fs::path dir = layer_dir(name);
    fs::path toml_path = metadata_path(name);

    // Contents are modified in place: without metadata they read as not present
    CNBKIT_TRY(remove_file(name, toml_path));
    PartialLayerGuard guard(name, dir, toml_path);

    LayerOutput output;
    if (decision.update) {
        auto st = decision.update(dir, output);
        if (st.is_err()) {
            log::debug("updating layer '%s' failed", name.str().c_str());
            return std::move(st).error();
        }
    }

    // The update output replaces the previous SBOMs and exec.d programs
    CNBKIT_TRY(remove_layer_sboms(name, layers_dir_));
    CNBKIT_TRY(remove_layer_dir(name, dir / "exec.d"));
    CNBKIT_TRY(write_outputs(name, output));
    CNBKIT_TRY(write_metadata(name, decision.types, decision.metadata));

    guard.release();
    env_.contribute(name, std::move(output.env));

    return Result<FinalizedLayer>::ok(
        FinalizedLayer{name, FinalizedLayer::Updated, decision.types, dir});
}

Status LayerStore::write_outputs(const LayerName& name, LayerOutput& output) const {
    fs::path dir = layer_dir(name);
    output.env.add_layer_paths(dir);
    auto env_st = output.env.write_to_layer_dir(dir);
    if (env_st.is_err()) return store_error(name, "writing env", std::move(env_st).error());

    for (const auto& sbom : output.sboms) {
        auto st = write_file(sbom_path(sbom.format, layers_dir_, name.str()), sbom.data);
        if (st.is_err()) return store_error(name, "writing SBOM", std::move(st).error());
    }

    return write_exec_d(name, dir, output.exec_d);
}

Result<FinalizedLayer> LayerStore::remove(const LayerName& name) {
    CNBKIT_TRY(remove_file(name, metadata_path(name)));
    CNBKIT_TRY(remove_layer_dir(name, layer_dir(name)));
    CNBKIT_TRY(remove_layer_sboms(name, layers_dir_));
    env_.remove(name);

    return Result<FinalizedLayer>::ok(
        FinalizedLayer{name, FinalizedLayer::Deleted, LayerTypes{}, layer_dir(name)});
}

} // namespace cnbkit
