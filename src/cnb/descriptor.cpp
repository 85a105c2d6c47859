#include <cnbkit/descriptor.hpp>
#include <cnbkit/toml_file.hpp>

namespace fs = std::filesystem;

namespace cnbkit {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static CnbError descriptor_error(const std::string& msg) {
    return CnbError{CnbError::Contract, "invalid buildpack.toml: " + msg};
}

static std::vector<std::string> string_array(const toml::node_view<const toml::node>& node) {
    std::vector<std::string> out;
    if (auto arr = node.as_array()) {
        for (const auto& elem : *arr) {
            if (auto s = elem.value<std::string>()) {
                out.push_back(std::string(*s));
            }
        }
    }
    return out;
}

static Result<BuildpackInfo> parse_buildpack_info(const toml::table& tbl) {
    BuildpackInfo info;

    auto id_str = tbl["id"].value<std::string>();
    if (!id_str) return descriptor_error("[buildpack] is missing 'id'");
    auto id = BuildpackId::parse(*id_str);
    if (id.is_err()) return descriptor_error(id.error().message);
    info.id = std::move(id).value();

    if (auto v = tbl["name"].value<std::string>()) info.name = *v;

    auto version_str = tbl["version"].value<std::string>();
    if (!version_str) return descriptor_error("[buildpack] is missing 'version'");
    auto version = Version::parse(*version_str);
    if (version.is_err()) return descriptor_error(version.error().message);
    info.version = std::move(version).value();

    if (auto v = tbl["homepage"].value<std::string>()) info.homepage = *v;
    if (auto v = tbl["clear-env"].value<bool>()) info.clear_env = *v;
    if (auto v = tbl["description"].value<std::string>()) info.description = *v;
    info.keywords = string_array(tbl["keywords"]);

    if (auto arr = tbl["licenses"].as_array()) {
        for (const auto& elem : *arr) {
            auto lt = elem.as_table();
            if (!lt) return descriptor_error("[[buildpack.licenses]] entries must be tables");
            License license;
            if (auto v = (*lt)["type"].value<std::string>()) license.type = *v;
            if (auto v = (*lt)["uri"].value<std::string>()) license.uri = *v;
            if (!license.type && !license.uri) {
                return descriptor_error("a license needs at least one of 'type' or 'uri'");
            }
            info.licenses.push_back(std::move(license));
        }
    }

    return Result<BuildpackInfo>::ok(std::move(info));
}

static Result<TargetSpec> parse_target(const toml::table& tbl) {
    TargetSpec target;
    if (auto v = tbl["os"].value<std::string>()) target.os = *v;
    if (auto v = tbl["arch"].value<std::string>()) target.arch = *v;
    if (auto v = tbl["variant"].value<std::string>()) target.variant = *v;

    if (auto arr = tbl["distros"].as_array()) {
        for (const auto& elem : *arr) {
            auto dt = elem.as_table();
            if (!dt) return descriptor_error("[[targets.distros]] entries must be tables");
            Distro distro;
            auto name = (*dt)["name"].value<std::string>();
            auto version = (*dt)["version"].value<std::string>();
            if (!name || !version) {
                return descriptor_error("target distros need both 'name' and 'version'");
            }
            distro.name = *name;
            distro.version = *version;
            target.distros.push_back(std::move(distro));
        }
    }
    return Result<TargetSpec>::ok(std::move(target));
}

static Result<Order> parse_order(const toml::table& tbl) {
    Order order;
    auto groups = tbl["group"].as_array();
    if (!groups) return descriptor_error("[[order]] is missing [[order.group]]");

    for (const auto& elem : *groups) {
        auto gt = elem.as_table();
        if (!gt) return descriptor_error("[[order.group]] entries must be tables");

        OrderGroup group;
        auto id_str = (*gt)["id"].value<std::string>();
        if (!id_str) return descriptor_error("order group is missing 'id'");
        auto id = BuildpackId::parse(*id_str);
        if (id.is_err()) return descriptor_error(id.error().message);
        group.id = std::move(id).value();

        auto version_str = (*gt)["version"].value<std::string>();
        if (!version_str) {
            return descriptor_error("order group '" + *id_str + "' is missing 'version'");
        }
        auto version = Version::parse(*version_str);
        if (version.is_err()) return descriptor_error(version.error().message);
        group.version = std::move(version).value();

        if (auto v = (*gt)["optional"].value<bool>()) group.optional = *v;
        order.group.push_back(std::move(group));
    }
    return Result<Order>::ok(std::move(order));
}

// ---------------------------------------------------------------------------
// BuildpackDescriptor::parse
// ---------------------------------------------------------------------------

Result<BuildpackDescriptor> BuildpackDescriptor::parse(const std::string& toml_str) {
    auto parsed = parse_toml_string(toml_str, "buildpack.toml");
    if (parsed.is_err()) {
        CnbError e = std::move(parsed).error();
        e.code = CnbError::Contract;
        return e;
    }
    const toml::table& doc = parsed.value();

    BuildpackDescriptor d;

    auto api_str = doc["api"].value<std::string>();
    if (!api_str) return descriptor_error("missing top-level 'api' key");
    auto api = BuildpackApi::parse(*api_str);
    if (api.is_err()) return descriptor_error(api.error().message);
    d.api = api.value();

    auto bp = doc["buildpack"].as_table();
    if (!bp) return descriptor_error("missing [buildpack] section");
    auto info = parse_buildpack_info(*bp);
    if (info.is_err()) return std::move(info).error();
    d.buildpack = std::move(info).value();

    // [[targets]]
    if (auto arr = doc["targets"].as_array()) {
        for (const auto& elem : *arr) {
            auto tt = elem.as_table();
            if (!tt) return descriptor_error("[[targets]] entries must be tables");
            auto target = parse_target(*tt);
            if (target.is_err()) return std::move(target).error();
            d.targets.push_back(std::move(target).value());
        }
    }

    // [[stacks]]
    if (auto arr = doc["stacks"].as_array()) {
        for (const auto& elem : *arr) {
            auto st = elem.as_table();
            if (!st) return descriptor_error("[[stacks]] entries must be tables");
            Stack stack;
            auto id = (*st)["id"].value<std::string>();
            if (!id || id->empty()) return descriptor_error("stack is missing 'id'");
            stack.id = *id;
            stack.mixins = string_array((*st)["mixins"]);
            if (stack.id == "*" && !stack.mixins.empty()) {
                return descriptor_error("the any-stack '*' cannot declare mixins");
            }
            d.stacks.push_back(std::move(stack));
        }
    }

    // [[order]]
    if (auto arr = doc["order"].as_array()) {
        for (const auto& elem : *arr) {
            auto ot = elem.as_table();
            if (!ot) return descriptor_error("[[order]] entries must be tables");
            auto order = parse_order(*ot);
            if (order.is_err()) return std::move(order).error();
            d.order.push_back(std::move(order).value());
        }
    }

    if (!d.order.empty() && (!d.targets.empty() || !d.stacks.empty())) {
        return CnbError{CnbError::Contract,
            "invalid buildpack.toml: 'order' cannot be combined with 'targets' or 'stacks'",
            "a composite buildpack declares [[order]]; a component buildpack declares [[targets]]"};
    }

    if (auto md = doc["metadata"].as_table()) {
        d.metadata = *md;
    }

    return Result<BuildpackDescriptor>::ok(std::move(d));
}

Result<BuildpackDescriptor> BuildpackDescriptor::load(const fs::path& path) {
    auto contents = read_file(path);
    if (contents.is_err()) {
        return CnbError{CnbError::Contract,
            "cannot read buildpack descriptor: " + contents.error().message};
    }
    auto d = BuildpackDescriptor::parse(contents.value());
    if (d.is_err() && d.error().file.empty()) {
        d.error().file = path.string();
    }
    return d;
}

bool BuildpackDescriptor::is_composite() const {
    return !order.empty();
}

Result<BuildpackApi> read_buildpack_api(const fs::path& buildpack_dir) {
    fs::path path = buildpack_dir / "buildpack.toml";
    auto doc = read_toml_file(path);
    if (doc.is_err()) {
        return CnbError{CnbError::Contract,
            "unable to determine Buildpack API version: " + doc.error().message};
    }
    auto api_str = doc.value()["api"].value<std::string>();
    if (!api_str) {
        return CnbError{CnbError::Contract,
            "unable to determine Buildpack API version: 'api' is missing in " + path.string()};
    }
    auto api = BuildpackApi::parse(*api_str);
    if (api.is_err()) {
        return CnbError{CnbError::Contract,
            "unable to determine Buildpack API version: " + api.error().message};
    }
    return api;
}

} // namespace cnbkit
