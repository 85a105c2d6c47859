#include <catch2/catch.hpp>
#include <cnbkit/descriptor.hpp>
#include "test_support.hpp"

using namespace cnbkit;

// ===== Component buildpacks =====

TEST_CASE("load component buildpack descriptor", "[descriptor]") {
    auto r = BuildpackDescriptor::load(fixture_dir() + "/buildpacks/jvm/buildpack.toml");
    REQUIRE(r.is_ok());
    auto& d = r.value();
    REQUIRE(d.api == SUPPORTED_BUILDPACK_API);
    REQUIRE(d.buildpack.id.str() == "examples/jvm");
    REQUIRE(d.buildpack.name == "JVM");
    REQUIRE(d.buildpack.version.to_string() == "3.2.1");
    REQUIRE(d.buildpack.homepage.value() == "https://example.com/jvm");
    REQUIRE(d.buildpack.keywords.size() == 2);
    REQUIRE(d.buildpack.licenses.size() == 1);
    REQUIRE(d.buildpack.licenses[0].type.value() == "BSD-3-Clause");
    REQUIRE_FALSE(d.buildpack.clear_env);
    REQUIRE_FALSE(d.is_composite());

    REQUIRE(d.targets.size() == 2);
    REQUIRE(d.targets[0].os.value() == "linux");
    REQUIRE(d.targets[0].distros.size() == 1);
    REQUIRE(d.targets[0].distros[0].version == "24.04");
    REQUIRE(d.targets[1].variant.value() == "v8");

    REQUIRE(d.metadata["default-version"].value<std::string>().value() == "21");
}

TEST_CASE("load composite buildpack descriptor", "[descriptor]") {
    auto r = BuildpackDescriptor::load(fixture_dir() + "/buildpacks/composite/buildpack.toml");
    REQUIRE(r.is_ok());
    auto& d = r.value();
    REQUIRE(d.is_composite());
    REQUIRE(d.order.size() == 1);
    REQUIRE(d.order[0].group.size() == 2);
    REQUIRE(d.order[0].group[0].id.str() == "examples/jvm");
    REQUIRE_FALSE(d.order[0].group[0].optional);
    REQUIRE(d.order[0].group[1].optional);
}

TEST_CASE("legacy stacks are accepted", "[descriptor]") {
    auto r = BuildpackDescriptor::parse(R"(
api = "0.10"
[buildpack]
id = "examples/legacy"
version = "0.1.0"
clear-env = true

[[stacks]]
id = "io.buildpacks.stacks.jammy"
mixins = ["build:git"]

[[stacks]]
id = "*"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stacks.size() == 2);
    REQUIRE(r.value().stacks[0].mixins[0] == "build:git");
    REQUIRE(r.value().buildpack.clear_env);
}

// ===== Validation =====

TEST_CASE("order combined with targets is rejected", "[descriptor]") {
    auto r = BuildpackDescriptor::parse(R"(
api = "0.10"
[buildpack]
id = "examples/bad"
version = "1.0.0"

[[targets]]
os = "linux"

[[order]]
[[order.group]]
id = "examples/jvm"
version = "1.0.0"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CnbError::Contract);
    REQUIRE(r.error().message.find("'order' cannot be combined") != std::string::npos);
}

TEST_CASE("order combined with stacks is rejected", "[descriptor]") {
    auto r = BuildpackDescriptor::parse(R"(
api = "0.10"
[buildpack]
id = "examples/bad"
version = "1.0.0"

[[stacks]]
id = "*"

[[order]]
[[order.group]]
id = "examples/jvm"
version = "1.0.0"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CnbError::Contract);
}

TEST_CASE("descriptor schema errors", "[descriptor]") {
    // missing api
    REQUIRE(BuildpackDescriptor::parse(R"(
[buildpack]
id = "a/b"
version = "1.0.0"
)").is_err());

    // invalid id
    REQUIRE(BuildpackDescriptor::parse(R"(
api = "0.10"
[buildpack]
id = "app"
version = "1.0.0"
)").is_err());

    // version is not major.minor.micro
    REQUIRE(BuildpackDescriptor::parse(R"(
api = "0.10"
[buildpack]
id = "a/b"
version = "1.0"
)").is_err());

    // any-stack with mixins
    REQUIRE(BuildpackDescriptor::parse(R"(
api = "0.10"
[buildpack]
id = "a/b"
version = "1.0.0"
[[stacks]]
id = "*"
mixins = ["git"]
)").is_err());

    auto r = BuildpackDescriptor::parse("not [valid toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CnbError::Contract);
}

TEST_CASE("missing descriptor file", "[descriptor]") {
    TempDir td;
    auto r = BuildpackDescriptor::load(td.path / "buildpack.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CnbError::Contract);
}

// ===== API only =====

TEST_CASE("read_buildpack_api ignores the rest of the descriptor", "[descriptor]") {
    TempDir td;
    td.write_file("buildpack.toml", R"(
api = "0.7"
[buildpack]
id = "app"
)");
    auto r = read_buildpack_api(td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "0.7");
}

TEST_CASE("read_buildpack_api without api key", "[descriptor]") {
    TempDir td;
    td.write_file("buildpack.toml", "[buildpack]\nid = \"a/b\"\n");
    auto r = read_buildpack_api(td.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CnbError::Contract);
}
