#include <catch2/catch.hpp>
#include <cnbkit/build_plan.hpp>
#include <cnbkit/detect.hpp>
#include <cnbkit/toml_file.hpp>
#include "test_support.hpp"

using namespace cnbkit;

// ===== BuildPlanBuilder =====

TEST_CASE("builder collects provides and requires", "[build_plan]") {
    toml::table md{{"version", "21"}};
    auto r = BuildPlanBuilder{}
        .provides("jdk")
        .requires_(Require("jdk").with_metadata(md))
        .requires_("maven")
        .build();
    REQUIRE(r.is_ok());
    auto& plan = r.value();
    REQUIRE(plan.provides.size() == 1);
    REQUIRE(plan.provides[0].name == "jdk");
    REQUIRE(plan.requires_.size() == 2);
    REQUIRE(plan.requires_[0].metadata["version"].value<std::string>().value() == "21");
    REQUIRE(plan.ors.empty());
}

TEST_CASE("or_() starts an alternative", "[build_plan]") {
    auto r = BuildPlanBuilder{}
        .provides("node").requires_("node")
        .or_()
        .requires_("node")
        .build();
    REQUIRE(r.is_ok());
    auto& plan = r.value();
    REQUIRE(plan.provides.size() == 1);
    REQUIRE(plan.ors.size() == 1);
    REQUIRE(plan.ors[0].provides.empty());
    REQUIRE(plan.ors[0].requires_.size() == 1);
}

TEST_CASE("empty builder yields an empty plan", "[build_plan]") {
    auto r = BuildPlanBuilder{}.build();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
    REQUIRE(r.value().to_toml().empty());
}

TEST_CASE("empty entry names are rejected by the builder", "[build_plan]") {
    auto r = BuildPlanBuilder{}.provides("").build();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CnbError::FrameworkMisuse);
}

// ===== Wire format =====

TEST_CASE("plan serializes to provides/requires/or tables", "[build_plan]") {
    auto plan = BuildPlanBuilder{}
        .provides("jdk")
        .requires_(Require("jdk").with_metadata(toml::table{{"build", true}}))
        .or_()
        .provides("jre")
        .build().value();

    auto text = to_toml_string(plan.to_toml());
    auto reparsed = parse_toml_string(text, "plan.toml");
    REQUIRE(reparsed.is_ok());
    auto& tbl = reparsed.value();
    REQUIRE(tbl["provides"][0]["name"].value<std::string>().value() == "jdk");
    REQUIRE(tbl["requires"][0]["name"].value<std::string>().value() == "jdk");
    REQUIRE(tbl["requires"][0]["metadata"]["build"].value<bool>().value());
    REQUIRE(tbl["or"][0]["provides"][0]["name"].value<std::string>().value() == "jre");

    auto back = BuildPlan::from_toml(tbl);
    REQUIRE(back.is_ok());
    REQUIRE(back.value().requires_ == plan.requires_);
    REQUIRE(back.value().ors.size() == 1);
}

TEST_CASE("plan entries without a name are rejected when read", "[build_plan]") {
    auto tbl = parse_toml_string("[[requires]]\nversion = \"1\"\n", "plan.toml");
    REQUIRE(tbl.is_ok());
    auto r = BuildPlan::from_toml(tbl.value());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CnbError::Parse);
}

// ===== Buildpack plan =====

TEST_CASE("parse buildpack plan entries", "[build_plan]") {
    auto r = BuildpackPlan::parse(R"(
[[entries]]
name = "jdk"
[entries.metadata]
version = "21"

[[entries]]
name = "maven"
)");
    REQUIRE(r.is_ok());
    auto& plan = r.value();
    REQUIRE(plan.entries.size() == 2);
    REQUIRE(plan.entries[0].metadata["version"].value<std::string>().value() == "21");
    REQUIRE(plan.entries[1].metadata.empty());
    REQUIRE(plan.contains("maven"));
    REQUIRE_FALSE(plan.contains("gradle"));
}

TEST_CASE("load buildpack plan from disk", "[build_plan]") {
    TempDir td;
    td.write_file("plan.toml", "");
    auto empty = BuildpackPlan::load(td.path / "plan.toml");
    REQUIRE(empty.is_ok());
    REQUIRE(empty.value().entries.empty());

    td.write_file("bad.toml", "[[entries]]\nversion = 1\n");
    auto bad = BuildpackPlan::load(td.path / "bad.toml");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().file == (td.path / "bad.toml").string());

    REQUIRE(BuildpackPlan::load(td.path / "missing.toml").is_err());
}

// ===== Detect results =====

TEST_CASE("pass with and without a plan", "[build_plan][detect]") {
    auto bare = DetectResultBuilder::pass().build();
    REQUIRE(bare.is_ok());
    auto* pass = std::get_if<DetectPass>(&bare.value());
    REQUIRE(pass != nullptr);
    REQUIRE_FALSE(pass->plan.has_value());

    auto plan = BuildPlanBuilder{}.provides("jdk").build().value();
    auto with_plan = DetectResultBuilder::pass().build_plan(plan).build();
    REQUIRE(std::get<DetectPass>(with_plan.value()).plan->provides.size() == 1);
}

TEST_CASE("fail with and without a reason", "[build_plan][detect]") {
    auto bare = DetectResultBuilder::fail().build();
    REQUIRE_FALSE(std::get<DetectFail>(bare.value()).reason.has_value());

    auto reasoned = DetectResultBuilder::fail_with_message("no pom.xml").build();
    REQUIRE(std::get<DetectFail>(reasoned.value()).reason.value() == "no pom.xml");
}

TEST_CASE("pass rejects an empty or alternative", "[build_plan][detect]") {
    BuildPlan plan;
    plan.provides.push_back(Provide{"jdk"});
    plan.ors.push_back(Or{});
    auto r = DetectResultBuilder::pass().build_plan(plan).build();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CnbError::FrameworkMisuse);
}
