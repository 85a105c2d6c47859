#pragma once

#include <cnbkit/result.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace cnbkit {

// [[provides]] entry
struct Provide {
    std::string name;

    bool operator==(const Provide& o) const { return name == o.name; }
};

// [[requires]] entry with optional author metadata
struct Require {
    std::string name;
    toml::table metadata;

    explicit Require(std::string n) : name(std::move(n)) {}

    // Attach metadata, e.g. Require("jdk").with_metadata(tbl)
    Require& with_metadata(toml::table tbl);

    bool operator==(const Require& o) const;
};

// An [[or]] alternative: one more provides/requires set the lifecycle
// may select instead of the primary one.
struct Or {
    std::vector<Provide> provides;
    std::vector<Require> requires_;
};

// Detect output: the buildpack's contribution to the group build plan
struct BuildPlan {
    std::vector<Provide> provides;
    std::vector<Require> requires_;
    std::vector<Or> ors;

    bool empty() const;
    toml::table to_toml() const;
    static Result<BuildPlan> from_toml(const toml::table& tbl);
};

// Collects provides/requires; each or_() call closes the current set and
// starts an alternative. The first set becomes the primary plan.
class BuildPlanBuilder {
public:
    BuildPlanBuilder& provides(const std::string& name);
    BuildPlanBuilder& requires_(const std::string& name);
    BuildPlanBuilder& requires_(Require require);
    BuildPlanBuilder& or_();

    // Empty names are rejected here rather than when the plan is written
    Result<BuildPlan> build();

private:
    struct Set {
        std::vector<Provide> provides;
        std::vector<Require> requires_;
    };
    std::vector<Set> done_;
    Set current_;
};

// Build input: the entries the lifecycle resolved for this buildpack
struct BuildpackPlanEntry {
    std::string name;
    toml::table metadata;
};

struct BuildpackPlan {
    std::vector<BuildpackPlanEntry> entries;

    static Result<BuildpackPlan> parse(const std::string& toml_str);
    static Result<BuildpackPlan> load(const std::filesystem::path& path);

    bool contains(const std::string& name) const;
};

} // namespace cnbkit
