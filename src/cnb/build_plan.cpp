#include <cnbkit/build_plan.hpp>
#include <cnbkit/toml_file.hpp>

namespace fs = std::filesystem;

namespace cnbkit {

// ---------------------------------------------------------------------------
// Require
// ---------------------------------------------------------------------------

Require& Require::with_metadata(toml::table tbl) {
    metadata = std::move(tbl);
    return *this;
}

bool Require::operator==(const Require& o) const {
    return name == o.name && metadata == o.metadata;
}

// ---------------------------------------------------------------------------
// BuildPlan serialization
// ---------------------------------------------------------------------------

static toml::array provides_to_toml(const std::vector<Provide>& provides) {
    toml::array arr;
    for (const auto& p : provides) {
        arr.push_back(toml::table{{"name", p.name}});
    }
    return arr;
}

static toml::array requires_to_toml(const std::vector<Require>& reqs) {
    toml::array arr;
    for (const auto& r : reqs) {
        toml::table t{{"name", r.name}};
        if (!r.metadata.empty()) {
            t.insert("metadata", r.metadata);
        }
        arr.push_back(std::move(t));
    }
    return arr;
}

bool BuildPlan::empty() const {
    return provides.empty() && requires_.empty() && ors.empty();
}

toml::table BuildPlan::to_toml() const {
    toml::table tbl;
    if (!provides.empty()) tbl.insert("provides", provides_to_toml(provides));
    if (!requires_.empty()) tbl.insert("requires", requires_to_toml(requires_));
    if (!ors.empty()) {
        toml::array arr;
        for (const auto& alt : ors) {
            toml::table t;
            if (!alt.provides.empty()) t.insert("provides", provides_to_toml(alt.provides));
            if (!alt.requires_.empty()) t.insert("requires", requires_to_toml(alt.requires_));
            arr.push_back(std::move(t));
        }
        tbl.insert("or", std::move(arr));
    }
    return tbl;
}

static Status read_entries(const toml::table& tbl, std::vector<Provide>& provides,
                           std::vector<Require>& reqs) {
    if (auto arr = tbl["provides"].as_array()) {
        for (const auto& elem : *arr) {
            auto t = elem.as_table();
            auto name = t ? (*t)["name"].value<std::string>() : std::nullopt;
            if (!name) {
                return CnbError{CnbError::Parse, "[[provides]] entry is missing 'name'"};
            }
            provides.push_back(Provide{*name});
        }
    }
    if (auto arr = tbl["requires"].as_array()) {
        for (const auto& elem : *arr) {
            auto t = elem.as_table();
            auto name = t ? (*t)["name"].value<std::string>() : std::nullopt;
            if (!name) {
                return CnbError{CnbError::Parse, "[[requires]] entry is missing 'name'"};
            }
            Require req(*name);
            if (auto md = (*t)["metadata"].as_table()) req.metadata = *md;
            reqs.push_back(std::move(req));
        }
    }
    return ok_status();
}

Result<BuildPlan> BuildPlan::from_toml(const toml::table& tbl) {
    BuildPlan plan;
    CNBKIT_TRY(read_entries(tbl, plan.provides, plan.requires_));
    if (auto arr = tbl["or"].as_array()) {
        for (const auto& elem : *arr) {
            auto t = elem.as_table();
            if (!t) return CnbError{CnbError::Parse, "[[or]] entries must be tables"};
            Or alt;
            CNBKIT_TRY(read_entries(*t, alt.provides, alt.requires_));
            plan.ors.push_back(std::move(alt));
        }
    }
    return Result<BuildPlan>::ok(std::move(plan));
}

// ---------------------------------------------------------------------------
// BuildPlanBuilder
// ---------------------------------------------------------------------------

BuildPlanBuilder& BuildPlanBuilder::provides(const std::string& name) {
    current_.provides.push_back(Provide{name});
    return *this;
}

BuildPlanBuilder& BuildPlanBuilder::requires_(const std::string& name) {
    current_.requires_.emplace_back(name);
    return *this;
}

BuildPlanBuilder& BuildPlanBuilder::requires_(Require require) {
    current_.requires_.push_back(std::move(require));
    return *this;
}

BuildPlanBuilder& BuildPlanBuilder::or_() {
    done_.push_back(std::move(current_));
    current_ = Set{};
    return *this;
}

Result<BuildPlan> BuildPlanBuilder::build() {
    std::vector<Set> sets = done_;
    if (!current_.provides.empty() || !current_.requires_.empty() || sets.empty()) {
        sets.push_back(current_);
    }

    for (const auto& set : sets) {
        for (const auto& p : set.provides) {
            if (p.name.empty()) {
                return CnbError{CnbError::FrameworkMisuse, "build plan provide has an empty name"};
            }
        }
        for (const auto& r : set.requires_) {
            if (r.name.empty()) {
                return CnbError{CnbError::FrameworkMisuse, "build plan require has an empty name"};
            }
        }
    }

    BuildPlan plan;
    plan.provides = std::move(sets[0].provides);
    plan.requires_ = std::move(sets[0].requires_);
    for (size_t i = 1; i < sets.size(); ++i) {
        plan.ors.push_back(Or{std::move(sets[i].provides), std::move(sets[i].requires_)});
    }
    return Result<BuildPlan>::ok(std::move(plan));
}

// ---------------------------------------------------------------------------
// BuildpackPlan
// ---------------------------------------------------------------------------

Result<BuildpackPlan> BuildpackPlan::parse(const std::string& toml_str) {
    auto parsed = parse_toml_string(toml_str, "buildpack plan");
    if (parsed.is_err()) return std::move(parsed).error();

    BuildpackPlan plan;
    if (auto arr = parsed.value()["entries"].as_array()) {
        for (const auto& elem : *arr) {
            auto t = elem.as_table();
            auto name = t ? (*t)["name"].value<std::string>() : std::nullopt;
            if (!name) {
                return CnbError{CnbError::Parse, "buildpack plan entry is missing 'name'"};
            }
            BuildpackPlanEntry entry;
            entry.name = *name;
            if (auto md = (*t)["metadata"].as_table()) entry.metadata = *md;
            plan.entries.push_back(std::move(entry));
        }
    }
    return Result<BuildpackPlan>::ok(std::move(plan));
}

Result<BuildpackPlan> BuildpackPlan::load(const fs::path& path) {
    auto contents = read_file(path);
    if (contents.is_err()) return std::move(contents).error();
    auto plan = BuildpackPlan::parse(contents.value());
    if (plan.is_err() && plan.error().file.empty()) {
        plan.error().file = path.string();
    }
    return plan;
}

bool BuildpackPlan::contains(const std::string& name) const {
    for (const auto& e : entries) {
        if (e.name == name) return true;
    }
    return false;
}

} // namespace cnbkit
