#include <catch2/catch.hpp>
#include <cnbkit/env_accumulator.hpp>
#include "test_support.hpp"

using namespace cnbkit;

static LayerName name(const char* s) {
    return LayerName::parse(s).value();
}

static LayerEnv prepend_path(const std::string& dir) {
    LayerEnv env;
    env.insert(Scope::all(), ModificationBehavior::Prepend, "PATH", dir);
    return env;
}

static Env base() {
    Env env;
    env.insert("PATH", "/usr/bin");
    return env;
}

TEST_CASE("later layer's prepend lands in front", "[env_accumulator]") {
    EnvAccumulator acc;
    acc.contribute(name("a"), prepend_path("/a"));
    acc.contribute(name("b"), prepend_path("/b"));
    REQUIRE(acc.apply(Scope::build(), base()).get("PATH").value() == "/b:/a:/usr/bin");
}

TEST_CASE("order follows layer names, not contribution order", "[env_accumulator]") {
    EnvAccumulator acc;
    acc.contribute(name("b"), prepend_path("/b"));
    acc.contribute(name("a"), prepend_path("/a"));
    REQUIRE(acc.apply(Scope::build(), base()).get("PATH").value() == "/b:/a:/usr/bin");
    REQUIRE(acc.apply(Scope::launch(), base()).get("PATH").value() == "/b:/a:/usr/bin");
}

TEST_CASE("appends stack in layer-name order", "[env_accumulator]") {
    EnvAccumulator acc;
    LayerEnv first;
    first.insert(Scope::build(), ModificationBehavior::Append, "OPTS", "-x")
         .delimiter(Scope::build(), "OPTS", " ");
    LayerEnv second;
    second.insert(Scope::build(), ModificationBehavior::Append, "OPTS", "-y")
          .delimiter(Scope::build(), "OPTS", " ");
    acc.contribute(name("zz"), second);
    acc.contribute(name("aa"), first);

    auto env = acc.apply(Scope::build(), Env{});
    REQUIRE(env.get("OPTS").value() == "-x -y");
    REQUIRE_FALSE(acc.apply(Scope::launch(), Env{}).contains("OPTS"));
}

TEST_CASE("a later default keeps an earlier override", "[env_accumulator]") {
    EnvAccumulator acc;
    LayerEnv jdk;
    jdk.insert(Scope::all(), ModificationBehavior::Override, "JAVA_HOME", "/layers/jdk");
    LayerEnv jre;
    jre.insert(Scope::all(), ModificationBehavior::Default, "JAVA_HOME", "/layers/jre");
    acc.contribute(name("jdk"), jdk);
    acc.contribute(name("jre"), jre);
    REQUIRE(acc.apply(Scope::launch(), Env{}).get("JAVA_HOME").value() == "/layers/jdk");
}

TEST_CASE("contributing a layer twice replaces it", "[env_accumulator]") {
    EnvAccumulator acc;
    acc.contribute(name("a"), prepend_path("/old"));
    acc.contribute(name("a"), prepend_path("/new"));
    REQUIRE(acc.contributions().size() == 1);
    REQUIRE(acc.apply(Scope::build(), base()).get("PATH").value() == "/new:/usr/bin");

    REQUIRE(acc.remove(name("a")));
    REQUIRE(acc.empty());
    REQUIRE(acc.apply(Scope::build(), base()) == base());
}

TEST_CASE("write_to_disk rewrites each layer's env dir", "[env_accumulator]") {
    TempDir td;
    fs::create_directories(td.path / "a");
    fs::create_directories(td.path / "b");
    td.write_file("b/env.build/STALE", "x");

    EnvAccumulator acc;
    LayerEnv a;
    a.insert(Scope::build(), ModificationBehavior::Override, "A", "1");
    LayerEnv b;
    b.insert(Scope::all(), ModificationBehavior::Prepend, "PATH", "/b");
    acc.contribute(name("a"), a);
    acc.contribute(name("b"), b);

    REQUIRE(acc.write_to_disk(Scope::build(), td.path).is_ok());
    REQUIRE(td.read_file("a/env.build/A") == "1");
    REQUIRE_FALSE(td.exists("b/env.build"));

    REQUIRE(acc.write_to_disk(td.path).is_ok());
    REQUIRE(td.read_file("b/env/PATH.prepend") == "/b");
    REQUIRE(td.read_file("a/env.build/A") == "1");
}

TEST_CASE("write_to_disk fails for a missing layer directory", "[env_accumulator]") {
    TempDir td;
    EnvAccumulator acc;
    acc.contribute(name("gone"), prepend_path("/x"));
    auto st = acc.write_to_disk(td.path);
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == CnbError::IO);
    REQUIRE(st.error().message.find("'gone'") != std::string::npos);
}
