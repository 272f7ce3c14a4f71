#include <catch2/catch.hpp>
#include <skein/candidates.hpp>

using namespace skein;

static Version V(const char* s) { return Version::parse(s).value(); }
static Uuid U(const char* s) { return Uuid::from_string(s).value(); }

static AvailableVersion av(const char* ver, const char* hash) {
    AvailableVersion a;
    a.version = V(ver);
    a.hash = hash;
    return a;
}

TEST_CASE("candidates are keyed by identity", "[candidates]") {
    DependencyGraph g;
    g.packages["Baz"].emplace(V("1.0.0"), av("1.0.0", "aaa"));
    g.packages["Baz"].emplace(V("1.2.0"), av("1.2.0", "bbb"));
    g.packages["Qux"].emplace(V("0.1.0"), av("0.1.0", "ccc"));

    std::map<std::string, Uuid> uuids{
        {"Baz", U("1b3c7e2a-5d4f-4a8e-9c1b-2f3e4d5a6b70")},
        {"Qux", U("2c4d8f3b-6e5a-4b9f-8d2c-3a4f5e6b7c81")},
    };

    auto table = project_candidates(g, uuids);
    REQUIRE(table.size() == 2);

    const auto& baz = table.at(uuids.at("Baz"));
    REQUIRE(baz.size() == 2);
    REQUIRE(baz.at(V("1.0.0")) == "aaa");
    REQUIRE(baz.at(V("1.2.0")) == "bbb");
    REQUIRE(table.at(uuids.at("Qux")).at(V("0.1.0")) == "ccc");
}

TEST_CASE("names without an identity are skipped", "[candidates]") {
    DependencyGraph g;
    g.packages["Baz"].emplace(V("1.0.0"), av("1.0.0", "aaa"));
    g.packages["Orphan"].emplace(V("1.0.0"), av("1.0.0", "ddd"));

    std::map<std::string, Uuid> uuids{
        {"Baz", U("1b3c7e2a-5d4f-4a8e-9c1b-2f3e4d5a6b70")},
    };
    auto table = project_candidates(g, uuids);
    REQUIRE(table.size() == 1);
}

TEST_CASE("package with no surviving versions keeps an empty entry", "[candidates]") {
    DependencyGraph g;
    g.packages["Baz"];

    std::map<std::string, Uuid> uuids{
        {"Baz", U("1b3c7e2a-5d4f-4a8e-9c1b-2f3e4d5a6b70")},
    };
    auto table = project_candidates(g, uuids);
    REQUIRE(table.size() == 1);
    REQUIRE(table.begin()->second.empty());
}

TEST_CASE("graph lookups", "[candidates]") {
    DependencyGraph g;
    g.packages["Baz"].emplace(V("1.0.0"), av("1.0.0", "aaa"));
    g.packages["Qux"].emplace(V("0.1.0"), av("0.1.0", "ccc"));
    g.packages["Qux"].emplace(V("0.2.0"), av("0.2.0", "ddd"));

    REQUIRE(g.contains("Baz"));
    REQUIRE_FALSE(g.contains("Foo"));
    REQUIRE(g.find("Qux", V("0.2.0"))->hash == "ddd");
    REQUIRE(g.find("Qux", V("0.3.0")) == nullptr);
    REQUIRE(g.find("Foo", V("0.1.0")) == nullptr);
    REQUIRE(g.version_count() == 3);
}

TEST_CASE("graph renders as sorted TOML", "[candidates]") {
    DependencyGraph g;
    auto qux = av("0.1.0", "ccc");
    g.packages["Qux"].emplace(V("0.1.0"), qux);
    auto baz = av("1.0.0", "aaa");
    baz.deps.emplace("Qux", U("2c4d8f3b-6e5a-4b9f-8d2c-3a4f5e6b7c81"));
    g.packages["Baz"].emplace(V("1.0.0"), baz);

    std::string text = g.to_toml();
    auto baz_at = text.find("[Baz");
    auto qux_at = text.find("[Qux");
    REQUIRE(baz_at != std::string::npos);
    REQUIRE(qux_at != std::string::npos);
    REQUIRE(baz_at < qux_at);
    REQUIRE(text.find("hash-sha1") != std::string::npos);
    REQUIRE(text.find("aaa") != std::string::npos);
    REQUIRE(text.find("2c4d8f3b-6e5a-4b9f-8d2c-3a4f5e6b7c81") != std::string::npos);
    REQUIRE(text.find("compat") == std::string::npos);
}
