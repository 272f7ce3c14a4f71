#include <catch2/catch.hpp>
#include <skein/collector.hpp>
#include "registry_fixture.hpp"

using namespace skein;

static Version V(const char* s) { return Version::parse(s).value(); }
static VersionSpec S(const char* s) { return VersionSpec::parse(s).value(); }

// Discovery plus identity resolution plus collection over one depot
struct Collection {
    RegistryIndexBuilder builder;
    Manifest manifest;
    IdentityResolver resolver;
    DependencyGraphCollector collector;
    IdentityResolution identities;

    Collection(const std::string& depot, Manifest m = {})
        : builder(RegistryIndexBuilder::discover({depot}).value()),
          manifest(std::move(m)),
          resolver(builder, manifest),
          collector(resolver) {}

    Result<DependencyGraph> run(const ResolutionRequest& request) {
        std::set<std::string> names;
        for (const auto& [name, spec] : request) names.insert(name);
        auto r = resolver.resolve(names);
        if (r.is_err()) return std::move(r).error();
        identities = std::move(r).value();
        return collector.collect(request, identities);
    }
};

TEST_CASE("requested versions are filtered by the spec", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {
        {"0.9.0", {}}, {"1.0.0", {}}, {"1.2.0", {}}, {"2.0.0", {}},
    }});

    Collection c(fx.depot());
    auto g = c.run({{"Baz", S(">=1.0.0, <2.0.0")}});
    REQUIRE(g.is_ok());

    const auto& versions = g.value().packages.at("Baz");
    REQUIRE(versions.size() == 2);
    REQUIRE(versions.count(V("1.0.0")) == 1);
    REQUIRE(versions.count(V("1.2.0")) == 1);
    REQUIRE(g.value().find("Baz", V("1.2.0"))->hash == fake_hash("Baz", "1.2.0"));
}

TEST_CASE("exact spec keeps one version", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {{"1.0.0", {}}, {"1.2.0", {}}}});

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::exact(V("1.0.0"))}});
    REQUIRE(g.is_ok());
    REQUIRE(g.value().version_count() == 1);
    REQUIRE(g.value().find("Baz", V("1.0.0")) != nullptr);
}

TEST_CASE("graph contains the transitive closure", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {
        {"1.0.0", {{"Qux", ids::Qux}}},
    }});
    fx.add_package("General", {"Qux", ids::Qux, {
        {"0.1.0", {}},
        {"0.2.0", {{"Foo", ids::Foo}}},
    }});
    fx.add_package("General", {"Foo", ids::Foo, {{"3.0.0", {}}}});
    fx.add_package("General", {"Unrelated", ids::Foo2, {{"1.0.0", {}}}});

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_ok());
    REQUIRE(g.value().packages.size() == 3);
    REQUIRE(g.value().contains("Qux"));
    REQUIRE(g.value().contains("Foo"));
    REQUIRE_FALSE(g.value().contains("Unrelated"));

    // transitive names are not filtered by version
    REQUIRE(g.value().packages.at("Qux").size() == 2);
    REQUIRE(c.identities.uuids.at("Foo").to_string() == ids::Foo);
}

TEST_CASE("dependencies of excluded versions are not expanded", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {
        {"1.0.0", {}},
        {"2.0.0", {{"Qux", ids::Qux}}},
    }});
    fx.add_package("General", {"Qux", ids::Qux, {{"1.0.0", {}}}});

    Collection c(fx.depot());
    auto g = c.run({{"Baz", S("<2")}});
    REQUIRE(g.is_ok());
    REQUIRE_FALSE(g.value().contains("Qux"));
}

TEST_CASE("versions requiring a different identity are excluded", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {
        {"1.0.0", {{"Qux", ids::Qux}}},
        {"2.0.0", {{"Qux", ids::Qux2}}},
    }});
    fx.add_package("General", {"Qux", ids::Qux, {{"1.0.0", {}}}});

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_ok());
    REQUIRE(g.value().find("Baz", V("1.0.0")) != nullptr);
    REQUIRE(g.value().find("Baz", V("2.0.0")) == nullptr);
}

TEST_CASE("installed identity drives exclusion", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("One");
    fx.add_registry("Two");
    fx.add_package("One", {"Bar", ids::BarA, {{"1.0.0", {}}}});
    fx.add_package("Two", {"Bar", ids::BarB, {{"1.0.0", {}}}});
    fx.add_package("One", {"Baz", ids::Baz, {
        {"1.0.0", {{"Bar", ids::BarA}}},
        {"1.1.0", {{"Bar", ids::BarB}}},
    }});

    auto manifest = Manifest::parse("[Bar]\nuuid = \"" + ids::BarB + "\"\n").value();
    Collection c(fx.depot(), manifest);
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_ok());
    REQUIRE(g.value().find("Baz", V("1.0.0")) == nullptr);
    REQUIRE(g.value().find("Baz", V("1.1.0")) != nullptr);
    REQUIRE(g.value().contains("Bar"));
}

TEST_CASE("unregistered dependency excludes the versions needing it", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {
        {"1.0.0", {}},
        {"1.1.0", {{"Ghost", ids::Foo}}},
    }});

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_ok());
    REQUIRE(g.value().find("Baz", V("1.0.0")) != nullptr);
    REQUIRE(g.value().find("Baz", V("1.1.0")) == nullptr);
    REQUIRE_FALSE(g.value().contains("Ghost"));
    REQUIRE((c.collector.unregistered() == std::set<std::string>{"Ghost"}));
}

TEST_CASE("ambiguous dependency is fatal", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("One");
    fx.add_registry("Two");
    fx.add_package("One", {"Bar", ids::BarA, {{"1.0.0", {}}}});
    fx.add_package("Two", {"Bar", ids::BarB, {{"1.0.0", {}}}});
    fx.add_package("One", {"Baz", ids::Baz, {{"1.0.0", {{"Bar", ids::BarA}}}}});

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == SkeinError::Ambiguous);
}

TEST_CASE("installed dependency missing from registries is inconsistent", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {{"1.0.0", {{"Qux", ids::Qux}}}}});

    auto manifest = Manifest::parse("[Qux]\nuuid = \"" + ids::Qux + "\"\n").value();
    Collection c(fx.depot(), manifest);
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == SkeinError::Inconsistent);
}

TEST_CASE("versions merge across locations, first location wins", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_registry("Mirror");
    fx.add_package("General", {"Baz", ids::Baz, {{"1.0.0", {}}}});
    auto mirror = fx.add_package("Mirror", {"Baz", ids::Baz, {{"1.0.0", {}}, {"1.1.0", {}}}});
    fx.td.write_file(fs::relative(mirror, fx.td.path) / "versions.toml",
        "[\"1.0.0\"]\nhash-sha1 = \"mirror-hash\"\n"
        "[\"1.1.0\"]\nhash-sha1 = \"mirror-only\"\n");

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_ok());
    REQUIRE(g.value().packages.at("Baz").size() == 2);
    REQUIRE(g.value().find("Baz", V("1.0.0"))->hash == fake_hash("Baz", "1.0.0"));
    REQUIRE(g.value().find("Baz", V("1.1.0"))->hash == "mirror-only");
}

TEST_CASE("compatibility entries pass through", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    auto dir = fx.add_package("General", {"Baz", ids::Baz, {{"1.0.0", {}}}});
    fx.td.write_file(fs::relative(dir, fx.td.path) / "compatibility.toml",
        "[\"1.0.0\"]\njulia = \"1.6\"\n");

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_ok());
    REQUIRE(g.value().find("Baz", V("1.0.0"))->compat.at("julia") == "1.6");
}

TEST_CASE("version without requirements entry has no dependencies", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    auto dir = fx.add_package("General", {"Baz", ids::Baz, {{"1.0.0", {}}}});
    fx.td.write_file(fs::relative(dir, fx.td.path) / "requirements.toml", "");

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_ok());
    REQUIRE(g.value().find("Baz", V("1.0.0"))->deps.empty());
}

TEST_CASE("build-tagged versions are collected", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {{"1.0.0", {{"Qux", ids::Qux}}}}});
    fx.add_package("General", {"Qux", ids::Qux, {
        {"2.1.0+0", {}},
        {"2.1.0+1", {}},
        {"3.0.0+0", {}},
    }});

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::any()}, {"Qux", S("^2.1")}});
    REQUIRE(g.is_ok());

    const auto& qux = g.value().packages.at("Qux");
    REQUIRE(qux.size() == 2);
    REQUIRE(qux.rbegin()->first.to_string() == "2.1.0+1");
    REQUIRE(g.value().find("Qux", V("2.1.0+0"))->hash == fake_hash("Qux", "2.1.0+0"));
}

TEST_CASE("malformed metadata aborts collection", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {{"1.0.0", {{"Qux", ids::Qux}}}}});
    auto qux = fx.add_package("General", {"Qux", ids::Qux, {{"1.0.0", {}}}});
    fs::remove(qux / "versions.toml");

    Collection c(fx.depot());
    auto g = c.run({{"Baz", VersionSpec::any()}});
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == SkeinError::MalformedMetadata);
    REQUIRE(g.error().is_registry_fault());
}

TEST_CASE("collection is idempotent", "[collector]") {
    RegistryFixture fx;
    fx.add_registry("General");
    fx.add_package("General", {"Baz", ids::Baz, {
        {"1.0.0", {{"Qux", ids::Qux}}},
        {"2.0.0", {{"Qux", ids::Qux2}}},
    }});
    fx.add_package("General", {"Qux", ids::Qux, {{"0.1.0", {{"Foo", ids::Foo}}}}});
    fx.add_package("General", {"Foo", ids::Foo, {{"1.0.0", {}}, {"1.1.0", {}}}});

    ResolutionRequest request{{"Baz", VersionSpec::any()}, {"Foo", S("~1.0")}};

    Collection first(fx.depot());
    auto a = first.run(request);
    Collection second(fx.depot());
    auto b = second.run(request);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(a.value().to_toml() == b.value().to_toml());

    // requested names are filtered even when also reached transitively
    REQUIRE(a.value().packages.at("Foo").size() == 1);
    REQUIRE(a.value().find("Foo", V("1.0.0")) != nullptr);
}
