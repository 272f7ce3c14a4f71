#pragma once

#include <skein/result.hpp>
#include <skein/manifest.hpp>
#include <skein/registry.hpp>
#include <skein/version.hpp>
#include <map>
#include <set>
#include <string>

namespace skein {

// name -> requested versions; the caller's entry point
using ResolutionRequest = std::map<std::string, VersionSpec>;

struct IdentityResolution {
    // Every name whose identity is fixed for this run: requested names,
    // installed names and names discovered through dependencies
    std::map<std::string, Uuid> uuids;

    // Locations of the fixed identities only; other identities sharing a
    // resolved name are dropped
    RegistryIndex index;

    // nullptr if the name has no indexed location
    const std::vector<std::string>* locations(const std::string& name) const;
};

// Maps package names to identities. The installed manifest wins over the
// registries; several registries disagreeing without a manifest entry is an
// ambiguity that is reported, never guessed.
class IdentityResolver {
public:
    IdentityResolver(const RegistryIndexBuilder& builder, const Manifest& manifest);

    // Resolve the requested names, then index installed names that were not
    // requested so they take part in conflict checks. Fails with NotFound,
    // Inconsistent, or one Ambiguous error listing every ambiguous name.
    Result<IdentityResolution> resolve(const std::set<std::string>& names) const;

    // Resolve names met while walking dependencies and add them to `into`.
    // Names no registry offers are put in `unregistered` instead of failing.
    Status resolve_discovered(const std::set<std::string>& names,
                              IdentityResolution& into,
                              std::set<std::string>& unregistered) const;

private:
    enum class Missing { Fail, Record };

    Status resolve_batch(const std::set<std::string>& names,
                         RegistryIndex found,
                         IdentityResolution& into,
                         Missing missing,
                         std::set<std::string>& unregistered) const;

    // Human-readable hint for one candidate, read from the first location's
    // package.toml. Only called when an ambiguity is reported.
    std::string describe(const std::vector<std::string>& paths) const;

    const RegistryIndexBuilder& builder_;
    const Manifest& manifest_;
};

} // namespace skein
