#pragma once

#include <skein/result.hpp>
#include <skein/dependency_graph.hpp>
#include <skein/identity.hpp>
#include <map>
#include <set>
#include <string>

namespace skein {

// Expands the requested names along declared dependencies into the
// candidate graph handed to the solver.
//
// Discovery runs breadth-first over an explicit frontier: each round
// resolves the identities of the names first met in the previous round
// (one registry scan per round), reads their metadata, keeps the versions
// the request admits and queues dependency names not seen before. Every
// name is expanded at most once. Identity-conflict filtering runs after
// discovery has finished, so the graph does not depend on visiting order.
class DependencyGraphCollector {
public:
    explicit DependencyGraphCollector(const IdentityResolver& resolver);

    // `identities` must come from IdentityResolver::resolve for the
    // request's names; it is extended with every discovered name.
    Result<DependencyGraph> collect(const ResolutionRequest& request,
                                    IdentityResolution& identities) const;

    // Names met during the last collect() that no registry offers
    const std::set<std::string>& unregistered() const { return unregistered_; }

private:
    using VersionTable = std::map<Version, AvailableVersion>;

    // Versions of one package across all locations of its identity; the
    // first location declaring a version wins
    Result<VersionTable> load_versions(const std::string& name,
                                       const IdentityResolution& identities) const;

    static bool is_feasible(const std::string& name,
                            const AvailableVersion& av,
                            const std::map<std::string, Uuid>& fixed);

    const IdentityResolver& resolver_;
    mutable std::set<std::string> unregistered_;
};

} // namespace skein
