#pragma once

#include <skein/result.hpp>
#include <skein/candidates.hpp>
#include <skein/config.hpp>
#include <skein/dependency_graph.hpp>
#include <skein/identity.hpp>
#include <skein/manifest.hpp>
#include <map>
#include <string>
#include <vector>

namespace skein {

// Everything the version solver needs for one run
struct ResolutionInput {
    ResolutionRequest requirements;     // request minus already-satisfied names
    std::map<std::string, Uuid> uuids;  // every fixed identity
    RegistryIndex index;                // locations of the fixed identities
    DependencyGraph graph;
    CandidateTable candidates;
};

// identity -> chosen version
using Selection = std::map<Uuid, Version>;

// The combinatorial solver lives outside this library
class Solver {
public:
    virtual ~Solver() = default;
    virtual Result<Selection> solve(const ResolutionRequest& requirements,
                                    const DependencyGraph& graph) = 0;
};

// One resolution run: index registries, pin identities, collect the graph
class Resolver {
public:
    // `manifest_path` may name a file that does not exist yet
    Resolver(std::vector<std::string> depots, std::string manifest_path);

    static Resolver from_config(const Config& cfg);

    // Registries and manifest are re-read on every call
    Result<ResolutionInput> prepare(const ResolutionRequest& request) const;

    Result<Selection> resolve(const ResolutionRequest& request, Solver& solver) const;

    // Drop requested names already installed at a version the request
    // admits; those need no work
    static ResolutionRequest prune_satisfied(const ResolutionRequest& request,
                                             const Manifest& manifest);

private:
    std::vector<std::string> depots_;
    std::string manifest_path_;
};

} // namespace skein
