#pragma once

#include <skein/dependency_graph.hpp>
#include <map>
#include <string>

namespace skein {

// identity -> version -> content hash
using CandidateTable = std::map<Uuid, std::map<Version, std::string>>;

// Re-key the graph by identity for the solver. Names without a fixed
// identity are skipped.
CandidateTable project_candidates(const DependencyGraph& graph,
                                  const std::map<std::string, Uuid>& uuids);

} // namespace skein
