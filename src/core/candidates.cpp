#include <skein/candidates.hpp>

namespace skein {

CandidateTable project_candidates(const DependencyGraph& graph,
                                  const std::map<std::string, Uuid>& uuids) {
    CandidateTable table;
    for (const auto& [name, versions] : graph.packages) {
        auto it = uuids.find(name);
        if (it == uuids.end()) continue;

        auto& out = table[it->second];
        for (const auto& [ver, av] : versions) {
            out.emplace(ver, av.hash);
        }
    }
    return table;
}

} // namespace skein
