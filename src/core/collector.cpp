#include <skein/collector.hpp>
#include <skein/log.hpp>
#include <skein/package.hpp>

namespace skein {

DependencyGraphCollector::DependencyGraphCollector(const IdentityResolver& resolver)
    : resolver_(resolver) {}

Result<DependencyGraphCollector::VersionTable>
DependencyGraphCollector::load_versions(const std::string& name,
                                        const IdentityResolution& identities) const {
    const auto* paths = identities.locations(name);
    if (!paths) {
        return SkeinError{SkeinError::NotFound,
            "no registry location for package '" + name + "'"};
    }

    VersionTable table;
    for (const auto& path : *paths) {
        auto md = PackageMetadata::load(path);
        if (md.is_err()) return std::move(md).error();
        const PackageMetadata& meta = md.value();

        for (const auto& [ver, hash] : meta.versions) {
            if (table.count(ver)) continue;

            AvailableVersion av;
            av.version = ver;
            av.hash = hash;
            auto req = meta.requirements.find(ver);
            if (req != meta.requirements.end()) av.deps = req->second;
            auto compat = meta.compatibility.find(ver);
            if (compat != meta.compatibility.end()) av.compat = compat->second;
            table.emplace(ver, std::move(av));
        }
    }
    return Result<VersionTable>::ok(std::move(table));
}

bool DependencyGraphCollector::is_feasible(const std::string& name,
                                           const AvailableVersion& av,
                                           const std::map<std::string, Uuid>& fixed) {
    for (const auto& [dep, uuid] : av.deps) {
        auto it = fixed.find(dep);
        if (it == fixed.end()) {
            log::debug("excluding %s %s: dependency %s is not registered",
                       name.c_str(), av.version.to_string().c_str(), dep.c_str());
            return false;
        }
        if (it->second != uuid) {
            log::debug("excluding %s %s: requires %s/%s but %s is fixed",
                       name.c_str(), av.version.to_string().c_str(),
                       dep.c_str(), uuid.to_string().c_str(),
                       it->second.to_string().c_str());
            return false;
        }
    }
    return true;
}

Result<DependencyGraph>
DependencyGraphCollector::collect(const ResolutionRequest& request,
                                  IdentityResolution& identities) const {
    unregistered_.clear();

    std::map<std::string, VersionTable> admitted;
    std::set<std::string> visited;
    std::set<std::string> frontier;
    for (const auto& [name, spec] : request) {
        visited.insert(name);
        frontier.insert(name);
    }

    while (!frontier.empty()) {
        std::set<std::string> unresolved;
        for (const auto& name : frontier) {
            if (!identities.locations(name)) unresolved.insert(name);
        }
        SKEIN_TRY(resolver_.resolve_discovered(unresolved, identities, unregistered_));

        std::set<std::string> next;
        for (const auto& name : frontier) {
            if (unregistered_.count(name)) {
                log::info("dependency %s is not in any registry; "
                          "versions requiring it are excluded", name.c_str());
                continue;
            }

            auto versions = load_versions(name, identities);
            if (versions.is_err()) return std::move(versions).error();

            auto spec_it = request.find(name);
            auto& kept = admitted[name];
            for (auto& [ver, av] : versions.value()) {
                if (spec_it != request.end() && !spec_it->second.matches(ver)) {
                    continue;
                }
                for (const auto& [dep, uuid] : av.deps) {
                    if (visited.insert(dep).second) next.insert(dep);
                }
                kept.emplace(ver, std::move(av));
            }
            log::trace("%s: %zu of %zu versions match %s", name.c_str(),
                       kept.size(), versions.value().size(),
                       spec_it != request.end() ? spec_it->second.to_string().c_str()
                                                : "*");
        }
        frontier = std::move(next);
    }

    DependencyGraph graph;
    for (auto& [name, versions] : admitted) {
        auto& out = graph.packages[name];
        for (auto& [ver, av] : versions) {
            if (is_feasible(name, av, identities.uuids)) {
                out.emplace(ver, std::move(av));
            }
        }
        if (out.empty()) {
            log::debug("no candidate versions left for %s", name.c_str());
        }
    }

    return Result<DependencyGraph>::ok(std::move(graph));
}

} // namespace skein
