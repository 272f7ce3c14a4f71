#include <skein/dependency_graph.hpp>
#include <toml++/toml.hpp>
#include <sstream>

namespace skein {

bool DependencyGraph::contains(const std::string& name) const {
    return packages.count(name) > 0;
}

const AvailableVersion* DependencyGraph::find(const std::string& name,
                                              const Version& v) const {
    auto it = packages.find(name);
    if (it == packages.end()) return nullptr;
    auto vit = it->second.find(v);
    return vit == it->second.end() ? nullptr : &vit->second;
}

size_t DependencyGraph::version_count() const {
    size_t n = 0;
    for (const auto& [name, versions] : packages) n += versions.size();
    return n;
}

std::string DependencyGraph::to_toml() const {
    toml::table doc;
    for (const auto& [name, versions] : packages) {
        toml::table pkg;
        for (const auto& [ver, av] : versions) {
            toml::table entry;
            entry.insert_or_assign("hash-sha1", av.hash);

            if (!av.deps.empty()) {
                toml::table deps;
                for (const auto& [dep, uuid] : av.deps) {
                    deps.insert_or_assign(dep, uuid.to_string());
                }
                entry.insert_or_assign("deps", std::move(deps));
            }
            if (!av.compat.empty()) {
                toml::table compat;
                for (const auto& [dep, spec] : av.compat) {
                    compat.insert_or_assign(dep, spec);
                }
                entry.insert_or_assign("compat", std::move(compat));
            }
            pkg.insert_or_assign(ver.to_string(), std::move(entry));
        }
        doc.insert_or_assign(name, std::move(pkg));
    }

    std::ostringstream ss;
    ss << doc;
    return ss.str();
}

} // namespace skein
