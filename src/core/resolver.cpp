#include <skein/resolver.hpp>
#include <skein/collector.hpp>
#include <skein/log.hpp>
#include <skein/registry.hpp>

namespace skein {

Resolver::Resolver(std::vector<std::string> depots, std::string manifest_path)
    : depots_(std::move(depots)), manifest_path_(std::move(manifest_path)) {}

Resolver Resolver::from_config(const Config& cfg) {
    return Resolver(cfg.depots, cfg.manifest_path());
}

ResolutionRequest Resolver::prune_satisfied(const ResolutionRequest& request,
                                            const Manifest& manifest) {
    ResolutionRequest pruned;
    for (const auto& [name, spec] : request) {
        const ManifestEntry* installed = manifest.find(name);
        if (installed && installed->version && spec.matches(*installed->version)) {
            log::debug("%s %s already satisfies %s", name.c_str(),
                       installed->version->to_string().c_str(),
                       spec.to_string().c_str());
            continue;
        }
        pruned.emplace(name, spec);
    }
    return pruned;
}

Result<ResolutionInput> Resolver::prepare(const ResolutionRequest& request) const {
    std::set<std::string> names;
    for (const auto& [name, spec] : request) {
        if (name.empty()) {
            return SkeinError{SkeinError::InvalidArg, "empty package name in request"};
        }
        names.insert(name);
    }

    auto builder = RegistryIndexBuilder::discover(depots_);
    if (builder.is_err()) return std::move(builder).error();
    log::debug("%zu registries configured", builder.value().registries().size());

    auto manifest = Manifest::load(manifest_path_);
    if (manifest.is_err()) return std::move(manifest).error();

    IdentityResolver resolver(builder.value(), manifest.value());
    auto identities = resolver.resolve(names);
    if (identities.is_err()) return std::move(identities).error();

    ResolutionInput input;
    input.requirements = prune_satisfied(request, manifest.value());

    DependencyGraphCollector collector(resolver);
    auto graph = collector.collect(input.requirements, identities.value());
    if (graph.is_err()) return std::move(graph).error();

    input.uuids = std::move(identities.value().uuids);
    input.index = std::move(identities.value().index);
    input.graph = std::move(graph).value();
    input.candidates = project_candidates(input.graph, input.uuids);

    log::debug("collected %zu versions of %zu packages",
               input.graph.version_count(), input.graph.packages.size());
    return Result<ResolutionInput>::ok(std::move(input));
}

Result<Selection> Resolver::resolve(const ResolutionRequest& request,
                                    Solver& solver) const {
    auto input = prepare(request);
    if (input.is_err()) return std::move(input).error();
    return solver.solve(input.value().requirements, input.value().graph);
}

} // namespace skein
