#include <skein/identity.hpp>
#include <skein/log.hpp>
#include <skein/package.hpp>

namespace skein {

const std::vector<std::string>*
IdentityResolution::locations(const std::string& name) const {
    auto u = uuids.find(name);
    if (u == uuids.end()) return nullptr;
    auto n = index.find(name);
    if (n == index.end()) return nullptr;
    auto p = n->second.find(u->second);
    if (p == n->second.end() || p->second.empty()) return nullptr;
    return &p->second;
}

IdentityResolver::IdentityResolver(const RegistryIndexBuilder& builder,
                                   const Manifest& manifest)
    : builder_(builder), manifest_(manifest) {}

std::string IdentityResolver::describe(const std::vector<std::string>& paths) const {
    if (paths.empty()) return "";
    auto info = load_package_info(paths.front());
    if (info.is_err()) {
        log::warn("cannot describe package at %s: %s",
                  paths.front().c_str(), info.error().message.c_str());
        return "";
    }
    return info.value().repo;
}

Status IdentityResolver::resolve_batch(const std::set<std::string>& names,
                                       RegistryIndex found,
                                       IdentityResolution& into,
                                       Missing missing,
                                       std::set<std::string>& unregistered) const {
    std::vector<Ambiguity> ambiguities;
    std::vector<SkeinError> failures;

    for (const auto& name : names) {
        PackageLocations candidates;
        auto it = found.find(name);
        if (it != found.end()) candidates = std::move(it->second);

        if (const ManifestEntry* installed = manifest_.find(name)) {
            auto pinned = candidates.find(installed->uuid);
            if (pinned == candidates.end() || pinned->second.empty()) {
                failures.push_back(SkeinError{SkeinError::Inconsistent,
                    name + "/" + installed->uuid.to_string() +
                    " found in manifest but not in any registry",
                    "to install a different " + name + " package, remove " +
                    name + " and then add it again"});
                continue;
            }
            if (candidates.size() > 1) {
                log::debug("%s: manifest pins %s over %zu other identities",
                           name.c_str(), installed->uuid.to_string().c_str(),
                           candidates.size() - 1);
            }
            PackageLocations narrowed;
            narrowed.emplace(installed->uuid, std::move(pinned->second));
            into.uuids[name] = installed->uuid;
            into.index[name] = std::move(narrowed);
            continue;
        }

        if (candidates.empty()) {
            if (missing == Missing::Record) {
                unregistered.insert(name);
                continue;
            }
            failures.push_back(SkeinError{SkeinError::NotFound,
                "package '" + name + "' is not in any registry",
                "check the spelling or add a registry that provides it"});
            continue;
        }

        if (candidates.size() == 1) {
            log::debug("%s => %s", name.c_str(),
                       candidates.begin()->first.to_string().c_str());
            into.uuids[name] = candidates.begin()->first;
            into.index[name] = std::move(candidates);
            continue;
        }

        Ambiguity amb;
        amb.name = name;
        for (const auto& [uuid, paths] : candidates) {
            amb.candidates.push_back({uuid.to_string(), describe(paths)});
        }
        ambiguities.push_back(std::move(amb));
    }

    // First failing name decides the code; the other failures and any
    // ambiguities are attached to it
    if (!failures.empty()) {
        SkeinError err = std::move(failures.front());
        for (size_t i = 1; i < failures.size(); ++i) {
            err.notes.push_back(failures[i].message);
        }
        for (const auto& amb : ambiguities) {
            err.notes.push_back("package name '" + amb.name + "' is ambiguous");
        }
        err.ambiguities = std::move(ambiguities);
        return err;
    }

    if (!ambiguities.empty()) {
        for (const auto& amb : ambiguities) {
            log::info("%s is ambiguous, it could refer to %zu packages",
                      amb.name.c_str(), amb.candidates.size());
        }
        return SkeinError::ambiguous(std::move(ambiguities));
    }
    return ok_status();
}

Result<IdentityResolution>
IdentityResolver::resolve(const std::set<std::string>& names) const {
    IdentityResolution res;

    auto found = builder_.find_registered(names);
    if (found.is_err()) return std::move(found).error();

    std::set<std::string> unused;
    auto st = resolve_batch(names, std::move(found).value(), res,
                            Missing::Fail, unused);
    if (st.is_err()) return std::move(st).error();

    std::set<std::string> installed_only;
    for (const auto& [name, entry] : manifest_.packages) {
        if (!names.count(name)) installed_only.insert(name);
    }
    auto extra = builder_.find_registered(installed_only);
    if (extra.is_err()) return std::move(extra).error();

    for (const auto& name : installed_only) {
        const Uuid& uuid = manifest_.find(name)->uuid;
        res.uuids[name] = uuid;

        auto it = extra.value().find(name);
        if (it == extra.value().end() || !it->second.count(uuid)) {
            log::debug("installed package %s/%s is not in any registry",
                       name.c_str(), uuid.to_string().c_str());
            continue;
        }
        PackageLocations narrowed;
        narrowed.emplace(uuid, std::move(it->second[uuid]));
        res.index[name] = std::move(narrowed);
    }

    return Result<IdentityResolution>::ok(std::move(res));
}

Status IdentityResolver::resolve_discovered(const std::set<std::string>& names,
                                            IdentityResolution& into,
                                            std::set<std::string>& unregistered) const {
    if (names.empty()) return ok_status();

    auto found = builder_.find_registered(names);
    if (found.is_err()) return std::move(found).error();

    return resolve_batch(names, std::move(found).value(), into,
                         Missing::Record, unregistered);
}

} // namespace skein
