// demo_resolve.cpp
//
// Runs the resolution pipeline against the registries of the configured
// depots and prints the candidate graph the solver would receive:
//
//     ./demo_resolve Example "JSON@^0.16"     # name[@spec] ...
//     ./demo_resolve --config my.toml Example
//
// Without --config, $HOME/.skein/config.toml is used when present.

#include <skein/config.hpp>
#include <skein/log.hpp>
#include <skein/resolver.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace skein;

static Result<ResolutionRequest> parse_request(int argc, char** argv, int first) {
    ResolutionRequest request;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        std::string name = arg;
        std::string spec_text;
        auto at = arg.find('@');
        if (at != std::string::npos) {
            name = arg.substr(0, at);
            spec_text = arg.substr(at + 1);
        }
        auto spec = VersionSpec::parse(spec_text);
        if (spec.is_err()) return std::move(spec).error();
        request[name] = std::move(spec).value();
    }
    if (request.empty()) {
        return SkeinError{SkeinError::InvalidArg,
            "no packages requested",
            "usage: demo_resolve [--config <file>] <name[@spec]>..."};
    }
    return Result<ResolutionRequest>::ok(std::move(request));
}

static Result<Config> load_config(const std::string& explicit_path) {
    std::optional<Config> global;
    std::optional<Config> local;

    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && std::filesystem::exists(global_path, ec)) {
        auto cfg = Config::load(global_path);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }
    if (!explicit_path.empty()) {
        auto cfg = Config::load(explicit_path);
        if (cfg.is_err()) return std::move(cfg).error();
        local = std::move(cfg).value();
    }
    return Result<Config>::ok(Config::effective(global, local));
}

static Status run(int argc, char** argv) {
    std::string config_path;
    int first = 1;
    if (argc > 2 && std::string(argv[1]) == "--config") {
        config_path = argv[2];
        first = 3;
    }

    auto cfg = load_config(config_path);
    SKEIN_TRY(cfg);
    cfg.value().apply_logging();

    auto request = parse_request(argc, argv, first);
    SKEIN_TRY(request);

    auto input = Resolver::from_config(cfg.value()).prepare(request.value());
    SKEIN_TRY(input);

    const ResolutionInput& in = input.value();
    for (const auto& [name, spec] : in.requirements) {
        std::cout << "# require " << name << " " << spec.to_string() << "\n";
    }
    for (const auto& [name, uuid] : in.uuids) {
        std::cout << "# " << name << " = " << uuid.to_string() << "\n";
    }
    std::cout << in.graph.to_toml() << "\n";
    return ok_status();
}

int main(int argc, char** argv) {
    auto st = run(argc, argv);
    if (st.is_err()) {
        std::cerr << st.error().format() << "\n";
        return st.error().is_registry_fault() ? 2 : 1;
    }
    return 0;
}
