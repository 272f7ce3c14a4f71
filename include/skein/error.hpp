#pragma once

#include <string>
#include <vector>

namespace skein {

// One identity a name could refer to, with a short human-readable hint
// (usually the source repository URL from package.toml)
struct AmbiguityCandidate {
    std::string uuid;
    std::string descriptor;
};

struct Ambiguity {
    std::string name;
    std::vector<AmbiguityCandidate> candidates;  // sorted by uuid
};

struct SkeinError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        Manifest,
        NotFound,
        Ambiguous,
        Inconsistent,
        MalformedMetadata,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    std::vector<Ambiguity> ambiguities;
    std::vector<std::string> notes;      // further problems found in the same pass

    SkeinError() = default;
    SkeinError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SkeinError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SkeinError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    static SkeinError ambiguous(std::vector<Ambiguity> list);

    // Corrupt registry data, as opposed to a problem with the request
    bool is_registry_fault() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace skein
