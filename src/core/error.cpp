#include <skein/error.hpp>

namespace skein {

const char* SkeinError::code_name(Code c) {
    switch (c) {
        case IO:                return "IO";
        case Parse:             return "Parse";
        case Version:           return "Version";
        case Config:            return "Config";
        case Manifest:          return "Manifest";
        case NotFound:          return "NotFound";
        case Ambiguous:         return "Ambiguous";
        case Inconsistent:      return "Inconsistent";
        case MalformedMetadata: return "MalformedMetadata";
        case InvalidArg:        return "InvalidArg";
    }
    return "Unknown";
}

SkeinError SkeinError::ambiguous(std::vector<Ambiguity> list) {
    std::string msg;
    if (list.size() == 1) {
        msg = "package name '" + list[0].name + "' is ambiguous";
    } else {
        msg = std::to_string(list.size()) + " package names are ambiguous";
    }
    SkeinError err(Ambiguous, std::move(msg),
        "interactive package choice is not supported; "
        "add the package by identity or pin it in the manifest");
    err.ambiguities = std::move(list);
    return err;
}

bool SkeinError::is_registry_fault() const {
    return code == MalformedMetadata;
}

std::string SkeinError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    for (const auto& amb : ambiguities) {
        result += "\n  ";
        result += amb.name;
        result += " could refer to:";
        for (size_t i = 0; i < amb.candidates.size(); ++i) {
            const auto& c = amb.candidates[i];
            result += "\n    [" + std::to_string(i + 1) + "] " + c.uuid;
            if (!c.descriptor.empty()) {
                result += " - ";
                result += c.descriptor;
            }
        }
    }

    for (const auto& note : notes) {
        result += "\n  also: ";
        result += note;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace skein
