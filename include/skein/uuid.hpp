#pragma once

#include <skein/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace skein {

// Package identity. Generated once when a package is registered and only
// ever compared, never interpreted.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    std::string to_string() const;

    // Accepts upper- or lowercase hex in the 8-4-4-4-12 layout
    static Result<Uuid> from_string(const std::string& s);

    // True only for the lowercase 8-4-4-4-12 form written by to_string()
    static bool is_canonical(const std::string& s);

    bool is_nil() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
};

} // namespace skein

namespace std {
template<>
struct hash<skein::Uuid> {
    size_t operator()(const skein::Uuid& u) const noexcept {
        // FNV-1a over the raw bytes
        uint64_t h = 1469598103934665603ull;
        for (uint8_t b : u.bytes) {
            h ^= b;
            h *= 1099511628211ull;
        }
        return static_cast<size_t>(h);
    }
};
} // namespace std
