#pragma once

#include <cstdint>
#include <string>

namespace SpecOpt {
namespace Utils {

// 64-bit FNV-1a. Stable across processes, compilers and platforms,
// unlike std::hash, so it can key persisted observations.
inline uint64_t fnv1a_64(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= static_cast<uint64_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace Utils
} // namespace SpecOpt
