#pragma once

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace Synod {

/**
 * @brief "<prefix>-<seq>-<8 hex digits>"; unique per process run.
 */
inline std::string make_id(const char* prefix, uint64_t seq) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    char suffix[9];
    std::snprintf(suffix, sizeof(suffix), "%08x", static_cast<unsigned>(rng()));
    return std::string(prefix) + "-" + std::to_string(seq) + "-" + suffix;
}

} // namespace Synod
