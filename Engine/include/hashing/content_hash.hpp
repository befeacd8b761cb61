/**
 * @file content_hash.hpp
 * @brief BLAKE3 fingerprints for canonical content
 */

#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace Synod {

/**
 * @brief BLAKE3 content hashing
 *
 * Same content = same fingerprint. Used to group structurally identical
 * conclusions coming back from different nodes.
 */
class ContentHash {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 16-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    /**
     * @brief Hash string
     */
    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Hash the canonical serialization of a JSON value.
     *
     * nlohmann::json keeps object keys sorted, so dump() is canonical for
     * equal values.
     */
    static Hash hash(const nlohmann::json& value) {
        return hash(std::string_view(value.dump()));
    }

    /**
     * @brief Hash an unordered collection of strings (sorted, deduplicated).
     */
    static Hash hash_set(std::vector<std::string> items);

    static std::string to_hex(const Hash& hash);
    static Hash from_hex(const std::string& hex);
};

struct ContentHashHasher {
    size_t operator()(const ContentHash::Hash& h) const noexcept {
        size_t out = 0;
        for (size_t i = 0; i < sizeof(size_t) && i < h.size(); ++i)
            out = (out << 8) | h[i];
        return out;
    }
};

} // namespace Synod
