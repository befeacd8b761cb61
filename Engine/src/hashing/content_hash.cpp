/**
 * @file content_hash.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/content_hash.hpp>
#include <algorithm>
#include <stdexcept>
#include <cctype>

extern "C" {
#include <blake3.h>
}

namespace Synod {

ContentHash::Hash ContentHash::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

ContentHash::Hash ContentHash::hash_set(std::vector<std::string> items) {
    std::sort(items.begin(), items.end());
    items.erase(std::unique(items.begin(), items.end()), items.end());

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    for (const auto& item : items) {
        // Length prefix keeps {"ab","c"} distinct from {"a","bc"}
        uint64_t len = item.size();
        blake3_hasher_update(&hasher, &len, sizeof(len));
        blake3_hasher_update(&hasher, item.data(), item.size());
    }

    Hash result;
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);
    return result;
}

std::string ContentHash::to_hex(const Hash& hash) {
    static const char* lut = "0123456789abcdef";
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t b : hash) {
        out.push_back(lut[(b >> 4) & 0xF]);
        out.push_back(lut[b & 0xF]);
    }
    return out;
}

ContentHash::Hash ContentHash::from_hex(const std::string& hex) {
    if (hex.size() != HASH_SIZE * 2)
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.size()) + ". Expected 32 (128-bit).");

    auto nibble = [&](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        throw std::invalid_argument(std::string("Invalid hex digit: ") + c);
    };

    Hash result;
    for (size_t i = 0; i < HASH_SIZE; ++i)
        result[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
    return result;
}

} // namespace Synod
