/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 content addressing for correction events, photographs and lock striping
 */

#pragma once

#include <vector>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <initializer_list>

extern "C" {
#include <blake3.h>
}

namespace Stanchion {

/**
 * @brief BLAKE3 hashing helpers.
 *
 * Same content = same id. Correction events are keyed by the hash of
 * their fields so that a replayed log never duplicates an event.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    static Hash hash(const std::vector<uint8_t>& data) {
        return hash(data.data(), data.size());
    }

    /**
     * @brief Hash a sequence of fields with a unit separator between them.
     *
     * ("ab","c") and ("a","bc") produce different hashes.
     */
    static Hash hash_fields(std::initializer_list<std::string_view> fields);

    /**
     * @brief First 8 bytes of the hash as an integer (for bucketing / striping)
     */
    static uint64_t prefix64(const Hash& hash);

    static std::string to_hex(const Hash& hash);

    /**
     * @brief Format as UUID string (xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx)
     */
    static std::string to_uuid(const Hash& hash);
};

} // namespace Stanchion
