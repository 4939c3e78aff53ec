/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <sstream>
#include <iomanip>

namespace Stanchion {

namespace {
constexpr char k_hex_lut[] = "0123456789abcdef";
constexpr uint8_t k_field_separator = 0x1F;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_fields(std::initializer_list<std::string_view> fields) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    bool first = true;
    for (std::string_view field : fields) {
        if (!first) blake3_hasher_update(&hasher, &k_field_separator, 1);
        blake3_hasher_update(&hasher, field.data(), field.size());
        first = false;
    }
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

uint64_t BLAKE3Pipeline::prefix64(const Hash& hash) {
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value = (value << 8) | hash[i];
    }
    return value;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << (int)byte;
    }

    return oss.str();
}

std::string BLAKE3Pipeline::to_uuid(const Hash& hash) {
    char buf[37];
    char* p = buf;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) *p++ = '-';
        *p++ = k_hex_lut[(hash[i] >> 4) & 0xF];
        *p++ = k_hex_lut[hash[i] & 0xF];
    }
    *p = '\0';
    return std::string(buf, 36);
}

} // namespace Stanchion
