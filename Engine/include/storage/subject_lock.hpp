/**
 * @file subject_lock.hpp
 * @brief Per-subject serialization of read-then-write sequences
 */

#pragma once

#include <array>
#include <mutex>
#include <string_view>

namespace Stanchion {

/**
 * @brief Striped mutex table keyed by the BLAKE3 digest of a subject id
 *
 * Two ids may share a stripe; that only serializes more than necessary.
 */
class SubjectLockTable {
public:
    static constexpr size_t STRIPES = 64;

    std::unique_lock<std::mutex> acquire(std::string_view subject_id);

    static size_t stripe_of(std::string_view subject_id);

private:
    std::array<std::mutex, STRIPES> stripes_;
};

} // namespace Stanchion
