#include <storage/subject_lock.hpp>
#include <hashing/blake3_pipeline.hpp>

namespace Stanchion {

size_t SubjectLockTable::stripe_of(std::string_view subject_id) {
    return static_cast<size_t>(BLAKE3Pipeline::prefix64(BLAKE3Pipeline::hash(subject_id)) % STRIPES);
}

std::unique_lock<std::mutex> SubjectLockTable::acquire(std::string_view subject_id) {
    return std::unique_lock<std::mutex>(stripes_[stripe_of(subject_id)]);
}

} // namespace Stanchion
