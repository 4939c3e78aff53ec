#include <storage/analysis_store.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <iomanip>
#include <sstream>

namespace Stanchion {

std::string correction_event_id(const CorrectionEvent& event) {
    std::ostringstream ts;
    ts << std::setprecision(17) << event.timestamp;
    std::string sequence = std::to_string(event.sequence);

    auto hash = BLAKE3Pipeline::hash_fields({
        event.subject_id,
        event.material_before, event.type_before,
        event.material_after, event.type_after,
        ts.str(), sequence
    });
    return BLAKE3Pipeline::to_uuid(hash);
}

} // namespace Stanchion
