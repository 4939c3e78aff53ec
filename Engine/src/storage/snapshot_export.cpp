#include <storage/snapshot_export.hpp>
#include <utils/json_output.hpp>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace Stanchion {

namespace {

// RFC 4180 quoting: only when the field needs it
std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // anonymous namespace

nlohmann::json SnapshotExporter::to_json(const std::vector<SubjectRecord>& records) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& r : records) {
        rows.push_back({
            {"subject_id", r.subject_id},
            {"material", r.material},
            {"type", r.type},
            {"confidence", r.confidence},
            {"source_kind", to_string(r.source_kind)},
            {"timestamp", r.timestamp},
            {"verified", r.verified},
            {"correction_count", r.correction_count}
        });
    }
    return rows;
}

std::string SnapshotExporter::to_csv(const std::vector<SubjectRecord>& records) {
    std::ostringstream out;
    out << CSV_HEADER << "\n";
    for (const auto& r : records) {
        out << csv_field(r.subject_id) << ','
            << csv_field(r.material) << ','
            << csv_field(r.type) << ','
            << std::setprecision(6) << r.confidence << ','
            << to_string(r.source_kind) << ','
            << std::fixed << std::setprecision(3) << r.timestamp << std::defaultfloat << ','
            << (r.verified ? "true" : "false") << ','
            << r.correction_count << "\n";
    }
    return out.str();
}

void SnapshotExporter::write_json(AnalysisStore& store, std::ostream& out) {
    out << dump_report(to_json(store.snapshot())) << "\n";
}

void SnapshotExporter::write_csv(AnalysisStore& store, std::ostream& out) {
    out << to_csv(store.snapshot());
}

} // namespace Stanchion
