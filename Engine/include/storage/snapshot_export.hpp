/**
 * @file snapshot_export.hpp
 * @brief Flat serialization of every SubjectRecord for reporting tools
 */

#pragma once

#include <storage/analysis_store.hpp>
#include <nlohmann/json.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace Stanchion {

class SnapshotExporter {
public:
    static constexpr const char* CSV_HEADER =
        "subject_id,material,type,confidence,source_kind,timestamp,verified,correction_count";

    static nlohmann::json to_json(const std::vector<SubjectRecord>& records);
    static std::string to_csv(const std::vector<SubjectRecord>& records);

    /**
     * @brief Snapshot the store (newest first) and write it out
     * @throws StorageError
     */
    static void write_json(AnalysisStore& store, std::ostream& out);
    static void write_csv(AnalysisStore& store, std::ostream& out);
};

} // namespace Stanchion
