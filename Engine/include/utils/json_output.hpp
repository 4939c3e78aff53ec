#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace Stanchion {

/**
 * @brief Serialize for reports and exports.
 *
 * Labels are open vocabulary and may carry bytes that are not UTF-8; those
 * are written as U+FFFD instead of failing the whole document.
 */
inline std::string dump_report(const nlohmann::json& doc, int indent = 2) {
    return doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace Stanchion
