/**
 * @file oracle_reply_parser.hpp
 * @brief Interpret free-text vision oracle replies
 */

#pragma once

#include <core/classification.hpp>
#include <optional>
#include <string>

namespace Stanchion {

struct OracleReply {
    Label material;
    Label type;
    double confidence = 0.0;
    std::string rationale;
};

/**
 * @brief Parse an oracle reply
 *
 * Accepts a JSON object embedded anywhere in the text (keys material, type,
 * confidence, rationale or reasoning), or "Material:", "Type:",
 * "Confidence:", "Reasoning:" lines. Material and type must be non-empty
 * and confidence a number in [0, 1].
 *
 * @return nullopt when the reply cannot be interpreted
 */
std::optional<OracleReply> parse_oracle_reply(const std::string& text);

} // namespace Stanchion
