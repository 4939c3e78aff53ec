#include <vision/oracle_reply_parser.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <string_view>

namespace Stanchion {

namespace {

std::string trim(const std::string& s) {
    size_t first = 0;
    while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    size_t last = s.size();
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) --last;
    return s.substr(first, last - first);
}

std::optional<double> parse_confidence(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) return std::nullopt;

    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || !std::isfinite(parsed)) return std::nullopt;
    return parsed;
}

bool valid(const OracleReply& reply) {
    return !reply.material.empty() && !reply.type.empty() &&
           reply.confidence >= 0.0 && reply.confidence <= 1.0;
}

std::optional<OracleReply> parse_json_reply(const std::string& text) {
    size_t json_start = text.find('{');
    size_t json_end = text.rfind('}');
    if (json_start == std::string::npos || json_end == std::string::npos || json_end <= json_start) {
        return std::nullopt;
    }

    nlohmann::json j = nlohmann::json::parse(text.substr(json_start, json_end - json_start + 1),
                                             nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    OracleReply reply;
    if (!j.contains("material") || !j["material"].is_string()) return std::nullopt;
    if (!j.contains("type") || !j["type"].is_string()) return std::nullopt;
    reply.material = trim(j["material"].get<std::string>());
    reply.type = trim(j["type"].get<std::string>());

    if (!j.contains("confidence")) return std::nullopt;
    const auto& confidence = j["confidence"];
    if (confidence.is_number()) {
        reply.confidence = confidence.get<double>();
    } else if (confidence.is_string()) {
        auto parsed = parse_confidence(confidence.get<std::string>());
        if (!parsed) return std::nullopt;
        reply.confidence = *parsed;
    } else {
        return std::nullopt;
    }

    if (j.contains("rationale") && j["rationale"].is_string()) {
        reply.rationale = j["rationale"].get<std::string>();
    } else if (j.contains("reasoning") && j["reasoning"].is_string()) {
        reply.rationale = j["reasoning"].get<std::string>();
    }

    if (!valid(reply)) return std::nullopt;
    return reply;
}

// Strips list and emphasis markers, then matches "key:" case-insensitively
std::optional<std::string> field_value(const std::string& line, const char* key) {
    std::string s = trim(line);
    size_t pos = s.find_first_not_of("-*# ");
    if (pos == std::string::npos) return std::nullopt;

    std::string_view k(key);
    if (s.size() - pos < k.size()) return std::nullopt;
    for (size_t i = 0; i < k.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[pos + i])) != k[i]) return std::nullopt;
    }
    pos += k.size();
    while (pos < s.size() && s[pos] == '*') ++pos;
    if (pos >= s.size() || s[pos] != ':') return std::nullopt;

    std::string value = s.substr(pos + 1);
    size_t first = value.find_first_not_of("* ");
    value = first == std::string::npos ? std::string() : value.substr(first);
    while (!value.empty() && value.back() == '*') value.pop_back();
    return trim(value);
}

std::optional<OracleReply> parse_line_reply(const std::string& text) {
    OracleReply reply;
    bool have_confidence = false;

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (auto v = field_value(line, "material")) {
            reply.material = *v;
        } else if (auto v = field_value(line, "type")) {
            reply.type = *v;
        } else if (auto v = field_value(line, "confidence")) {
            auto parsed = parse_confidence(*v);
            if (parsed) {
                reply.confidence = *parsed;
                have_confidence = true;
            }
        } else if (auto v = field_value(line, "reasoning")) {
            reply.rationale = *v;
        } else if (auto v = field_value(line, "rationale")) {
            reply.rationale = *v;
        }
    }

    if (!have_confidence || !valid(reply)) return std::nullopt;
    return reply;
}

} // anonymous namespace

std::optional<OracleReply> parse_oracle_reply(const std::string& text) {
    if (auto reply = parse_json_reply(text)) return reply;
    if (auto reply = parse_line_reply(text)) return reply;

    Logger::debug("Unparseable oracle reply: " + text.substr(0, 100));
    return std::nullopt;
}

} // namespace Stanchion
