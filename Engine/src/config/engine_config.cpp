#include <config/engine_config.hpp>
#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace Stanchion {

namespace {

double parse_env_double(const char* name, const char* value) {
    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (end == value || *end != '\0' || !std::isfinite(parsed)) {
        throw ConfigError(std::string(name) + " is not a number: " + value);
    }
    return parsed;
}

template <typename T>
void overlay(const nlohmann::json& object, const char* key, T& target) {
    if (!object.contains(key)) return;
    try {
        target = object.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

const nlohmann::json* section(const nlohmann::json& doc, const char* key) {
    if (!doc.contains(key)) return nullptr;
    const auto& value = doc.at(key);
    if (!value.is_object()) {
        throw ConfigError(std::string("'") + key + "' must be a JSON object");
    }
    return &value;
}

} // anonymous namespace

EngineConfig EngineConfig::from_env() {
    EngineConfig config;

    if (const char* timeout = std::getenv("STANCHION_ORACLE_TIMEOUT_MS")) {
        double ms = parse_env_double("STANCHION_ORACLE_TIMEOUT_MS", timeout);
        config.aggregator.timeout = std::chrono::milliseconds(static_cast<long long>(ms));
    }
    if (const char* threshold = std::getenv("STANCHION_STORE_THRESHOLD")) {
        config.store_threshold = parse_env_double("STANCHION_STORE_THRESHOLD", threshold);
    }
    if (const char* rules = std::getenv("STANCHION_RULES")) {
        std::string value(rules);
        if (value == "on" || value == "1" || value == "true") {
            config.enable_rule_source = true;
        } else if (value == "off" || value == "0" || value == "false") {
            config.enable_rule_source = false;
        } else {
            throw ConfigError("STANCHION_RULES must be on or off, got " + value);
        }
    }

    config.validate();
    return config;
}

void EngineConfig::merge_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw ConfigError("Config file is not a JSON object: " + path);
    }

    if (const auto* w = section(doc, "weights")) {
        overlay(*w, "verified", weights.verified);
        overlay(*w, "region_consensus", weights.region_consensus);
        overlay(*w, "pattern_learned", weights.pattern_learned);
        overlay(*w, "prior_analysis", weights.prior_analysis);
        overlay(*w, "rule_fallback", weights.rule_fallback);
    }

    if (const auto* agg = section(doc, "aggregator")) {
        const auto& a = *agg;
        overlay(a, "min_confidence", aggregator.min_confidence);
        overlay(a, "min_edge", aggregator.min_edge);
        overlay(a, "max_edge", aggregator.max_edge);
        if (a.contains("timeout_ms")) {
            long long ms = aggregator.timeout.count();
            overlay(a, "timeout_ms", ms);
            aggregator.timeout = std::chrono::milliseconds(ms);
        }
    }

    overlay(doc, "store_threshold", store_threshold);
    overlay(doc, "enable_rules", enable_rule_source);

    if (const auto* db = section(doc, "database")) {
        overlay(*db, "conninfo", database.conninfo);
    }

    validate();
    Logger::debug("Loaded configuration from " + path);
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    EngineConfig config = from_env();
    config.merge_json_file(path);
    return config;
}

void EngineConfig::validate() const {
    weights.validate();

    if (aggregator.min_edge <= 0 || aggregator.min_edge > aggregator.max_edge) {
        throw ConfigError("aggregator edge bounds must satisfy 0 < min_edge <= max_edge");
    }
    if (aggregator.timeout.count() <= 0) {
        throw ConfigError("aggregator timeout must be positive");
    }
    if (aggregator.min_confidence < 0.0 || aggregator.min_confidence > 1.0) {
        throw ConfigError("aggregator min_confidence must lie in [0, 1]");
    }
    if (store_threshold < 0.0 || store_threshold > 1.0) {
        throw ConfigError("store_threshold must lie in [0, 1]");
    }
}

std::string EngineConfig::resolved_conninfo() const {
    return database.conninfo.empty() ? PostgresConnection::conninfo_from_env() : database.conninfo;
}

} // namespace Stanchion
