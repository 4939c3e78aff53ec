/**
 * @file engine_config.hpp
 * @brief Engine configuration from defaults, environment and JSON files
 */

#pragma once

#include <config/config_error.hpp>
#include <ensemble/reliability_table.hpp>
#include <vision/region_aggregator.hpp>
#include <string>

namespace Stanchion {

struct DatabaseConfig {
    std::string conninfo;       // empty: build from PG* environment
};

struct EngineConfig {
    ReliabilityTable weights;
    AggregatorConfig aggregator;
    DatabaseConfig database;
    double store_threshold = 0.5;   // decisions below are not written back
    bool enable_rule_source = true;

    /**
     * @brief Defaults overlaid with STANCHION_ORACLE_TIMEOUT_MS,
     *        STANCHION_STORE_THRESHOLD, STANCHION_RULES (on|off) and PG*
     * @throws ConfigError on malformed values
     */
    static EngineConfig from_env();

    /**
     * @brief Overlay a JSON document onto this configuration
     *
     * Keys: weights{verified, region_consensus, pattern_learned,
     * prior_analysis, rule_fallback}, aggregator{min_confidence, timeout_ms,
     * min_edge, max_edge}, store_threshold, enable_rules, database{conninfo}.
     * Missing keys keep their current value.
     * @throws ConfigError
     */
    void merge_json_file(const std::string& path);

    /**
     * @brief from_env() overlaid with the file at path
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @throws ConfigError
     */
    void validate() const;

    std::string resolved_conninfo() const;
};

} // namespace Stanchion
