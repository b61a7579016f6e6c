#pragma once

#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "core/types.hpp"
#include "detector/detector.hpp"
#include "risk/risk_scorer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace textanon {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Custom Pattern Config ([[custom_patterns]])
// ============================================================================

struct CustomPatternConfig {
    std::string name;
    std::string pattern;
    std::string description;
    std::optional<SensitivityClass> sensitivity;
};

// ============================================================================
// Anonymizer Settings ([anonymizer])
// ============================================================================

struct AnonymizerSettings {
    std::string default_strategy = "mask";
    bool preserve_format = true;
    bool case_sensitive = false;
    std::optional<std::vector<std::string>> patterns;   // nullopt = all
    bool builtin_patterns = true;
    std::string hmac_key;
    std::optional<uint64_t> random_seed;
};

// ============================================================================
// Top-level config
// ============================================================================

struct AnonymizerConfig {
    LoggingConfig logging;
    AnonymizerSettings anonymizer;
    Detector::Config detector;
    RiskPolicy risk;
    std::vector<CustomPatternConfig> custom_patterns;
    std::unordered_map<std::string, PatternOverride> overrides;

    /**
     * @brief Call options derived from [anonymizer] and [overrides.*]
     */
    [[nodiscard]] AnonymizationOptions default_options() const;
};

// ============================================================================
// Config Loader
// ============================================================================

/**
 * @brief Loads anonymizer.toml and assembles a pipeline from it
 *
 * String values support ${VAR} substitution from the environment. Unset
 * variables expand to the empty string.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AnonymizerConfig config;

        static LoadResult ok(AnonymizerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load and validate config from a TOML file
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load and validate config from a TOML string (used by tests)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a parsed config
     * @return One message per problem, each naming the offending key; empty if valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AnonymizerConfig& config);

    /**
     * @brief Registry, resolver, detector and risk policy from a validated config
     */
    [[nodiscard]] static Result<std::shared_ptr<AnonymizationPipeline>> build_pipeline(
        const AnonymizerConfig& config);

    /**
     * @brief Replace ${VAR} with the environment value
     * @throws std::runtime_error on an unclosed ${
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);
};

} // namespace textanon
