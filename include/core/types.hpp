#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace textanon {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Sensitivity class of a pattern (drives risk weighting only)
 */
enum class SensitivityClass {
    HIGH,
    MEDIUM,
    LOW,
    OTHER
};

/**
 * @brief Data category of a pattern (drives category-aware masking and
 *        synthetic value generation)
 */
enum class PatternCategory {
    EMAIL,
    PHONE,
    SSN,
    CREDIT_CARD,
    IPV4,
    IPV6,
    OTHER
};

enum class RiskLevel {
    NONE,
    LOW,
    MEDIUM,
    HIGH
};

[[nodiscard]] const char* sensitivity_to_string(SensitivityClass s);
[[nodiscard]] std::optional<SensitivityClass> parse_sensitivity(std::string_view str);
[[nodiscard]] const char* risk_level_to_string(RiskLevel level);

// ============================================================================
// Built-in strategy names
// ============================================================================

namespace strategy_names {
    inline constexpr std::string_view kMask    = "mask";
    inline constexpr std::string_view kHash    = "hash";
    inline constexpr std::string_view kHmac    = "hmac";
    inline constexpr std::string_view kReplace = "replace";
    inline constexpr std::string_view kRemove  = "remove";
    inline constexpr std::string_view kLiteral = "literal";

    [[nodiscard]] inline bool is_builtin(std::string_view name) {
        return name == kMask || name == kHash || name == kHmac ||
               name == kReplace || name == kRemove;
    }
}

// ============================================================================
// Detection Types
// ============================================================================

/**
 * @brief One located occurrence of a pattern in the original input
 *
 * Offsets are byte offsets into the unmodified input:
 * 0 <= start <= end <= input.size() and input.substr(start, end - start) == text.
 */
struct Match {
    std::string pattern_name;
    std::string text;
    size_t start = 0;
    size_t end = 0;

    Match() = default;
    Match(std::string name, std::string t, size_t s, size_t e)
        : pattern_name(std::move(name)), text(std::move(t)), start(s), end(e) {}

    [[nodiscard]] size_t length() const { return end - start; }
};

/**
 * @brief Read-only view of a registered pattern (for listing)
 */
struct PatternInfo {
    std::string name;
    std::string source;
    std::string description;
    SensitivityClass sensitivity = SensitivityClass::OTHER;
};

struct PatternDetection {
    std::string name;
    size_t count = 0;
    std::vector<std::string> examples;      // First 3 occurrences
    std::string pattern_source;
    SensitivityClass sensitivity = SensitivityClass::OTHER;
};

struct DetectionReport {
    std::vector<PatternDetection> detected;  // Pattern order, only patterns with hits
    size_t total_count = 0;
    bool has_sensitive_data = false;
    int risk_score = 0;
    RiskLevel risk_level = RiskLevel::NONE;

    static constexpr size_t kMaxExamples = 3;

    [[nodiscard]] const PatternDetection* find(std::string_view name) const {
        for (const auto& d : detected) {
            if (d.name == name) return &d;
        }
        return nullptr;
    }
};

// ============================================================================
// Anonymization Types
// ============================================================================

struct PatternOverride {
    std::optional<std::string> strategy;
    std::optional<std::string> literal_replacement;
};

struct AnonymizationOptions {
    // nullopt = every registered pattern, in registry order
    std::optional<std::vector<std::string>> selected_patterns;
    std::string default_strategy = std::string(strategy_names::kMask);
    std::unordered_map<std::string, PatternOverride> per_pattern_override;
    bool preserve_format = true;
    bool case_sensitive = false;
};

struct ReplacementRecord {
    std::string pattern_name;
    std::string original;
    std::string replacement;
    std::string strategy;       // Strategy that actually produced the replacement
    size_t position = 0;        // Match start in the original text

    ReplacementRecord() = default;
    ReplacementRecord(std::string pattern, std::string orig, std::string repl,
                      std::string strat, size_t pos)
        : pattern_name(std::move(pattern)), original(std::move(orig)),
          replacement(std::move(repl)), strategy(std::move(strat)), position(pos) {}
};

struct AnonymizationResult {
    std::string anonymized_text;
    size_t original_length = 0;
    size_t anonymized_length = 0;
    double processing_time_ms = 0.0;
    std::vector<ReplacementRecord> replacements;    // Pattern-major order
    std::vector<std::string> patterns_used;
    std::string strategy;                           // Default strategy
    size_t skipped_overlaps = 0;
};

} // namespace textanon
