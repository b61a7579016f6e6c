#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "detector/detector.hpp"
#include "registry/pattern_registry.hpp"
#include "risk/risk_scorer.hpp"
#include "strategy/strategy_resolver.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textanon {

/**
 * @brief Collaborators injected into the pipeline
 *
 * Null registry/resolver are replaced with a default registry (built-ins
 * loaded) and a default resolver.
 */
struct PipelineComponents {
    std::shared_ptr<PatternRegistry> registry;
    std::shared_ptr<StrategyResolver> resolver;
    Detector::Config detector;
    RiskPolicy risk;
};

/**
 * @brief Anonymization pipeline - detect, resolve, splice
 *
 * anonymize():
 * 1. Snapshot the registry (one snapshot per call)
 * 2. Detect over the selected patterns (pattern-major order)
 * 3. For each match in that order: skip it if its span overlaps an already
 *    accepted span, otherwise resolve a replacement and record it
 * 4. Rebuild the output in one forward pass over the accepted spans sorted
 *    by start, splicing each (start, end) against the original text
 *
 * Replacement is always by recorded span, never by searching for the matched
 * value, so repeated values are each replaced exactly once.
 *
 * detect_sensitive_data() is read-only: detect, tally, score.
 *
 * Thread-safety: stateless per call apart from counters; safe to share.
 */
class AnonymizationPipeline {
public:
    explicit AnonymizationPipeline(PipelineComponents components);

    /**
     * @brief Anonymize text
     * @throws PipelineFailure on any failure outside per-match isolation
     */
    [[nodiscard]] AnonymizationResult anonymize(
        std::string_view text,
        const AnonymizationOptions& options = AnonymizationOptions{}) const;

    /**
     * @brief Detect-only pass with counts, examples and risk
     * @param patterns Ordered selection; nullopt = all registered patterns
     */
    [[nodiscard]] DetectionReport detect_sensitive_data(
        std::string_view text,
        const std::optional<std::vector<std::string>>& patterns = std::nullopt,
        bool case_sensitive = false) const;

    [[nodiscard]] std::shared_ptr<PatternRegistry> registry() const { return registry_; }
    [[nodiscard]] std::shared_ptr<StrategyResolver> resolver() const { return resolver_; }
    [[nodiscard]] const RiskScorer& risk_scorer() const { return scorer_; }

    struct Stats {
        uint64_t anonymize_calls;
        uint64_t detect_calls;
        uint64_t replacements;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            anonymize_calls_.load(std::memory_order_relaxed),
            detect_calls_.load(std::memory_order_relaxed),
            replacements_.load(std::memory_order_relaxed)
        };
    }

private:
    [[nodiscard]] AnonymizationResult run_anonymize(
        std::string_view text,
        const AnonymizationOptions& options) const;

    std::shared_ptr<PatternRegistry> registry_;
    std::shared_ptr<StrategyResolver> resolver_;
    Detector detector_;
    RiskScorer scorer_;

    mutable std::atomic<uint64_t> anonymize_calls_{0};
    mutable std::atomic<uint64_t> detect_calls_{0};
    mutable std::atomic<uint64_t> replacements_{0};
};

} // namespace textanon
