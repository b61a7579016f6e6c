#include "core/pipeline.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <unordered_map>

namespace textanon {

namespace {

/**
 * @brief Non-overlapping span bookkeeping (start -> end, half-open)
 */
class SpanClaims {
public:
    [[nodiscard]] bool overlaps(size_t start, size_t end) const {
        auto it = spans_.lower_bound(start);
        if (it != spans_.end() && it->first < end) return true;
        if (it != spans_.begin() && std::prev(it)->second > start) return true;
        return false;
    }

    void claim(size_t start, size_t end) { spans_.emplace(start, end); }

private:
    std::map<size_t, size_t> spans_;
};

struct AcceptedSpan {
    size_t start;
    size_t end;
    size_t record;      // Index into result.replacements
};

std::vector<std::string> selected_names(
    const PatternSet& snapshot,
    const std::optional<std::vector<std::string>>& selection) {
    return selection ? *selection : snapshot.names();
}

} // anonymous namespace

AnonymizationPipeline::AnonymizationPipeline(PipelineComponents components)
    : registry_(components.registry ? std::move(components.registry)
                                    : PatternRegistry::create_default()),
      resolver_(components.resolver ? std::move(components.resolver)
                                    : std::make_shared<StrategyResolver>()),
      detector_(components.detector),
      scorer_(components.risk) {}

AnonymizationResult AnonymizationPipeline::anonymize(
    std::string_view text,
    const AnonymizationOptions& options) const {

    anonymize_calls_.fetch_add(1, std::memory_order_relaxed);

    try {
        auto result = run_anonymize(text, options);
        replacements_.fetch_add(result.replacements.size(), std::memory_order_relaxed);
        return result;
    } catch (const PipelineFailure&) {
        throw;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Anonymization failed: {}", e.what()));
        throw PipelineFailure(e.what());
    } catch (...) {
        utils::log::error("Anonymization failed: unknown error");
        throw PipelineFailure("unknown error");
    }
}

AnonymizationResult AnonymizationPipeline::run_anonymize(
    std::string_view text,
    const AnonymizationOptions& options) const {

    const utils::Timer timer;

    // Layer 1: one immutable snapshot for the whole call
    const auto snapshot = registry_->snapshot();
    const auto names = selected_names(*snapshot, options.selected_patterns);

    // Layer 2: detection over the original text
    const auto matches = detector_.detect(*snapshot, text, names, options.case_sensitive);

    // Layer 3: resolve replacements in pattern-major order
    AnonymizationResult result;
    result.replacements.reserve(matches.size());

    SpanClaims claims;
    std::vector<AcceptedSpan> accepted;
    accepted.reserve(matches.size());

    for (const auto& m : matches) {
        if (claims.overlaps(m.start, m.end)) {
            ++result.skipped_overlaps;
            continue;
        }

        const auto pattern = snapshot->find(m.pattern_name);
        if (!pattern) continue;

        auto resolution = resolver_->resolve(m.text, *pattern, options);

        claims.claim(m.start, m.end);
        accepted.push_back({m.start, m.end, result.replacements.size()});
        result.replacements.emplace_back(m.pattern_name, m.text,
                                         std::move(resolution.replacement),
                                         std::move(resolution.strategy),
                                         m.start);
    }

    // Layer 4: splice by span against a single output buffer
    std::sort(accepted.begin(), accepted.end(),
              [](const AcceptedSpan& a, const AcceptedSpan& b) { return a.start < b.start; });

    std::string output;
    output.reserve(text.size());
    size_t cursor = 0;
    for (const auto& span : accepted) {
        output.append(text.substr(cursor, span.start - cursor));
        output.append(result.replacements[span.record].replacement);
        cursor = span.end;
    }
    output.append(text.substr(cursor));

    // Metadata
    result.anonymized_text = std::move(output);
    result.original_length = text.size();
    result.anonymized_length = result.anonymized_text.size();
    result.patterns_used = names;
    result.strategy = options.default_strategy;
    result.processing_time_ms = timer.elapsed_ms_fractional();

    return result;
}

DetectionReport AnonymizationPipeline::detect_sensitive_data(
    std::string_view text,
    const std::optional<std::vector<std::string>>& patterns,
    bool case_sensitive) const {

    detect_calls_.fetch_add(1, std::memory_order_relaxed);

    try {
        const auto snapshot = registry_->snapshot();
        const auto names = selected_names(*snapshot, patterns);
        const auto matches = detector_.detect(*snapshot, text, names, case_sensitive);

        DetectionReport report;
        std::unordered_map<std::string, size_t> slot;   // pattern name -> index in detected

        for (const auto& m : matches) {
            const auto [it, inserted] = slot.try_emplace(m.pattern_name, report.detected.size());
            if (inserted) {
                PatternDetection entry;
                entry.name = m.pattern_name;
                if (const auto pattern = snapshot->find(m.pattern_name)) {
                    entry.pattern_source = pattern->source;
                    entry.sensitivity = pattern->sensitivity;
                }
                report.detected.push_back(std::move(entry));
            }

            auto& entry = report.detected[it->second];
            ++entry.count;
            if (entry.examples.size() < DetectionReport::kMaxExamples) {
                entry.examples.push_back(m.text);
            }
        }

        report.total_count = matches.size();
        report.has_sensitive_data = report.total_count > 0;
        report.risk_score = scorer_.score_points(report);
        report.risk_level = scorer_.classify(report.risk_score);
        return report;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Detection failed: {}", e.what()));
        throw PipelineFailure(e.what());
    }
}

} // namespace textanon
