#pragma once

#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace textanon {

/**
 * @brief Discriminated payload of a registry mutation
 *
 * success=true:  name/pattern_source/description (add) or message (remove)
 * success=false: error + error_category
 */
struct PatternMutationResult {
    bool success = false;
    std::string name;
    std::string pattern_source;
    std::string description;
    std::string message;
    std::string error;
    ErrorCategory error_category = ErrorCategory::NONE;

    static PatternMutationResult failure(ErrorCategory category, std::string msg) {
        PatternMutationResult r;
        r.success = false;
        r.error_category = category;
        r.error = std::move(msg);
        return r;
    }
};

/**
 * @brief External interface of the anonymization engine
 *
 * Wraps the pipeline and its registry. Mutations never throw for expected
 * failures; anonymize() raises only PipelineFailure.
 */
class AnonymizerService {
public:
    explicit AnonymizerService(std::shared_ptr<AnonymizationPipeline> pipeline);

    [[nodiscard]] AnonymizationResult anonymize(
        std::string_view text,
        const AnonymizationOptions& options = AnonymizationOptions{}) const;

    [[nodiscard]] DetectionReport detect_sensitive_data(
        std::string_view text,
        const std::optional<std::vector<std::string>>& patterns = std::nullopt,
        bool case_sensitive = false) const;

    [[nodiscard]] PatternMutationResult add_custom_pattern(
        const std::string& name,
        const std::string& pattern_source,
        const std::string& description = "");

    [[nodiscard]] PatternMutationResult remove_pattern(const std::string& name);

    [[nodiscard]] std::vector<PatternInfo> list_patterns() const;

    [[nodiscard]] std::string get_pattern_description(const std::string& name) const;

    [[nodiscard]] std::shared_ptr<AnonymizationPipeline> pipeline() const { return pipeline_; }

private:
    std::shared_ptr<AnonymizationPipeline> pipeline_;
};

} // namespace textanon
