#include "api/anonymizer_service.hpp"

namespace textanon {

AnonymizerService::AnonymizerService(std::shared_ptr<AnonymizationPipeline> pipeline)
    : pipeline_(pipeline ? std::move(pipeline)
                         : std::make_shared<AnonymizationPipeline>(PipelineComponents{})) {}

AnonymizationResult AnonymizerService::anonymize(
    std::string_view text, const AnonymizationOptions& options) const {
    return pipeline_->anonymize(text, options);
}

DetectionReport AnonymizerService::detect_sensitive_data(
    std::string_view text,
    const std::optional<std::vector<std::string>>& patterns,
    bool case_sensitive) const {
    return pipeline_->detect_sensitive_data(text, patterns, case_sensitive);
}

PatternMutationResult AnonymizerService::add_custom_pattern(
    const std::string& name,
    const std::string& pattern_source,
    const std::string& description) {

    auto result = pipeline_->registry()->register_pattern(name, pattern_source, description);
    if (result.is_error()) {
        return PatternMutationResult::failure(result.error_category(), result.error_message());
    }

    PatternMutationResult r;
    r.success = true;
    r.name = result.value().name;
    r.pattern_source = result.value().source;
    r.description = result.value().description;
    return r;
}

PatternMutationResult AnonymizerService::remove_pattern(const std::string& name) {
    auto result = pipeline_->registry()->remove(name);
    if (result.is_error()) {
        return PatternMutationResult::failure(result.error_category(), result.error_message());
    }

    PatternMutationResult r;
    r.success = true;
    r.name = name;
    r.message = result.value();
    return r;
}

std::vector<PatternInfo> AnonymizerService::list_patterns() const {
    return pipeline_->registry()->list();
}

std::string AnonymizerService::get_pattern_description(const std::string& name) const {
    return pipeline_->registry()->description(name);
}

} // namespace textanon
