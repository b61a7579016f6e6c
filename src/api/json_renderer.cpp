#include "api/json_renderer.hpp"
#include "core/utils.hpp"

#include <format>

namespace textanon::json {

namespace {

std::string string_array(const std::vector<std::string>& values) {
    std::string json = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) json += ",";
        json += std::format("\"{}\"", utils::escape_json(values[i]));
    }
    json += "]";
    return json;
}

} // anonymous namespace

std::string to_json(const AnonymizationResult& result) {
    std::string json = std::format(
        "{{\"anonymizedText\":\"{}\",\"metadata\":{{\"originalLength\":{},"
        "\"anonymizedLength\":{},\"processingTimeMs\":{:.3f},\"replacementsCount\":{},"
        "\"patternsUsed\":{},\"strategy\":\"{}\",\"skippedOverlaps\":{},\"replacements\":[",
        utils::escape_json(result.anonymized_text),
        result.original_length,
        result.anonymized_length,
        result.processing_time_ms,
        result.replacements.size(),
        string_array(result.patterns_used),
        utils::escape_json(result.strategy),
        result.skipped_overlaps);

    for (size_t i = 0; i < result.replacements.size(); ++i) {
        if (i > 0) json += ",";
        const auto& r = result.replacements[i];
        json += std::format(
            "{{\"pattern\":\"{}\",\"original\":\"{}\",\"replacement\":\"{}\","
            "\"strategy\":\"{}\",\"position\":{}}}",
            utils::escape_json(r.pattern_name), utils::escape_json(r.original),
            utils::escape_json(r.replacement), utils::escape_json(r.strategy),
            r.position);
    }
    json += "]}}";
    return json;
}

std::string to_json(const DetectionReport& report) {
    std::string json = "{\"detected\":{";
    for (size_t i = 0; i < report.detected.size(); ++i) {
        if (i > 0) json += ",";
        const auto& d = report.detected[i];
        json += std::format(
            "\"{}\":{{\"count\":{},\"examples\":{},\"patternSource\":\"{}\",\"sensitivity\":\"{}\"}}",
            utils::escape_json(d.name), d.count, string_array(d.examples),
            utils::escape_json(d.pattern_source), sensitivity_to_string(d.sensitivity));
    }
    json += std::format(
        "}},\"totalCount\":{},\"hasSensitiveData\":{},\"riskScore\":{},\"riskLevel\":\"{}\"}}",
        report.total_count, utils::booltostr(report.has_sensitive_data),
        report.risk_score, risk_level_to_string(report.risk_level));
    return json;
}

std::string to_json(const PatternMutationResult& result) {
    if (!result.success) {
        return std::format("{{\"success\":false,\"error\":\"{}\"}}",
                           utils::escape_json(result.error));
    }
    if (!result.message.empty()) {
        return std::format("{{\"success\":true,\"message\":\"{}\"}}",
                           utils::escape_json(result.message));
    }
    return std::format(
        "{{\"success\":true,\"name\":\"{}\",\"patternSource\":\"{}\",\"description\":\"{}\"}}",
        utils::escape_json(result.name), utils::escape_json(result.pattern_source),
        utils::escape_json(result.description));
}

std::string to_json(const std::vector<PatternInfo>& patterns) {
    std::string json = "{\"patterns\":[";
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (i > 0) json += ",";
        const auto& p = patterns[i];
        json += std::format(
            "{{\"name\":\"{}\",\"pattern\":\"{}\",\"description\":\"{}\",\"sensitivity\":\"{}\"}}",
            utils::escape_json(p.name), utils::escape_json(p.source),
            utils::escape_json(p.description.empty() ? "Custom pattern" : p.description),
            sensitivity_to_string(p.sensitivity));
    }
    json += std::format("],\"total\":{}}}", patterns.size());
    return json;
}

} // namespace textanon::json
