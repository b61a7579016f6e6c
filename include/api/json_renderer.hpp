#pragma once

#include "api/anonymizer_service.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace textanon::json {

/**
 * @brief {anonymizedText, metadata:{originalLength, anonymizedLength,
 *        processingTimeMs, replacementsCount, patternsUsed, strategy,
 *        skippedOverlaps, replacements:[{pattern, original, replacement,
 *        strategy, position}]}}
 */
[[nodiscard]] std::string to_json(const AnonymizationResult& result);

/**
 * @brief {detected:{<name>:{count, examples, patternSource, sensitivity}},
 *        totalCount, hasSensitiveData, riskScore, riskLevel}
 */
[[nodiscard]] std::string to_json(const DetectionReport& report);

/**
 * @brief {success:true, name, patternSource, description} |
 *        {success:true, message} | {success:false, error}
 */
[[nodiscard]] std::string to_json(const PatternMutationResult& result);

/**
 * @brief {patterns:[{name, pattern, description, sensitivity}], total}
 */
[[nodiscard]] std::string to_json(const std::vector<PatternInfo>& patterns);

} // namespace textanon::json
