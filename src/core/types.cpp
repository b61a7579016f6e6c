#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace textanon {

const char* sensitivity_to_string(SensitivityClass s) {
    switch (s) {
        case SensitivityClass::HIGH:   return "high";
        case SensitivityClass::MEDIUM: return "medium";
        case SensitivityClass::LOW:    return "low";
        case SensitivityClass::OTHER:  return "other";
    }
    return "other";
}

std::optional<SensitivityClass> parse_sensitivity(std::string_view str) {
    static const std::unordered_map<std::string, SensitivityClass> lookup = {
        {"high",   SensitivityClass::HIGH},
        {"medium", SensitivityClass::MEDIUM},
        {"low",    SensitivityClass::LOW},
        {"other",  SensitivityClass::OTHER},
    };

    const auto it = lookup.find(utils::to_lower(str));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

const char* risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::NONE:   return "NONE";
        case RiskLevel::LOW:    return "LOW";
        case RiskLevel::MEDIUM: return "MEDIUM";
        case RiskLevel::HIGH:   return "HIGH";
    }
    return "NONE";
}

} // namespace textanon
