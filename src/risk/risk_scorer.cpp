#include "risk/risk_scorer.hpp"

namespace textanon {

RiskScorer::RiskScorer(const RiskPolicy& policy)
    : policy_(policy) {}

int RiskScorer::weight(SensitivityClass sensitivity) const {
    switch (sensitivity) {
        case SensitivityClass::HIGH:   return policy_.high_weight;
        case SensitivityClass::MEDIUM: return policy_.medium_weight;
        case SensitivityClass::LOW:    return policy_.low_weight;
        case SensitivityClass::OTHER:  return policy_.other_weight;
    }
    return policy_.other_weight;
}

int RiskScorer::score_points(const DetectionReport& report) const {
    int points = 0;
    for (const auto& d : report.detected) {
        points += static_cast<int>(d.count) * weight(d.sensitivity);
    }
    return points;
}

RiskLevel RiskScorer::classify(int points) const {
    if (points >= policy_.high_threshold) return RiskLevel::HIGH;
    if (points >= policy_.medium_threshold) return RiskLevel::MEDIUM;
    if (points >= policy_.low_threshold) return RiskLevel::LOW;
    return RiskLevel::NONE;
}

} // namespace textanon
