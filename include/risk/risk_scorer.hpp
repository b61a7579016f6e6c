#pragma once

#include "core/types.hpp"

namespace textanon {

/**
 * @brief Tunable risk policy constants
 *
 * points = sum(count * weight(sensitivity)); thresholds are inclusive lower
 * bounds for each level.
 */
struct RiskPolicy {
    int high_weight = 3;
    int medium_weight = 2;
    int low_weight = 1;
    int other_weight = 1;

    int high_threshold = 10;
    int medium_threshold = 5;
    int low_threshold = 1;
};

/**
 * @brief Aggregates detection counts into a coarse risk classification
 */
class RiskScorer {
public:
    RiskScorer() : RiskScorer(RiskPolicy{}) {}
    explicit RiskScorer(const RiskPolicy& policy);

    [[nodiscard]] int weight(SensitivityClass sensitivity) const;

    [[nodiscard]] int score_points(const DetectionReport& report) const;

    [[nodiscard]] RiskLevel classify(int points) const;

    [[nodiscard]] RiskLevel score(const DetectionReport& report) const {
        return classify(score_points(report));
    }

    [[nodiscard]] const RiskPolicy& policy() const { return policy_; }

private:
    RiskPolicy policy_;
};

} // namespace textanon
