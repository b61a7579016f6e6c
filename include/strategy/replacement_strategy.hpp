#pragma once

#include "core/types.hpp"
#include "registry/pattern_registry.hpp"

#include <string>
#include <string_view>

namespace textanon {

/**
 * @brief Interface for replacement strategies
 *
 * A strategy turns the original text of one match into its replacement.
 * Implementations must be pure given their inputs, except where they draw
 * from an injected random source. Throwing from apply() is allowed: the
 * resolver isolates the failure and falls back to masking for that match.
 */
class IReplacementStrategy {
public:
    virtual ~IReplacementStrategy() = default;

    /**
     * @brief Produce the replacement text
     * @param original Matched substring of the original input
     * @param pattern Pattern that produced the match (name, category)
     * @param options Options of the current anonymize() call
     */
    [[nodiscard]] virtual std::string apply(
        std::string_view original,
        const Pattern& pattern,
        const AnonymizationOptions& options) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

/**
 * @brief Drops the match entirely
 */
class RemoveStrategy : public IReplacementStrategy {
public:
    [[nodiscard]] std::string apply(
        std::string_view /*original*/,
        const Pattern& /*pattern*/,
        const AnonymizationOptions& /*options*/) const override {
        return {};
    }

    [[nodiscard]] std::string_view name() const override { return strategy_names::kRemove; }
};

} // namespace textanon
