#pragma once

#include "core/random_source.hpp"
#include "strategy/replacement_strategy.hpp"

#include <memory>
#include <string>

namespace textanon {

/**
 * @brief Substitutes a structurally plausible synthetic value
 *
 * Category generators:
 * - EMAIL:       user<0-9999>@example.com
 * - PHONE:       +1-ddd-ddd-dddd
 * - SSN:         area 001-899 (never 666), group 01-99, serial 0001-9999
 * - CREDIT_CARD: Luhn-valid 16 digits starting with 4, dddd-dddd-dddd-dddd
 * - IPV4:        first octet 1-223, remaining octets 0-255
 *
 * Every other category gets "[ANONYMIZED_<PATTERN NAME UPPERCASE>]".
 * Values are drawn from the injected IRandomSource, so a seeded source makes
 * runs reproducible.
 */
class SyntheticReplaceStrategy : public IReplacementStrategy {
public:
    explicit SyntheticReplaceStrategy(std::shared_ptr<IRandomSource> random);

    [[nodiscard]] std::string apply(
        std::string_view original,
        const Pattern& pattern,
        const AnonymizationOptions& options) const override;

    [[nodiscard]] std::string_view name() const override { return strategy_names::kReplace; }

    [[nodiscard]] std::string generate_email() const;
    [[nodiscard]] std::string generate_phone() const;
    [[nodiscard]] std::string generate_ssn() const;
    [[nodiscard]] std::string generate_credit_card() const;
    [[nodiscard]] std::string generate_ipv4() const;

    [[nodiscard]] static std::string placeholder(std::string_view pattern_name);

    /**
     * @brief Luhn check over the digits of value (separators ignored)
     */
    [[nodiscard]] static bool luhn_valid(std::string_view value);

private:
    // Random number with exactly `digits` digits (no leading zero)
    [[nodiscard]] uint64_t random_digits(int digits) const;

    std::shared_ptr<IRandomSource> random_;
};

} // namespace textanon
