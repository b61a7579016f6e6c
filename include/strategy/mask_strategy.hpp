#pragma once

#include "strategy/replacement_strategy.hpp"

namespace textanon {

/**
 * @brief Category-aware partial redaction
 *
 * - EMAIL:       first + last char of the local part kept, interior '*',
 *                domain unchanged ("jane.doe@x.com" -> "j******e@x.com")
 * - PHONE:       "***-***-<last4>"; fewer than 4 digits -> fully masked
 * - SSN:         "***-**-<last4>"; fewer than 4 digits -> fully masked
 * - CREDIT_CARD: "****-****-****-<last4>" for exactly 16 digits, else fully masked
 * - other:       preserve_format -> every [A-Za-z0-9] becomes '*';
 *                otherwise one '*' per character
 */
class MaskStrategy : public IReplacementStrategy {
public:
    [[nodiscard]] std::string apply(
        std::string_view original,
        const Pattern& pattern,
        const AnonymizationOptions& options) const override;

    [[nodiscard]] std::string_view name() const override { return strategy_names::kMask; }

    [[nodiscard]] static std::string mask_email(std::string_view value);
    [[nodiscard]] static std::string mask_phone(std::string_view value);
    [[nodiscard]] static std::string mask_ssn(std::string_view value);
    [[nodiscard]] static std::string mask_credit_card(std::string_view value);
    [[nodiscard]] static std::string mask_generic(std::string_view value, bool preserve_format);

    // One '*' per UTF-8 code point
    [[nodiscard]] static std::string full_mask(std::string_view value);
};

} // namespace textanon
