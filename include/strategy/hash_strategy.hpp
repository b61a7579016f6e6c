#pragma once

#include "strategy/replacement_strategy.hpp"

#include <cstdint>
#include <string>

namespace textanon {

/**
 * @brief Pseudonymous label from a 32-bit rolling hash
 *
 * Output: "<First letter of pattern name, uppercased>_<hex>" where hex is
 * |h| in lowercase hex truncated to 8 characters and h is the int32
 * rolling hash h = h * 31 + unit over the UTF-16 code units of the value.
 * Non-ASCII values therefore get the same label as any UTF-16 based
 * implementation of the same hash.
 *
 * NOT a security primitive. The fingerprint is neither unique nor secret:
 * collisions between distinct inputs are expected and short inputs are
 * trivially brute-forced. Use KeyedHashStrategy ("hmac") when the label
 * must resist reversal.
 */
class HashStrategy : public IReplacementStrategy {
public:
    [[nodiscard]] std::string apply(
        std::string_view original,
        const Pattern& pattern,
        const AnonymizationOptions& options) const override;

    [[nodiscard]] std::string_view name() const override { return strategy_names::kHash; }

    [[nodiscard]] static int32_t rolling_hash(std::string_view value);

    // Uppercased first letter of the pattern name ("" for an empty name)
    [[nodiscard]] static std::string label_prefix(std::string_view pattern_name);
};

/**
 * @brief Keyed HMAC-SHA256 label: "<Prefix>_<first 16 hex chars>"
 *
 * Deterministic for a given key. Throws std::runtime_error when no key is
 * configured; the resolver then falls back to masking.
 */
class KeyedHashStrategy : public IReplacementStrategy {
public:
    explicit KeyedHashStrategy(std::string key);

    [[nodiscard]] std::string apply(
        std::string_view original,
        const Pattern& pattern,
        const AnonymizationOptions& options) const override;

    [[nodiscard]] std::string_view name() const override { return strategy_names::kHmac; }

    [[nodiscard]] bool has_key() const { return !key_.empty(); }

private:
    std::string key_;
};

} // namespace textanon
