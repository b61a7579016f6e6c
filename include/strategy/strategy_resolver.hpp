#pragma once

#include "core/random_source.hpp"
#include "strategy/mask_strategy.hpp"
#include "strategy/replacement_strategy.hpp"

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace textanon {

/**
 * @brief Chooses and runs the replacement strategy for each match
 *
 * Precedence for a match of pattern P:
 * 1. options.per_pattern_override[P].literal_replacement, used verbatim
 * 2. options.per_pattern_override[P].strategy, if the name is registered
 * 3. options.default_strategy, if the name is registered
 * 4. mask
 *
 * A strategy that throws is isolated to its match: the match is masked
 * instead, the failure is logged and counted, and nothing propagates.
 *
 * Built-in strategies: mask, hash, hmac, replace, remove. register_strategy()
 * adds custom strategies or replaces built-ins.
 */
class StrategyResolver {
public:
    struct Config {
        std::string hmac_key;
    };

    struct Resolution {
        std::string replacement;
        std::string strategy;       // Name of the strategy that produced it
        bool fell_back = false;     // True if the chosen strategy threw
    };

    StrategyResolver() : StrategyResolver(nullptr, Config{}) {}
    explicit StrategyResolver(std::shared_ptr<IRandomSource> random,
                              const Config& config = Config{});

    [[nodiscard]] Resolution resolve(
        std::string_view original,
        const Pattern& pattern,
        const AnonymizationOptions& options) const;

    void register_strategy(std::string name, std::shared_ptr<const IReplacementStrategy> strategy);

    [[nodiscard]] bool has_strategy(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> strategy_names() const;

    /**
     * @brief Number of matches that fell back to mask after a strategy failure
     */
    [[nodiscard]] uint64_t fallback_count() const {
        return fallbacks_.load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] std::shared_ptr<const IReplacementStrategy> find(const std::string& name) const;

    MaskStrategy mask_;
    std::unordered_map<std::string, std::shared_ptr<const IReplacementStrategy>> strategies_;
    mutable std::shared_mutex mutex_;
    mutable std::atomic<uint64_t> fallbacks_{0};
};

} // namespace textanon
