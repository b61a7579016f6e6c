#include "strategy/strategy_resolver.hpp"
#include "strategy/hash_strategy.hpp"
#include "strategy/synthetic_replace_strategy.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace textanon {

StrategyResolver::StrategyResolver(std::shared_ptr<IRandomSource> random, const Config& config) {
    strategies_.emplace(strategy_names::kMask, std::make_shared<MaskStrategy>());
    strategies_.emplace(strategy_names::kHash, std::make_shared<HashStrategy>());
    strategies_.emplace(strategy_names::kHmac, std::make_shared<KeyedHashStrategy>(config.hmac_key));
    strategies_.emplace(strategy_names::kReplace,
                        std::make_shared<SyntheticReplaceStrategy>(std::move(random)));
    strategies_.emplace(strategy_names::kRemove, std::make_shared<RemoveStrategy>());
}

void StrategyResolver::register_strategy(
    std::string name, std::shared_ptr<const IReplacementStrategy> strategy) {
    if (!strategy) return;
    std::unique_lock lock(mutex_);
    strategies_.insert_or_assign(std::move(name), std::move(strategy));
}

bool StrategyResolver::has_strategy(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<std::string> StrategyResolver::strategy_names() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(mutex_);
        names.reserve(strategies_.size());
        for (const auto& [name, _] : strategies_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::shared_ptr<const IReplacementStrategy> StrategyResolver::find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto it = strategies_.find(name);
    return (it != strategies_.end()) ? it->second : nullptr;
}

StrategyResolver::Resolution StrategyResolver::resolve(
    std::string_view original,
    const Pattern& pattern,
    const AnonymizationOptions& options) const {

    std::shared_ptr<const IReplacementStrategy> strategy;
    std::string strategy_name;

    const auto ov = options.per_pattern_override.find(pattern.name);
    if (ov != options.per_pattern_override.end()) {
        if (ov->second.literal_replacement) {
            return Resolution{*ov->second.literal_replacement,
                              std::string(strategy_names::kLiteral), false};
        }
        if (ov->second.strategy) {
            strategy = find(*ov->second.strategy);
            if (strategy) strategy_name = *ov->second.strategy;
        }
    }

    if (!strategy) {
        strategy = find(options.default_strategy);
        if (strategy) strategy_name = options.default_strategy;
    }

    if (!strategy) {
        return Resolution{mask_.apply(original, pattern, options),
                          std::string(strategy_names::kMask), false};
    }

    try {
        return Resolution{strategy->apply(original, pattern, options), std::move(strategy_name), false};
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Strategy '{}' failed for pattern \"{}\", masking instead: {}",
                                     strategy_name, pattern.name, e.what()));
    } catch (...) {
        utils::log::warn(std::format("Strategy '{}' failed for pattern \"{}\", masking instead: unknown error",
                                     strategy_name, pattern.name));
    }

    fallbacks_.fetch_add(1, std::memory_order_relaxed);
    return Resolution{mask_.apply(original, pattern, options),
                      std::string(strategy_names::kMask), true};
}

} // namespace textanon
