#include "registry/pattern_registry.hpp"
#include "registry/builtin_patterns.hpp"
#include "core/utils.hpp"

#include <format>

namespace textanon {

namespace {

constexpr std::string_view kDefaultDescription = "Custom pattern";

std::unique_ptr<const re2::RE2> compile(const std::string& source, bool case_sensitive) {
    RE2::Options opts;
    opts.set_log_errors(false);
    opts.set_case_sensitive(case_sensitive);
    return std::make_unique<re2::RE2>(source, opts);
}

} // anonymous namespace

PatternRegistry::PatternRegistry()
    : patterns_(std::make_shared<const PatternSet>()) {}

std::shared_ptr<PatternRegistry> PatternRegistry::create_default() {
    auto registry = std::make_shared<PatternRegistry>();
    registry->load_builtin_patterns();
    return registry;
}

void PatternRegistry::load_builtin_patterns() {
    for (const auto& bp : builtin::kPatterns) {
        const auto result = register_pattern(
            std::string(bp.name), std::string(bp.source),
            std::string(bp.description), bp.sensitivity);
        if (result.is_error()) {
            utils::log::error(std::format("Built-in pattern '{}' failed to compile: {}",
                                          bp.name, result.error_message()));
        }
    }
}

PatternCategory PatternRegistry::category_for_name(const std::string& name) {
    static const std::unordered_map<std::string, PatternCategory> lookup = {
        {"email",       PatternCategory::EMAIL},
        {"e_mail",      PatternCategory::EMAIL},
        {"phone",       PatternCategory::PHONE},
        {"telephone",   PatternCategory::PHONE},
        {"mobile",      PatternCategory::PHONE},
        {"ssn",         PatternCategory::SSN},
        {"creditcard",  PatternCategory::CREDIT_CARD},
        {"credit_card", PatternCategory::CREDIT_CARD},
        {"credit-card", PatternCategory::CREDIT_CARD},
        {"card_number", PatternCategory::CREDIT_CARD},
        {"ipv4",        PatternCategory::IPV4},
        {"ipv6",        PatternCategory::IPV6},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? it->second : PatternCategory::OTHER;
}

SensitivityClass PatternRegistry::default_sensitivity(PatternCategory category) {
    switch (category) {
        case PatternCategory::SSN:
        case PatternCategory::CREDIT_CARD:
            return SensitivityClass::HIGH;
        case PatternCategory::EMAIL:
        case PatternCategory::PHONE:
        case PatternCategory::IPV4:
        case PatternCategory::IPV6:
            return SensitivityClass::MEDIUM;
        case PatternCategory::OTHER:
            break;
    }
    return SensitivityClass::OTHER;
}

Result<PatternInfo> PatternRegistry::register_pattern(
    const std::string& name,
    const std::string& source,
    const std::string& description,
    std::optional<SensitivityClass> sensitivity) {

    if (name.empty()) {
        return Result<PatternInfo>::error(ErrorCategory::INVALID_ARGUMENT,
                                          "Pattern name must not be empty");
    }

    // Compile outside the lock; compilation can be slow for complex sources
    auto pattern = std::make_shared<Pattern>();
    pattern->name = name;
    pattern->source = source;
    pattern->description = description;
    pattern->category = category_for_name(name);
    pattern->sensitivity = sensitivity.value_or(default_sensitivity(pattern->category));

    pattern->matcher = compile(source, true);
    pattern->matcher_icase = compile(source, false);
    for (const auto* re : {pattern->matcher.get(), pattern->matcher_icase.get()}) {
        if (!re->ok()) {
            return Result<PatternInfo>::error(
                ErrorCategory::INVALID_PATTERN_SYNTAX,
                std::format("Invalid pattern \"{}\": {}", name, re->error()));
        }
    }

    PatternInfo info = pattern->info();
    bool overwritten = false;
    {
        std::unique_lock lock(mutex_);
        // Copy-on-write: make mutable copy, insert/overwrite, swap
        auto new_set = std::make_shared<PatternSet>(*patterns_);
        const auto it = new_set->index.find(name);
        if (it != new_set->index.end()) {
            new_set->ordered[it->second] = std::move(pattern);
            overwritten = true;
        } else {
            new_set->index.emplace(name, new_set->ordered.size());
            new_set->ordered.push_back(std::move(pattern));
        }
        patterns_ = std::move(new_set);
    }

    if (overwritten) {
        overwrites_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Pattern \"{}\" already exists, overwriting", name));
    }

    return Result<PatternInfo>::ok(std::move(info));
}

Result<std::string> PatternRegistry::remove(const std::string& name) {
    std::unique_lock lock(mutex_);
    if (patterns_->index.find(name) == patterns_->index.end()) {
        return Result<std::string>::error(ErrorCategory::PATTERN_NOT_FOUND,
                                          std::format("Pattern \"{}\" not found", name));
    }

    auto new_set = std::make_shared<PatternSet>();
    new_set->ordered.reserve(patterns_->ordered.size() - 1);
    for (const auto& p : patterns_->ordered) {
        if (p->name == name) continue;
        new_set->index.emplace(p->name, new_set->ordered.size());
        new_set->ordered.push_back(p);
    }
    patterns_ = std::move(new_set);

    return Result<std::string>::ok(std::format("Pattern \"{}\" removed", name));
}

std::shared_ptr<const Pattern> PatternRegistry::get(const std::string& name) const {
    return snapshot()->find(name);
}

bool PatternRegistry::contains(const std::string& name) const {
    return get(name) != nullptr;
}

std::vector<PatternInfo> PatternRegistry::list() const {
    const auto set = snapshot();
    std::vector<PatternInfo> result;
    result.reserve(set->size());
    for (const auto& p : set->ordered) {
        result.push_back(p->info());
    }
    return result;
}

std::string PatternRegistry::description(const std::string& name) const {
    const auto pattern = get(name);
    if (!pattern || pattern->description.empty()) {
        return std::string(kDefaultDescription);
    }
    return pattern->description;
}

size_t PatternRegistry::size() const {
    std::shared_lock lock(mutex_);
    return patterns_->size();
}

std::shared_ptr<const PatternSet> PatternRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return patterns_;
}

} // namespace textanon
