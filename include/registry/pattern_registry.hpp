#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <re2/re2.h>

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace textanon {

/**
 * @brief A named, compiled matching rule for one category of sensitive data
 *
 * Immutable once registered; shared between snapshots by shared_ptr.
 */
struct Pattern {
    std::string name;
    std::string source;
    std::string description;
    SensitivityClass sensitivity = SensitivityClass::OTHER;
    PatternCategory category = PatternCategory::OTHER;
    std::unique_ptr<const re2::RE2> matcher;
    std::unique_ptr<const re2::RE2> matcher_icase;

    [[nodiscard]] const re2::RE2& regex(bool case_sensitive) const {
        return case_sensitive ? *matcher : *matcher_icase;
    }

    [[nodiscard]] PatternInfo info() const {
        return PatternInfo{name, source, description, sensitivity};
    }
};

/**
 * @brief Immutable registry snapshot (insertion-ordered)
 */
struct PatternSet {
    std::vector<std::shared_ptr<const Pattern>> ordered;
    std::unordered_map<std::string, size_t> index;  // name -> position in ordered

    [[nodiscard]] std::shared_ptr<const Pattern> find(const std::string& name) const {
        const auto it = index.find(name);
        if (it == index.end() || it->second >= ordered.size()) return nullptr;
        return ordered[it->second];
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(ordered.size());
        for (const auto& p : ordered) {
            result.push_back(p->name);
        }
        return result;
    }

    [[nodiscard]] size_t size() const { return ordered.size(); }
};

/**
 * @brief Pattern registry - owns built-in and custom pattern matchers
 *
 * Registration compiles the source with RE2 (once case-sensitive, once
 * case-insensitive). RE2 matches in linear time without recursion, so scan
 * cost and stack use do not grow with token length. Backreferences and
 * lookaround are rejected as INVALID_PATTERN_SYNTAX. Duplicate names overwrite the previous entry in place
 * (last-write-wins) and emit a warning; this is not an error.
 *
 * Thread-safety: RCU. Readers grab a shared_ptr snapshot under a shared lock,
 * writers copy the set, modify the copy and swap it under a unique lock. A
 * Detector pass running against a snapshot never observes a concurrent writer.
 */
class PatternRegistry {
public:
    PatternRegistry();

    /**
     * @brief Registry pre-loaded with the built-in patterns
     */
    [[nodiscard]] static std::shared_ptr<PatternRegistry> create_default();

    /**
     * @brief Register the built-in pattern set (email, phone, ssn, ...)
     */
    void load_builtin_patterns();

    /**
     * @brief Compile and insert (or overwrite) a pattern
     * @param name Unique key
     * @param source RE2 regex source
     * @param description Free-form description (may be empty)
     * @param sensitivity Explicit class; derived from the name when omitted
     * @return Stored pattern info, or INVALID_PATTERN_SYNTAX / INVALID_ARGUMENT
     */
    [[nodiscard]] Result<PatternInfo> register_pattern(
        const std::string& name,
        const std::string& source,
        const std::string& description = "",
        std::optional<SensitivityClass> sensitivity = std::nullopt);

    /**
     * @brief Remove a pattern
     * @return Confirmation message, or PATTERN_NOT_FOUND
     */
    [[nodiscard]] Result<std::string> remove(const std::string& name);

    /**
     * @brief Look up a pattern; nullptr when absent (not an error)
     */
    [[nodiscard]] std::shared_ptr<const Pattern> get(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    [[nodiscard]] std::vector<PatternInfo> list() const;

    /**
     * @brief Stored description, or "Custom pattern" when empty/unknown
     */
    [[nodiscard]] std::string description(const std::string& name) const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Immutable view for one detection pass
     */
    [[nodiscard]] std::shared_ptr<const PatternSet> snapshot() const;

    /**
     * @brief Number of registrations that replaced an existing name
     */
    [[nodiscard]] uint64_t overwrite_count() const {
        return overwrites_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] static PatternCategory category_for_name(const std::string& name);
    [[nodiscard]] static SensitivityClass default_sensitivity(PatternCategory category);

private:
    std::shared_ptr<const PatternSet> patterns_;
    mutable std::shared_mutex mutex_;
    std::atomic<uint64_t> overwrites_{0};
};

} // namespace textanon
