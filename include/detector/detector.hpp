#pragma once

#include "core/types.hpp"
#include "registry/pattern_registry.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace textanon {

/**
 * @brief Detector - locates pattern occurrences in the original text
 *
 * Output ordering is pattern-major: every match of the first resolved name
 * (ascending start), then every match of the second, and so on. It is never
 * globally sorted by position.
 *
 * Each pattern scans the unmodified input independently. Unknown names are
 * skipped. Scans run on RE2 in time linear in the input, with constant stack
 * depth, so arbitrarily long tokens are safe on any thread.
 *
 * Large inputs are scanned with one task per pattern; results are merged back
 * by pattern index.
 */
class Detector {
public:
    struct Config {
        size_t parallel_threshold_bytes = 64 * 1024;
        unsigned max_workers = 4;
    };

    Detector() : Detector(Config{}) {}
    explicit Detector(const Config& config);

    /**
     * @brief Scan text against an immutable registry snapshot
     * @param patterns Snapshot taken by the caller at scan start
     * @param text Original input
     * @param pattern_names Ordered selection; unknown names are skipped
     * @param case_sensitive Use the case-sensitive matcher
     */
    [[nodiscard]] std::vector<Match> detect(
        const PatternSet& patterns,
        std::string_view text,
        const std::vector<std::string>& pattern_names,
        bool case_sensitive) const;

    /**
     * @brief Convenience overload: snapshots the registry itself
     */
    [[nodiscard]] std::vector<Match> detect(
        const PatternRegistry& registry,
        std::string_view text,
        const std::vector<std::string>& pattern_names,
        bool case_sensitive) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] static std::vector<Match> scan_pattern(
        const Pattern& pattern, std::string_view text, bool case_sensitive);

    Config config_;
};

} // namespace textanon
