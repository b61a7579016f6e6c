#include "detector/detector.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <thread>

namespace textanon {

Detector::Detector(const Config& config)
    : config_(config) {
    if (config_.max_workers == 0) config_.max_workers = 1;
}

std::vector<Match> Detector::scan_pattern(
    const Pattern& pattern, std::string_view text, bool case_sensitive) {

    std::vector<Match> matches;
    const auto& re = pattern.regex(case_sensitive);

    // Text before pos stays visible as context for \b and ^
    size_t pos = 0;
    re2::StringPiece m;
    while (pos <= text.size() &&
           re.Match(text, pos, text.size(), RE2::UNANCHORED, &m, 1)) {
        const auto start = static_cast<size_t>(m.data() - text.data());
        const auto len = m.size();
        if (len == 0) {
            pos = start + 1;
            continue;
        }
        matches.emplace_back(pattern.name, std::string(m.data(), len),
                             start, start + len);
        pos = start + len;
    }

    return matches;
}

std::vector<Match> Detector::detect(
    const PatternSet& patterns,
    std::string_view text,
    const std::vector<std::string>& pattern_names,
    bool case_sensitive) const {

    // Resolve names in caller order; unknown names are not an error
    std::vector<std::shared_ptr<const Pattern>> resolved;
    resolved.reserve(pattern_names.size());
    for (const auto& name : pattern_names) {
        if (auto p = patterns.find(name)) {
            resolved.push_back(std::move(p));
        }
    }

    if (resolved.empty() || text.empty()) return {};

    std::vector<std::vector<Match>> per_pattern(resolved.size());

    const unsigned hw_threads = std::thread::hardware_concurrency();
    if (text.size() >= config_.parallel_threshold_bytes &&
        resolved.size() > 1 && hw_threads > 1) {
        // Parallel path: patterns are partitioned among workers, each worker
        // writes only into its own slots of per_pattern
        const unsigned num_workers = std::min<unsigned>(
            {hw_threads, config_.max_workers, static_cast<unsigned>(resolved.size())});

        auto scan_range = [&](size_t worker) {
            for (size_t i = worker; i < resolved.size(); i += num_workers) {
                per_pattern[i] = scan_pattern(*resolved[i], text, case_sensitive);
            }
        };

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);
        for (unsigned w = 0; w < num_workers; ++w) {
            futures.push_back(std::async(std::launch::async, scan_range, w));
        }
        for (auto& f : futures) f.get();
    } else {
        for (size_t i = 0; i < resolved.size(); ++i) {
            per_pattern[i] = scan_pattern(*resolved[i], text, case_sensitive);
        }
    }

    // Merge in pattern order, never arrival order
    size_t total = 0;
    for (const auto& v : per_pattern) total += v.size();

    std::vector<Match> result;
    result.reserve(total);
    for (auto& v : per_pattern) {
        std::move(v.begin(), v.end(), std::back_inserter(result));
    }
    return result;
}

std::vector<Match> Detector::detect(
    const PatternRegistry& registry,
    std::string_view text,
    const std::vector<std::string>& pattern_names,
    bool case_sensitive) const {

    const auto snapshot = registry.snapshot();
    return detect(*snapshot, text, pattern_names, case_sensitive);
}

} // namespace textanon
