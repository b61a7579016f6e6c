#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace textanon {

/**
 * @brief Injectable randomness for synthetic value generation
 *
 * Production uses Mt19937RandomSource; tests inject a seeded or scripted
 * source so anonymization runs are reproducible.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Uniform integer in the closed range [lo, hi]
     */
    [[nodiscard]] virtual uint64_t next_in_range(uint64_t lo, uint64_t hi) = 0;
};

/**
 * @brief Mersenne-twister source; seeded runs are deterministic.
 *
 * Thread-safety: next_in_range() is serialized by an internal mutex.
 */
class Mt19937RandomSource : public IRandomSource {
public:
    explicit Mt19937RandomSource(std::optional<uint64_t> seed = std::nullopt);

    [[nodiscard]] uint64_t next_in_range(uint64_t lo, uint64_t hi) override;

private:
    std::mt19937_64 gen_;
    std::mutex mutex_;
};

} // namespace textanon
