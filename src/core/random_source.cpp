#include "core/random_source.hpp"

#include <utility>

namespace textanon {

Mt19937RandomSource::Mt19937RandomSource(std::optional<uint64_t> seed) {
    if (seed) {
        gen_.seed(*seed);
    } else {
        std::random_device rd;
        gen_.seed((static_cast<uint64_t>(rd()) << 32) | rd());
    }
}

uint64_t Mt19937RandomSource::next_in_range(uint64_t lo, uint64_t hi) {
    if (lo > hi) std::swap(lo, hi);
    std::uniform_int_distribution<uint64_t> dis(lo, hi);
    std::lock_guard<std::mutex> lock(mutex_);
    return dis(gen_);
}

} // namespace textanon
