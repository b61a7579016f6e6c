#include "strategy/hash_strategy.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <cstdlib>
#include <format>
#include <stdexcept>

namespace textanon {

namespace {

constexpr size_t kRollingHexLen = 8;
constexpr int kHmacHexBytes = 8;    // 16 hex chars

} // anonymous namespace

// ============================================================================
// HashStrategy
// ============================================================================

int32_t HashStrategy::rolling_hash(std::string_view value) {
    // Unsigned arithmetic gives the int32 wrap-around without signed overflow
    uint32_t h = 0;
    for (const char16_t unit : utils::to_utf16(value)) {
        h = (h << 5) - h + unit;
    }
    return static_cast<int32_t>(h);
}

std::string HashStrategy::label_prefix(std::string_view pattern_name) {
    if (pattern_name.empty()) return {};
    return std::string(1, static_cast<char>(
        std::toupper(static_cast<unsigned char>(pattern_name.front()))));
}

std::string HashStrategy::apply(
    std::string_view original,
    const Pattern& pattern,
    const AnonymizationOptions& /*options*/) const {

    const int64_t magnitude = std::llabs(static_cast<int64_t>(rolling_hash(original)));
    std::string hex = std::format("{:x}", magnitude);
    if (hex.size() > kRollingHexLen) {
        hex.resize(kRollingHexLen);
    }
    return std::format("{}_{}", label_prefix(pattern.name), hex);
}

// ============================================================================
// KeyedHashStrategy
// ============================================================================

KeyedHashStrategy::KeyedHashStrategy(std::string key)
    : key_(std::move(key)) {}

std::string KeyedHashStrategy::apply(
    std::string_view original,
    const Pattern& pattern,
    const AnonymizationOptions& /*options*/) const {

    if (key_.empty()) {
        throw std::runtime_error("hmac strategy requires a configured key");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const unsigned char* out = HMAC(EVP_sha256(),
         key_.data(), static_cast<int>(key_.size()),
         reinterpret_cast<const unsigned char*>(original.data()),
         original.size(),
         digest, &digest_len);
    if (!out || digest_len < static_cast<unsigned int>(kHmacHexBytes)) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    std::string result = HashStrategy::label_prefix(pattern.name);
    result += '_';
    for (int i = 0; i < kHmacHexBytes; ++i) {
        result += std::format("{:02x}", digest[i]);
    }
    return result;
}

} // namespace textanon
