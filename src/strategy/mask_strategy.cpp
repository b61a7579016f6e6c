#include "strategy/mask_strategy.hpp"
#include "core/utils.hpp"

#include <cctype>

namespace textanon {

namespace {

constexpr char kMaskChar = '*';
constexpr size_t kVisibleDigits = 4;
constexpr size_t kCardDigits = 16;

} // anonymous namespace

std::string MaskStrategy::apply(
    std::string_view original,
    const Pattern& pattern,
    const AnonymizationOptions& options) const {

    switch (pattern.category) {
        case PatternCategory::EMAIL:
            return mask_email(original);
        case PatternCategory::PHONE:
            return mask_phone(original);
        case PatternCategory::SSN:
            return mask_ssn(original);
        case PatternCategory::CREDIT_CARD:
            return mask_credit_card(original);
        case PatternCategory::IPV4:
        case PatternCategory::IPV6:
        case PatternCategory::OTHER:
            break;
    }
    return mask_generic(original, options.preserve_format);
}

std::string MaskStrategy::full_mask(std::string_view value) {
    return std::string(utils::utf8_length(value), kMaskChar);
}

std::string MaskStrategy::mask_email(std::string_view value) {
    const auto at = value.find('@');
    if (at == std::string_view::npos) {
        return full_mask(value);
    }

    const auto local = value.substr(0, at);
    const auto domain = value.substr(at + 1);

    std::string result;
    result.reserve(value.size());
    if (!local.empty()) {
        result += local.front();
        if (local.size() > 2) {
            result.append(local.size() - 2, kMaskChar);
        }
        if (local.size() > 1) {
            result += local.back();
        }
    }
    result += '@';
    result.append(domain);
    return result;
}

std::string MaskStrategy::mask_phone(std::string_view value) {
    const std::string digits = utils::digits_only(value);
    if (digits.size() < kVisibleDigits) {
        return full_mask(value);
    }
    return "***-***-" + digits.substr(digits.size() - kVisibleDigits);
}

std::string MaskStrategy::mask_ssn(std::string_view value) {
    const std::string digits = utils::digits_only(value);
    if (digits.size() < kVisibleDigits) {
        return full_mask(value);
    }
    return "***-**-" + digits.substr(digits.size() - kVisibleDigits);
}

std::string MaskStrategy::mask_credit_card(std::string_view value) {
    const std::string digits = utils::digits_only(value);
    if (digits.size() != kCardDigits) {
        return full_mask(value);
    }
    return "****-****-****-" + digits.substr(digits.size() - kVisibleDigits);
}

std::string MaskStrategy::mask_generic(std::string_view value, bool preserve_format) {
    if (!preserve_format) {
        return full_mask(value);
    }

    std::string result(value);
    for (char& c : result) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::isalnum(uc)) {
            c = kMaskChar;
        }
    }
    return result;
}

} // namespace textanon
