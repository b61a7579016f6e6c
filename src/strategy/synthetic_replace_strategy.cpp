#include "strategy/synthetic_replace_strategy.hpp"
#include "core/utils.hpp"

#include <format>

namespace textanon {

namespace {

constexpr int kCardPayloadDigits = 15;

// Digit that makes payload + digit pass the Luhn check
int luhn_check_digit(const std::string& payload) {
    int sum = 0;
    bool double_digit = true;   // rightmost payload digit sits next to the check digit
    for (int i = static_cast<int>(payload.size()) - 1; i >= 0; --i) {
        int digit = payload[i] - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
        double_digit = !double_digit;
    }
    return (10 - (sum % 10)) % 10;
}

} // anonymous namespace

SyntheticReplaceStrategy::SyntheticReplaceStrategy(std::shared_ptr<IRandomSource> random)
    : random_(random ? std::move(random) : std::make_shared<Mt19937RandomSource>()) {}

std::string SyntheticReplaceStrategy::apply(
    std::string_view /*original*/,
    const Pattern& pattern,
    const AnonymizationOptions& /*options*/) const {

    switch (pattern.category) {
        case PatternCategory::EMAIL:
            return generate_email();
        case PatternCategory::PHONE:
            return generate_phone();
        case PatternCategory::SSN:
            return generate_ssn();
        case PatternCategory::CREDIT_CARD:
            return generate_credit_card();
        case PatternCategory::IPV4:
            return generate_ipv4();
        case PatternCategory::IPV6:
        case PatternCategory::OTHER:
            break;
    }
    return placeholder(pattern.name);
}

uint64_t SyntheticReplaceStrategy::random_digits(int digits) const {
    uint64_t lo = 1;
    for (int i = 1; i < digits; ++i) lo *= 10;
    return random_->next_in_range(lo, lo * 10 - 1);
}

std::string SyntheticReplaceStrategy::generate_email() const {
    return std::format("user{}@example.com", random_->next_in_range(0, 9999));
}

std::string SyntheticReplaceStrategy::generate_phone() const {
    const auto area = random_digits(3);
    const auto exchange = random_digits(3);
    const auto line = random_digits(4);
    return std::format("+1-{}-{}-{}", area, exchange, line);
}

std::string SyntheticReplaceStrategy::generate_ssn() const {
    // Area cannot be 000, 666 or 900-999
    uint64_t area = random_->next_in_range(1, 898);
    if (area >= 666) ++area;
    const auto group = random_->next_in_range(1, 99);
    const auto serial = random_->next_in_range(1, 9999);
    return std::format("{:03d}-{:02d}-{:04d}", area, group, serial);
}

std::string SyntheticReplaceStrategy::generate_credit_card() const {
    std::string digits = "4";
    digits.reserve(kCardPayloadDigits + 1);
    while (static_cast<int>(digits.size()) < kCardPayloadDigits) {
        digits += static_cast<char>('0' + random_->next_in_range(0, 9));
    }
    digits += static_cast<char>('0' + luhn_check_digit(digits));

    return std::format("{}-{}-{}-{}",
        digits.substr(0, 4), digits.substr(4, 4),
        digits.substr(8, 4), digits.substr(12, 4));
}

std::string SyntheticReplaceStrategy::generate_ipv4() const {
    const auto a = random_->next_in_range(1, 223);
    const auto b = random_->next_in_range(0, 255);
    const auto c = random_->next_in_range(0, 255);
    const auto d = random_->next_in_range(0, 255);
    return std::format("{}.{}.{}.{}", a, b, c, d);
}

std::string SyntheticReplaceStrategy::placeholder(std::string_view pattern_name) {
    return std::format("[ANONYMIZED_{}]", utils::to_upper(pattern_name));
}

bool SyntheticReplaceStrategy::luhn_valid(std::string_view value) {
    const std::string digits = utils::digits_only(value);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

} // namespace textanon
