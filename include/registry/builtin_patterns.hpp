#pragma once

#include "core/types.hpp"

#include <array>
#include <string_view>

namespace textanon::builtin {

struct BuiltinPattern {
    std::string_view name;
    std::string_view source;
    std::string_view description;
    SensitivityClass sensitivity;
};

// Registration order is listing order and the default selection order.
inline constexpr std::array<BuiltinPattern, 12> kPatterns = {{
    {"email",
     R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)",
     "Email addresses", SensitivityClass::MEDIUM},
    {"phone",
     R"((\+\d{1,3}[-.]?)?\(?\d{3}\)?[-.]?\d{3}[-.]?\d{4})",
     "Phone numbers", SensitivityClass::MEDIUM},
    {"ssn",
     R"(\b\d{3}[-.]?\d{2}[-.]?\d{4}\b)",
     "Social Security Numbers", SensitivityClass::HIGH},
    {"creditCard",
     R"(\b\d{4}[- ]?\d{4}[- ]?\d{4}[- ]?\d{4}\b)",
     "Credit card numbers", SensitivityClass::HIGH},
    {"ipv4",
     R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)",
     "IPv4 addresses", SensitivityClass::MEDIUM},
    {"ipv6",
     R"(([0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4})",
     "IPv6 addresses", SensitivityClass::MEDIUM},
    {"macAddress",
     R"(([0-9A-Fa-f]{2}[:-]){5}([0-9A-Fa-f]{2}))",
     "MAC addresses", SensitivityClass::LOW},
    {"bitcoin",
     R"([13][a-km-zA-HJ-NP-Z1-9]{25,34})",
     "Bitcoin addresses", SensitivityClass::LOW},
    {"ethereum",
     R"(0x[a-fA-F0-9]{40})",
     "Ethereum addresses", SensitivityClass::LOW},
    {"url",
     R"(https?://[^\s]+)",
     "URLs", SensitivityClass::LOW},
    {"username",
     R"(@\w+)",
     "Social media usernames", SensitivityClass::OTHER},
    {"hashtag",
     R"(#\w+)",
     "Hashtags", SensitivityClass::OTHER},
}};

} // namespace textanon::builtin
