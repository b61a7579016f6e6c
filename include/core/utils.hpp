#pragma once

#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace textanon::utils {

// ============================================================================
// Boolean Formatting
// ============================================================================

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string to_upper(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.emplace_back(std::move(token));
    }
    return tokens;
}

/**
 * @brief Count UTF-8 code points (continuation bytes are not counted)
 */
[[nodiscard]] inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (const char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
    }
    return n;
}

// UTF-16 code units of a UTF-8 string; malformed bytes decode to U+FFFD
[[nodiscard]] inline std::u16string to_utf16(std::string_view s) {
    std::u16string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        char32_t cp = lead;
        if (lead < 0x80) {
            out.push_back(static_cast<char16_t>(lead));
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead < 0xE0) {
            extra = 1; cp = lead & 0x1F;
        } else if (lead >= 0xE0 && lead < 0xF0) {
            extra = 2; cp = lead & 0x0F;
        } else if (lead >= 0xF0 && lead < 0xF5) {
            extra = 3; cp = lead & 0x07;
        }

        bool valid = extra > 0 && i + extra < s.size();
        for (size_t k = 1; valid && k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) valid = false;
            else cp = (cp << 6) | (cont & 0x3F);
        }
        if (!valid) {
            out.push_back(u'\uFFFD');
            ++i;
            continue;
        }

        if (cp >= 0x10000) {
            cp -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            out.push_back(static_cast<char16_t>(cp));
        }
        i += extra + 1;
    }
    return out;
}

[[nodiscard]] inline std::string digits_only(std::string_view s) {
    std::string digits;
    digits.reserve(s.size());
    for (const char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
    }
    return digits;
}

// ============================================================================
// JSON String Utilities
// ============================================================================

/**
 * @brief Escape a string for safe embedding in a JSON string value.
 * Handles: " \ \n \r \t and other control characters
 */
[[nodiscard]] inline std::string escape_json(std::string_view s) {
    std::string result;
    result.reserve(s.size() + s.size() / 8);
    for (const char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    double elapsed_ms_fractional() const {
        return static_cast<double>(elapsed<std::chrono::microseconds>().count()) / 1000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO = 0, WARN = 1, ERROR = 2, OFF = 3 };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
            case Level::OFF:   return;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

// "info" | "warn" | "error" | "off"; unknown names leave the level unchanged
inline std::optional<Level> parse_level(std::string_view name) {
    if (name == "info")  return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off")   return Level::OFF;
    return std::nullopt;
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace textanon::utils
