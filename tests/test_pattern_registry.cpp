#include <catch2/catch_test_macros.hpp>
#include "registry/pattern_registry.hpp"

#include <thread>
#include <vector>

using namespace textanon;

// ============================================================================
// Built-in patterns
// ============================================================================

TEST_CASE("Default registry loads the 12 built-in patterns in order", "[registry]") {
    const auto registry = PatternRegistry::create_default();
    REQUIRE(registry->size() == 12);

    const auto names = registry->snapshot()->names();
    const std::vector<std::string> expected = {
        "email", "phone", "ssn", "creditCard", "ipv4", "ipv6",
        "macAddress", "bitcoin", "ethereum", "url", "username", "hashtag"};
    CHECK(names == expected);
}

TEST_CASE("Built-in patterns carry category and sensitivity", "[registry]") {
    const auto registry = PatternRegistry::create_default();

    SECTION("email") {
        const auto p = registry->get("email");
        REQUIRE(p);
        CHECK(p->category == PatternCategory::EMAIL);
        CHECK(p->sensitivity == SensitivityClass::MEDIUM);
    }

    SECTION("creditCard maps to the credit card category") {
        const auto p = registry->get("creditCard");
        REQUIRE(p);
        CHECK(p->category == PatternCategory::CREDIT_CARD);
        CHECK(p->sensitivity == SensitivityClass::HIGH);
    }

    SECTION("hashtag is OTHER") {
        const auto p = registry->get("hashtag");
        REQUIRE(p);
        CHECK(p->category == PatternCategory::OTHER);
        CHECK(p->sensitivity == SensitivityClass::OTHER);
    }
}

// ============================================================================
// Registration
// ============================================================================

TEST_CASE("Custom pattern registration", "[registry]") {
    PatternRegistry registry;

    SECTION("valid source is stored") {
        auto result = registry.register_pattern("employeeId", R"(EMP-\d{6})", "Employee ID");
        REQUIRE(result.is_ok());
        CHECK(result.value().name == "employeeId");
        CHECK(result.value().source == R"(EMP-\d{6})");
        CHECK(registry.contains("employeeId"));
        CHECK(registry.description("employeeId") == "Employee ID");
    }

    SECTION("unknown name derives OTHER sensitivity") {
        auto result = registry.register_pattern("ticket", R"(TCK-\d+)");
        REQUIRE(result.is_ok());
        CHECK(result.value().sensitivity == SensitivityClass::OTHER);
    }

    SECTION("explicit sensitivity wins") {
        auto result = registry.register_pattern("badge", R"(B\d{4})", "", SensitivityClass::HIGH);
        REQUIRE(result.is_ok());
        CHECK(result.value().sensitivity == SensitivityClass::HIGH);
    }

    SECTION("invalid source is rejected and registry is unchanged") {
        auto result = registry.register_pattern("broken", "([a-z");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::INVALID_PATTERN_SYNTAX);
        CHECK(result.error_message().find("broken") != std::string::npos);
        CHECK_FALSE(registry.contains("broken"));
        CHECK(registry.size() == 0);
    }

    SECTION("empty name is rejected") {
        auto result = registry.register_pattern("", "abc");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::INVALID_ARGUMENT);
    }
}

TEST_CASE("Duplicate names overwrite in place", "[registry]") {
    const auto registry = PatternRegistry::create_default();

    auto result = registry->register_pattern("email", R"(\w+@corp\.example)", "Corporate email");
    REQUIRE(result.is_ok());

    CHECK(registry->size() == 12);
    CHECK(registry->overwrite_count() == 1);
    CHECK(registry->get("email")->source == R"(\w+@corp\.example)");
    // Position in enumeration order is kept
    CHECK(registry->snapshot()->names().front() == "email");
}

TEST_CASE("Remove pattern", "[registry]") {
    const auto registry = PatternRegistry::create_default();

    SECTION("existing pattern") {
        auto result = registry->remove("hashtag");
        REQUIRE(result.is_ok());
        CHECK(result.value() == "Pattern \"hashtag\" removed");
        CHECK_FALSE(registry->contains("hashtag"));
        CHECK(registry->size() == 11);
    }

    SECTION("unknown pattern") {
        auto result = registry->remove("nonexistent");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PATTERN_NOT_FOUND);
        CHECK(result.error_message() == "Pattern \"nonexistent\" not found");
        CHECK(registry->size() == 12);
    }

    SECTION("later patterns are still found after removal") {
        REQUIRE(registry->remove("ssn").is_ok());
        const auto p = registry->get("hashtag");
        REQUIRE(p);
        CHECK(p->name == "hashtag");
    }
}

TEST_CASE("Description falls back to Custom pattern", "[registry]") {
    PatternRegistry registry;
    REQUIRE(registry.register_pattern("noDesc", "x+").is_ok());

    CHECK(registry.description("noDesc") == "Custom pattern");
    CHECK(registry.description("missing") == "Custom pattern");
}

TEST_CASE("get() returns nullptr for unknown names", "[registry]") {
    PatternRegistry registry;
    CHECK(registry.get("nothing") == nullptr);
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_CASE("Snapshots are unaffected by later writes", "[registry]") {
    const auto registry = PatternRegistry::create_default();
    const auto before = registry->snapshot();

    REQUIRE(registry->remove("email").is_ok());
    REQUIRE(registry->register_pattern("employeeId", R"(EMP-\d{6})").is_ok());

    CHECK(before->size() == 12);
    CHECK(before->find("email") != nullptr);
    CHECK(before->find("employeeId") == nullptr);

    const auto after = registry->snapshot();
    CHECK(after->find("email") == nullptr);
    CHECK(after->find("employeeId") != nullptr);
}

TEST_CASE("Concurrent registration and snapshot reads", "[registry]") {
    const auto registry = PatternRegistry::create_default();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = 0; i < 25; ++i) {
                const auto name = "custom_" + std::to_string(t) + "_" + std::to_string(i);
                (void)registry->register_pattern(name, R"(X\d+)");
                (void)registry->snapshot()->size();
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(registry->size() == 12 + 100);
}

TEST_CASE("Category lookup is case-insensitive", "[registry]") {
    CHECK(PatternRegistry::category_for_name("Email") == PatternCategory::EMAIL);
    CHECK(PatternRegistry::category_for_name("CREDIT_CARD") == PatternCategory::CREDIT_CARD);
    CHECK(PatternRegistry::category_for_name("mobile") == PatternCategory::PHONE);
    CHECK(PatternRegistry::category_for_name("employeeId") == PatternCategory::OTHER);
}
