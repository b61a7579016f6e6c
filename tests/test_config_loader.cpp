#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <string>

using namespace textanon;

namespace {

bool has_error_containing(const std::vector<std::string>& errors, const std::string& needle) {
    for (const auto& e : errors) {
        if (e.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("Empty config yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.anonymizer.default_strategy == "mask");
    CHECK(cfg.anonymizer.preserve_format);
    CHECK_FALSE(cfg.anonymizer.case_sensitive);
    CHECK_FALSE(cfg.anonymizer.patterns.has_value());
    CHECK(cfg.anonymizer.builtin_patterns);
    CHECK_FALSE(cfg.anonymizer.random_seed.has_value());
    CHECK(cfg.detector.parallel_threshold_bytes == 64 * 1024);
    CHECK(cfg.detector.max_workers == 4);
    CHECK(cfg.risk.high_threshold == 10);
    CHECK(cfg.custom_patterns.empty());
    CHECK(cfg.overrides.empty());
}

TEST_CASE("Full config is extracted", "[config]") {
    const std::string toml = R"(
[logging]
level = "warn"

[anonymizer]
default_strategy = "hash"
preserve_format = false
case_sensitive = true
patterns = ["email", "employeeId"]
random_seed = 42

[detector]
parallel_threshold_bytes = 1024
max_workers = 2

[risk]
high_weight = 5
low_threshold = 2
medium_threshold = 6
high_threshold = 12

[[custom_patterns]]
name = "employeeId"
pattern = 'EMP-\d{6}'
description = "Employee identifier"
sensitivity = "medium"

[overrides.email]
replacement = "[EMAIL]"

[overrides.phone]
strategy = "remove"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "warn");
    CHECK(cfg.anonymizer.default_strategy == "hash");
    CHECK_FALSE(cfg.anonymizer.preserve_format);
    CHECK(cfg.anonymizer.case_sensitive);
    REQUIRE(cfg.anonymizer.patterns.has_value());
    CHECK(cfg.anonymizer.patterns->size() == 2);
    REQUIRE(cfg.anonymizer.random_seed.has_value());
    CHECK(*cfg.anonymizer.random_seed == 42);

    CHECK(cfg.detector.parallel_threshold_bytes == 1024);
    CHECK(cfg.detector.max_workers == 2);
    CHECK(cfg.risk.high_weight == 5);
    CHECK(cfg.risk.medium_weight == 2);
    CHECK(cfg.risk.low_threshold == 2);

    REQUIRE(cfg.custom_patterns.size() == 1);
    CHECK(cfg.custom_patterns[0].name == "employeeId");
    CHECK(cfg.custom_patterns[0].pattern == R"(EMP-\d{6})");
    REQUIRE(cfg.custom_patterns[0].sensitivity.has_value());
    CHECK(*cfg.custom_patterns[0].sensitivity == SensitivityClass::MEDIUM);

    REQUIRE(cfg.overrides.count("email") == 1);
    CHECK(cfg.overrides.at("email").literal_replacement == std::optional<std::string>("[EMAIL]"));
    CHECK_FALSE(cfg.overrides.at("email").strategy.has_value());
    CHECK(cfg.overrides.at("phone").strategy == std::optional<std::string>("remove"));

    const auto options = cfg.default_options();
    CHECK(options.default_strategy == "hash");
    CHECK(options.case_sensitive);
    CHECK_FALSE(options.preserve_format);
    CHECK(options.per_pattern_override.size() == 2);
}

TEST_CASE("Malformed TOML is reported", "[config]") {
    const auto result = ConfigLoader::load_from_string("[anonymizer\ndefault_strategy = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("TOML parse error") != std::string::npos);
}

TEST_CASE("Missing file is reported", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/anonymizer.toml");
    CHECK_FALSE(result.success);
    CHECK_FALSE(result.error_message.empty());
}

TEST_CASE("Unknown sensitivity is rejected", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[[custom_patterns]]
name = "x"
pattern = "x+"
sensitivity = "extreme"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("custom_patterns[0].sensitivity") != std::string::npos);
}

// ============================================================================
// Environment substitution
// ============================================================================

TEST_CASE("Env vars are substituted", "[config]") {
    ::setenv("TEXTANON_TEST_KEY", "s3cret", 1);
    ::unsetenv("TEXTANON_TEST_UNSET");

    CHECK(ConfigLoader::expand_env_vars("key=${TEXTANON_TEST_KEY}") == "key=s3cret");
    CHECK(ConfigLoader::expand_env_vars("[${TEXTANON_TEST_UNSET}]") == "[]");
    CHECK(ConfigLoader::expand_env_vars("no vars") == "no vars");
    CHECK_THROWS(ConfigLoader::expand_env_vars("${UNCLOSED"));

    const auto result = ConfigLoader::load_from_string(R"(
[anonymizer]
default_strategy = "hmac"
hmac_key = "${TEXTANON_TEST_KEY}"
)");
    REQUIRE(result.success);
    CHECK(result.config.anonymizer.hmac_key == "s3cret");
}

TEST_CASE("Env vars reach arrays and array tables", "[config]") {
    ::setenv("TEXTANON_TEST_PREFIX", "EMP", 1);
    ::setenv("TEXTANON_TEST_PATTERN", "email", 1);

    const auto result = ConfigLoader::load_from_string(R"(
[anonymizer]
patterns = ["${TEXTANON_TEST_PATTERN}", "employeeId"]

[[custom_patterns]]
name = "employeeId"
pattern = '${TEXTANON_TEST_PREFIX}-\d{6}'
)");
    REQUIRE(result.success);
    REQUIRE(result.config.anonymizer.patterns.has_value());
    CHECK(result.config.anonymizer.patterns->front() == "email");
    REQUIRE(result.config.custom_patterns.size() == 1);
    CHECK(result.config.custom_patterns[0].pattern == R"(EMP-\d{6})");
}

TEST_CASE("Non-string pattern names are rejected", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[anonymizer]
patterns = ["email", 3]
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("anonymizer.patterns") != std::string::npos);
}

TEST_CASE("Missing file error names the path", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/anonymizer.toml");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("/nonexistent/anonymizer.toml") != std::string::npos);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Validation names the offending key", "[config]") {
    AnonymizerConfig cfg;

    SECTION("valid defaults") {
        CHECK(ConfigLoader::validate_config(cfg).empty());
    }

    SECTION("unknown default strategy") {
        cfg.anonymizer.default_strategy = "scramble";
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "anonymizer.default_strategy"));
    }

    SECTION("hmac without key") {
        cfg.anonymizer.default_strategy = "hmac";
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "anonymizer.hmac_key"));
    }

    SECTION("hmac override without key") {
        PatternOverride ov;
        ov.strategy = "hmac";
        cfg.overrides["email"] = ov;
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "overrides.email.strategy"));
    }

    SECTION("max_workers zero") {
        cfg.detector.max_workers = 0;
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "detector.max_workers"));
    }

    SECTION("negative weight") {
        cfg.risk.low_weight = -1;
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "risk.low_weight"));
    }

    SECTION("thresholds out of order") {
        cfg.risk.medium_threshold = 20;
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "risk.high_threshold"));
    }

    SECTION("low threshold below one") {
        cfg.risk.low_threshold = 0;
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "risk.low_threshold"));
    }

    SECTION("bad log level") {
        cfg.logging.level = "verbose";
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "logging.level"));
    }

    SECTION("custom pattern that does not compile") {
        cfg.custom_patterns.push_back({"broken", "([a-z", "", std::nullopt});
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "custom_patterns[0].pattern"));
    }

    SECTION("custom pattern without a name") {
        cfg.custom_patterns.push_back({"", "x+", "", std::nullopt});
        CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "custom_patterns[0].name"));
    }
}

TEST_CASE("Validation failures are collected into the load error", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[anonymizer]
default_strategy = "scramble"

[detector]
max_workers = 0
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed") != std::string::npos);
    CHECK(result.error_message.find("anonymizer.default_strategy") != std::string::npos);
    CHECK(result.error_message.find("detector.max_workers") != std::string::npos);
}

// ============================================================================
// Pipeline assembly
// ============================================================================

TEST_CASE("Pipeline built from config", "[config]") {
    const auto loaded = ConfigLoader::load_from_string(R"(
[anonymizer]
random_seed = 7

[[custom_patterns]]
name = "employeeId"
pattern = 'EMP-\d{6}'
description = "Employee identifier"

[overrides.employeeId]
replacement = "[EMPLOYEE]"
)");
    REQUIRE(loaded.success);

    const auto built = ConfigLoader::build_pipeline(loaded.config);
    REQUIRE(built.is_ok());
    const auto pipeline = built.value();

    CHECK(pipeline->registry()->size() == 13);
    CHECK(pipeline->registry()->description("employeeId") == "Employee identifier");

    const auto result = pipeline->anonymize("badge EMP-123456", loaded.config.default_options());
    CHECK(result.anonymized_text == "badge [EMPLOYEE]");
}

TEST_CASE("Pipeline without built-ins", "[config]") {
    AnonymizerConfig cfg;
    cfg.anonymizer.builtin_patterns = false;
    cfg.custom_patterns.push_back({"ticket", R"(TCK-\d+)", "", SensitivityClass::HIGH});

    const auto built = ConfigLoader::build_pipeline(cfg);
    REQUIRE(built.is_ok());
    CHECK(built.value()->registry()->size() == 1);

    const auto report = built.value()->detect_sensitive_data("TCK-1 TCK-2");
    CHECK(report.total_count == 2);
    CHECK(report.risk_score == 6);
}

TEST_CASE("Seeded pipelines produce identical synthetic values", "[config]") {
    AnonymizerConfig cfg;
    cfg.anonymizer.random_seed = 99;
    cfg.anonymizer.default_strategy = "replace";

    const auto a = ConfigLoader::build_pipeline(cfg);
    const auto b = ConfigLoader::build_pipeline(cfg);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());

    const std::string text = "mail a@b.co, call 555-123-4567";
    const auto options = cfg.default_options();
    CHECK(a.value()->anonymize(text, options).anonymized_text
          == b.value()->anonymize(text, options).anonymized_text);
}

TEST_CASE("Invalid custom pattern fails pipeline assembly", "[config]") {
    AnonymizerConfig cfg;
    cfg.custom_patterns.push_back({"broken", "([a-z", "", std::nullopt});

    const auto built = ConfigLoader::build_pipeline(cfg);
    REQUIRE(built.is_error());
    CHECK(built.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(built.error_message().find("broken") != std::string::npos);
}
