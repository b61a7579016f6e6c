#include <catch2/catch_test_macros.hpp>
#include "detector/detector.hpp"
#include "registry/pattern_registry.hpp"

#include <string>
#include <vector>

using namespace textanon;

TEST_CASE("Detector finds email and phone with offsets", "[detector]") {
    const auto registry = PatternRegistry::create_default();
    const Detector detector;
    const std::string text = "Contact: jane.doe@example.com or 555-123-4567";

    const auto matches = detector.detect(*registry, text, {"email", "phone"}, false);
    REQUIRE(matches.size() == 2);

    CHECK(matches[0].pattern_name == "email");
    CHECK(matches[0].text == "jane.doe@example.com");
    CHECK(matches[0].start == 9);
    CHECK(matches[0].end == 29);
    CHECK(text.substr(matches[0].start, matches[0].length()) == matches[0].text);

    CHECK(matches[1].pattern_name == "phone");
    CHECK(matches[1].text == "555-123-4567");
    CHECK(matches[1].start == 33);
}

TEST_CASE("Detector output is pattern-major in the requested order", "[detector]") {
    const auto registry = PatternRegistry::create_default();
    const Detector detector;
    const std::string text = "555-123-4567 then a@b.co then 555-987-6543";

    const auto matches = detector.detect(*registry, text, {"email", "phone"}, false);
    REQUIRE(matches.size() == 3);
    CHECK(matches[0].pattern_name == "email");
    CHECK(matches[1].pattern_name == "phone");
    CHECK(matches[1].start == 0);
    CHECK(matches[2].pattern_name == "phone");
    CHECK(matches[2].start > matches[1].start);

    const auto reversed = detector.detect(*registry, text, {"phone", "email"}, false);
    REQUIRE(reversed.size() == 3);
    CHECK(reversed[0].pattern_name == "phone");
    CHECK(reversed[2].pattern_name == "email");
}

TEST_CASE("Detector ignores unknown pattern names", "[detector]") {
    const auto registry = PatternRegistry::create_default();
    const Detector detector;

    const auto matches = detector.detect(*registry, "a@b.co", {"nope", "email"}, false);
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].pattern_name == "email");
}

TEST_CASE("Detector returns nothing for empty input or empty selection", "[detector]") {
    const auto registry = PatternRegistry::create_default();
    const Detector detector;

    CHECK(detector.detect(*registry, "", {"email"}, false).empty());
    CHECK(detector.detect(*registry, "a@b.co", {}, false).empty());
}

TEST_CASE("Detector honours case sensitivity", "[detector]") {
    PatternRegistry registry;
    REQUIRE(registry.register_pattern("code", "secret").is_ok());
    const Detector detector;

    CHECK(detector.detect(registry, "SECRET secret", {"code"}, false).size() == 2);
    CHECK(detector.detect(registry, "SECRET secret", {"code"}, true).size() == 1);
}

TEST_CASE("Detector skips zero-length matches", "[detector]") {
    PatternRegistry registry;
    REQUIRE(registry.register_pattern("maybeDigits", R"(\d*)").is_ok());
    const Detector detector;

    const auto matches = detector.detect(registry, "ab 12 cd", {"maybeDigits"}, false);
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].text == "12");
}

TEST_CASE("Detector reports the same value at distinct positions", "[detector]") {
    const auto registry = PatternRegistry::create_default();
    const Detector detector;

    const auto matches = detector.detect(*registry, "a@b.co and a@b.co", {"email"}, false);
    REQUIRE(matches.size() == 2);
    CHECK(matches[0].start == 0);
    CHECK(matches[1].start == 11);
}

TEST_CASE("Parallel scan matches sequential scan", "[detector]") {
    const auto registry = PatternRegistry::create_default();

    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "user" + std::to_string(i) + "@example.com called 555-123-4567 from 10.0.0.";
        text += std::to_string(i % 255) + " #tag" + std::to_string(i) + "\n";
    }

    const std::vector<std::string> names = {"email", "phone", "ipv4", "hashtag"};

    Detector::Config seq_cfg;
    seq_cfg.parallel_threshold_bytes = text.size() + 1;
    Detector::Config par_cfg;
    par_cfg.parallel_threshold_bytes = 1;
    par_cfg.max_workers = 3;

    const auto sequential = Detector(seq_cfg).detect(*registry, text, names, false);
    const auto parallel = Detector(par_cfg).detect(*registry, text, names, false);

    REQUIRE(sequential.size() == parallel.size());
    for (size_t i = 0; i < sequential.size(); ++i) {
        CHECK(sequential[i].pattern_name == parallel[i].pattern_name);
        CHECK(sequential[i].start == parallel[i].start);
        CHECK(sequential[i].end == parallel[i].end);
    }
}

TEST_CASE("Detector handles 100 KB tokens", "[detector]") {
    const auto registry = PatternRegistry::create_default();
    constexpr size_t kTokenLen = 100 * 1024;

    const std::string text =
        "blob " + std::string(kTokenLen, 'Q') +
        " see http://" + std::string(kTokenLen, 'a') +
        " by @" + std::string(kTokenLen, 'u') +
        " tag #" + std::string(kTokenLen, 't') + " end";
    const size_t url_at = text.find("http://");
    const size_t user_at = text.find(" @") + 1;
    const size_t tag_at = text.find(" #") + 1;

    const std::vector<std::string> names = {"email", "url", "username", "hashtag"};

    Detector::Config seq_cfg;
    seq_cfg.parallel_threshold_bytes = text.size() + 1;
    Detector::Config par_cfg;
    par_cfg.parallel_threshold_bytes = 1;

    for (const auto& cfg : {seq_cfg, par_cfg}) {
        for (const bool case_sensitive : {false, true}) {
            const auto matches = Detector(cfg).detect(*registry, text, names, case_sensitive);
            REQUIRE(matches.size() == 3);

            CHECK(matches[0].pattern_name == "url");
            CHECK(matches[0].start == url_at);
            CHECK(matches[0].length() == 7 + kTokenLen);

            CHECK(matches[1].pattern_name == "username");
            CHECK(matches[1].start == user_at);
            CHECK(matches[1].length() == 1 + kTokenLen);

            CHECK(matches[2].pattern_name == "hashtag");
            CHECK(matches[2].start == tag_at);
            CHECK(matches[2].length() == 1 + kTokenLen);
        }
    }

    // A single long local part is still one email
    const std::string address = std::string(kTokenLen, 'x') + "@example.com";
    const auto emails = Detector().detect(*registry, address, {"email"}, false);
    REQUIRE(emails.size() == 1);
    CHECK(emails[0].text == address);
}

TEST_CASE("Registration rejects constructs without a linear-time match", "[detector]") {
    PatternRegistry registry;
    CHECK(registry.register_pattern("backref", R"((a)\1)").is_error());
    CHECK(registry.register_pattern("lookahead", R"(x(?=y))").is_error());
}

TEST_CASE("Detector clamps max_workers to at least one", "[detector]") {
    Detector::Config cfg;
    cfg.max_workers = 0;
    const Detector detector(cfg);
    CHECK(detector.config().max_workers == 1);
}
