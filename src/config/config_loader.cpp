#include "config/config_loader.hpp"
#include "core/random_source.hpp"
#include "core/utils.hpp"
#include "registry/pattern_registry.hpp"
#include "strategy/strategy_resolver.hpp"

#include <re2/re2.h>
#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <string_view>
#include <stdexcept>

namespace textanon {

// ============================================================================
// TOML helpers (anonymous namespace)
// ============================================================================

namespace {

// ${VAR} substitution applies to every string, including the entries of
// [[custom_patterns]] and anonymizer.patterns
void substitute_env(toml::node& node) {
    if (auto* str = node.as_string()) {
        *str = ConfigLoader::expand_env_vars(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) substitute_env(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) substitute_env(child);
    }
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& tbl) {
    LoggingConfig cfg;
    if (const auto* s = tbl["logging"].as_table()) {
        cfg.level = (*s)["level"].value_or(cfg.level);
    }
    return cfg;
}

AnonymizerSettings extract_anonymizer(const toml::table& tbl) {
    AnonymizerSettings cfg;
    const auto* s = tbl["anonymizer"].as_table();
    if (!s) return cfg;

    cfg.default_strategy = (*s)["default_strategy"].value_or(cfg.default_strategy);
    cfg.preserve_format = (*s)["preserve_format"].value_or(cfg.preserve_format);
    cfg.case_sensitive = (*s)["case_sensitive"].value_or(cfg.case_sensitive);
    cfg.builtin_patterns = (*s)["builtin_patterns"].value_or(cfg.builtin_patterns);
    cfg.hmac_key = (*s)["hmac_key"].value_or(cfg.hmac_key);

    if (const auto* names = (*s)["patterns"].as_array()) {
        cfg.patterns.emplace();
        for (const auto& n : *names) {
            const auto* name = n.as_string();
            if (!name) throw std::runtime_error("anonymizer.patterns must hold strings only");
            cfg.patterns->emplace_back(name->get());
        }
    }
    if (const auto seed = (*s)["random_seed"].value<int64_t>()) {
        if (*seed < 0) {
            throw std::runtime_error("anonymizer.random_seed must be >= 0");
        }
        cfg.random_seed = static_cast<uint64_t>(*seed);
    }
    return cfg;
}

Detector::Config extract_detector(const toml::table& tbl) {
    Detector::Config cfg;
    const auto* s = tbl["detector"].as_table();
    if (!s) return cfg;

    const auto threshold = (*s)["parallel_threshold_bytes"].value_or(
        static_cast<int64_t>(cfg.parallel_threshold_bytes));
    if (threshold < 0) {
        throw std::runtime_error("detector.parallel_threshold_bytes must be >= 0");
    }
    cfg.parallel_threshold_bytes = static_cast<size_t>(threshold);

    // Stored as-is; validate_config rejects 0
    const auto workers = (*s)["max_workers"].value_or(static_cast<int64_t>(cfg.max_workers));
    cfg.max_workers = workers < 0 ? 0u : static_cast<unsigned>(workers);
    return cfg;
}

RiskPolicy extract_risk(const toml::table& tbl) {
    RiskPolicy cfg;
    const auto* s = tbl["risk"].as_table();
    if (!s) return cfg;

    cfg.high_weight = (*s)["high_weight"].value_or(cfg.high_weight);
    cfg.medium_weight = (*s)["medium_weight"].value_or(cfg.medium_weight);
    cfg.low_weight = (*s)["low_weight"].value_or(cfg.low_weight);
    cfg.other_weight = (*s)["other_weight"].value_or(cfg.other_weight);
    cfg.high_threshold = (*s)["high_threshold"].value_or(cfg.high_threshold);
    cfg.medium_threshold = (*s)["medium_threshold"].value_or(cfg.medium_threshold);
    cfg.low_threshold = (*s)["low_threshold"].value_or(cfg.low_threshold);
    return cfg;
}

std::vector<CustomPatternConfig> extract_custom_patterns(const toml::table& tbl) {
    std::vector<CustomPatternConfig> patterns;
    const auto* arr = tbl["custom_patterns"].as_array();
    if (!arr) return patterns;

    size_t i = 0;
    for (const auto& elem : *arr) {
        const auto* entry = elem.as_table();
        if (!entry) {
            throw std::runtime_error(std::format("custom_patterns[{}] must be a table", i));
        }

        CustomPatternConfig cfg;
        cfg.name = (*entry)["name"].value_or(std::string{});
        cfg.pattern = (*entry)["pattern"].value_or(std::string{});
        cfg.description = (*entry)["description"].value_or(std::string{});

        if (const auto level = toml_optional_string(*entry, "sensitivity")) {
            cfg.sensitivity = parse_sensitivity(*level);
            if (!cfg.sensitivity) {
                throw std::runtime_error(std::format(
                    "custom_patterns[{}].sensitivity: unknown value '{}'", i, *level));
            }
        }

        patterns.push_back(std::move(cfg));
        ++i;
    }
    return patterns;
}

std::unordered_map<std::string, PatternOverride> extract_overrides(const toml::table& tbl) {
    std::unordered_map<std::string, PatternOverride> overrides;
    const auto* s = tbl["overrides"].as_table();
    if (!s) return overrides;

    for (const auto& [key, val] : *s) {
        const auto* entry = val.as_table();
        if (!entry) {
            throw std::runtime_error(std::format("overrides.{} must be a table", key.str()));
        }
        PatternOverride ov;
        ov.strategy = toml_optional_string(*entry, "strategy");
        ov.literal_replacement = toml_optional_string(*entry, "replacement");
        overrides.emplace(std::string(key.str()), std::move(ov));
    }
    return overrides;
}

AnonymizerConfig extract_all_sections(const toml::table& tbl) {
    AnonymizerConfig config;
    config.logging = extract_logging(tbl);
    config.anonymizer = extract_anonymizer(tbl);
    config.detector = extract_detector(tbl);
    config.risk = extract_risk(tbl);
    config.custom_patterns = extract_custom_patterns(tbl);
    config.overrides = extract_overrides(tbl);
    return config;
}

// Parse, substitute, extract, validate. origin names the source in messages
template <typename ParseFn>
ConfigLoader::LoadResult load_table(ParseFn parse, std::string_view origin) {
    try {
        toml::table tbl = parse();
        substitute_env(tbl);
        auto config = extract_all_sections(tbl);

        const auto problems = ConfigLoader::validate_config(config);
        if (problems.empty()) return ConfigLoader::LoadResult::ok(std::move(config));

        std::string message = std::format("Config validation failed ({}):", origin);
        for (const auto& p : problems) message += std::format("\n  - {}", p);
        return ConfigLoader::LoadResult::error(std::move(message));
    } catch (const toml::parse_error& e) {
        return ConfigLoader::LoadResult::error(
            std::format("TOML parse error ({}): {}", origin, e.what()));
    } catch (const std::exception& e) {
        return ConfigLoader::LoadResult::error(
            std::format("Invalid config ({}): {}", origin, e.what()));
    }
}

} // anonymous namespace

// ============================================================================
// AnonymizerConfig
// ============================================================================

AnonymizationOptions AnonymizerConfig::default_options() const {
    AnonymizationOptions options;
    options.selected_patterns = anonymizer.patterns;
    options.default_strategy = anonymizer.default_strategy;
    options.preserve_format = anonymizer.preserve_format;
    options.case_sensitive = anonymizer.case_sensitive;
    options.per_pattern_override = overrides;
    return options;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    std::string out;
    size_t pos = 0;
    for (size_t open = input.find("${"); open != std::string::npos;
         open = input.find("${", pos)) {
        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(std::format("Unclosed ${{ at offset {}", open));
        }
        out.append(input, pos, open - pos);
        const std::string var = input.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(var.c_str())) out += value;
        pos = close + 1;
    }
    out.append(input, pos);
    return out;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    return load_table([&]() -> toml::table { return toml::parse_file(config_path); },
                      config_path);
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    return load_table([&]() -> toml::table { return toml::parse(toml_content); },
                      "inline");
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AnonymizerConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of info, warn, error, off, got '{}'",
            config.logging.level));
    }

    const auto& a = config.anonymizer;
    if (!strategy_names::is_builtin(a.default_strategy)) {
        errors.push_back(std::format(
            "anonymizer.default_strategy '{}' is not a built-in strategy", a.default_strategy));
    }
    if (a.default_strategy == strategy_names::kHmac && a.hmac_key.empty()) {
        errors.push_back("anonymizer.hmac_key required when default_strategy is hmac");
    }
    for (const auto& [name, ov] : config.overrides) {
        if (ov.strategy && *ov.strategy == strategy_names::kHmac && a.hmac_key.empty()) {
            errors.push_back(std::format(
                "anonymizer.hmac_key required by overrides.{}.strategy", name));
        }
    }

    if (config.detector.max_workers < 1) {
        errors.push_back("detector.max_workers must be >= 1");
    }

    const auto& r = config.risk;
    if (r.high_weight < 0)   errors.push_back("risk.high_weight must be >= 0");
    if (r.medium_weight < 0) errors.push_back("risk.medium_weight must be >= 0");
    if (r.low_weight < 0)    errors.push_back("risk.low_weight must be >= 0");
    if (r.other_weight < 0)  errors.push_back("risk.other_weight must be >= 0");

    if (r.low_threshold < 1) {
        errors.push_back(std::format("risk.low_threshold must be >= 1, got {}", r.low_threshold));
    }
    if (r.medium_threshold < r.low_threshold) {
        errors.push_back(std::format(
            "risk.medium_threshold ({}) < low_threshold ({})",
            r.medium_threshold, r.low_threshold));
    }
    if (r.high_threshold < r.medium_threshold) {
        errors.push_back(std::format(
            "risk.high_threshold ({}) < medium_threshold ({})",
            r.high_threshold, r.medium_threshold));
    }

    for (size_t i = 0; i < config.custom_patterns.size(); ++i) {
        const auto& p = config.custom_patterns[i];
        if (p.name.empty()) {
            errors.push_back(std::format("custom_patterns[{}].name must not be empty", i));
        }
        if (p.pattern.empty()) {
            errors.push_back(std::format("custom_patterns[{}].pattern must not be empty", i));
            continue;
        }
        RE2::Options opts;
        opts.set_log_errors(false);
        if (const RE2 compiled(p.pattern, opts); !compiled.ok()) {
            errors.push_back(std::format(
                "custom_patterns[{}].pattern does not compile: {}", i, compiled.error()));
        }
    }

    return errors;
}

// ============================================================================
// Pipeline assembly
// ============================================================================

Result<std::shared_ptr<AnonymizationPipeline>> ConfigLoader::build_pipeline(
    const AnonymizerConfig& config) {

    auto registry = std::make_shared<PatternRegistry>();
    if (config.anonymizer.builtin_patterns) {
        registry->load_builtin_patterns();
    }

    for (const auto& p : config.custom_patterns) {
        auto registered = registry->register_pattern(
            p.name, p.pattern, p.description, p.sensitivity);
        if (registered.is_error()) {
            return Result<std::shared_ptr<AnonymizationPipeline>>::error(
                ErrorCategory::CONFIG_ERROR,
                std::format("custom pattern '{}': {}", p.name, registered.error_message()));
        }
    }

    if (config.anonymizer.patterns) {
        for (const auto& name : *config.anonymizer.patterns) {
            if (!registry->contains(name)) {
                utils::log::warn(std::format(
                    "anonymizer.patterns names unknown pattern '{}'", name));
            }
        }
    }

    auto random = std::make_shared<Mt19937RandomSource>(config.anonymizer.random_seed);
    StrategyResolver::Config resolver_config;
    resolver_config.hmac_key = config.anonymizer.hmac_key;
    auto resolver = std::make_shared<StrategyResolver>(std::move(random), resolver_config);

    for (const auto& [name, ov] : config.overrides) {
        if (ov.strategy && !resolver->has_strategy(*ov.strategy)) {
            utils::log::warn(std::format(
                "overrides.{}.strategy '{}' is not registered, default strategy applies",
                name, *ov.strategy));
        }
    }

    PipelineComponents components;
    components.registry = std::move(registry);
    components.resolver = std::move(resolver);
    components.detector = config.detector;
    components.risk = config.risk;

    utils::log::info(std::format(
        "Pipeline ready: {} patterns, default strategy '{}'",
        components.registry->size(), config.anonymizer.default_strategy));

    return Result<std::shared_ptr<AnonymizationPipeline>>::ok(
        std::make_shared<AnonymizationPipeline>(std::move(components)));
}

} // namespace textanon
