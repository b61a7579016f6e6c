#include "api/anonymizer_service.hpp"
#include "api/json_renderer.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace textanon;

namespace {

struct CliOptions {
    std::optional<std::string> config_file;
    bool detect_only = false;
    bool list_only = false;
    std::optional<std::string> strategy;
    std::optional<std::vector<std::string>> patterns;
};

void print_usage() {
    std::cerr << "Usage: text_anonymizer [config.toml] [--detect] [--list] "
                 "[--strategy <name>] [--patterns a,b,c]\n"
                 "Reads text from stdin and writes a JSON result to stdout.\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--detect") {
            opts.detect_only = true;
        } else if (arg == "--list") {
            opts.list_only = true;
        } else if (arg == "--strategy" && i + 1 < argc) {
            opts.strategy = argv[++i];
        } else if (arg == "--patterns" && i + 1 < argc) {
            std::vector<std::string> names;
            for (const auto& part : utils::split(argv[++i], ',')) {
                auto name = utils::trim(part);
                if (!name.empty()) names.push_back(std::move(name));
            }
            opts.patterns = std::move(names);
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.starts_with("--") && !opts.config_file) {
            opts.config_file = arg;
        } else {
            utils::log::error(std::format("Unknown or incomplete argument: {}", arg));
            return std::nullopt;
        }
    }
    return opts;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto cli = parse_args(argc, argv);
    if (!cli) {
        print_usage();
        return 2;
    }

    try {
        AnonymizerConfig config;
        if (cli->config_file) {
            utils::log::info(std::format("Loading configuration from {}", *cli->config_file));
            auto loaded = ConfigLoader::load_from_file(*cli->config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 1;
            }
            config = std::move(loaded.config);
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        auto pipeline = ConfigLoader::build_pipeline(config);
        if (pipeline.is_error()) {
            utils::log::error(std::format("[{}] {}",
                error_category_to_string(pipeline.error_category()),
                pipeline.error_message()));
            return 1;
        }

        const AnonymizerService service(pipeline.value());

        if (cli->list_only) {
            std::cout << json::to_json(service.list_patterns()) << '\n';
            return 0;
        }

        const std::string text{std::istreambuf_iterator<char>(std::cin),
                               std::istreambuf_iterator<char>()};

        auto options = config.default_options();
        if (cli->patterns) options.selected_patterns = cli->patterns;
        if (cli->strategy) options.default_strategy = *cli->strategy;

        if (cli->detect_only) {
            const auto report = service.detect_sensitive_data(
                text, options.selected_patterns, options.case_sensitive);
            std::cout << json::to_json(report) << '\n';
        } else {
            const auto result = service.anonymize(text, options);
            utils::log::info(std::format("Anonymized {} bytes: {} replacements in {:.3f} ms",
                                         result.original_length, result.replacements.size(),
                                         result.processing_time_ms));
            std::cout << json::to_json(result) << '\n';
        }
    } catch (const PipelineFailure& e) {
        utils::log::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
