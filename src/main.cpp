#include "audit/audit_json.hpp"
#include "config/config_loader.hpp"
#include "core/shield.hpp"
#include "core/utils.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace llmshield;

// Global instance for signal handling
std::shared_ptr<Shield> g_shield;

namespace {

void print_usage() {
    std::cerr <<
        "Usage: llm-shield [--config FILE] [--preset NAME] [--agent ID]\n"
        "\n"
        "Scans each line of stdin and prints the scan result as one JSON line.\n"
        "\n"
        "  --config FILE   TOML configuration\n"
        "  --preset NAME   public_website | internal_support | ops_agent\n"
        "  --agent ID      Agent id attached to every scan\n";
}

struct CliOptions {
    std::string config_file;
    std::optional<PresetName> preset;
    std::string agent_id;
};

/// Returns nullopt (after printing usage) on invalid arguments
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            opts.config_file = argv[++i];
        } else if (arg == "--preset" && has_value) {
            opts.preset = parse_preset(argv[++i]);
            if (!opts.preset) {
                utils::log::error(std::format("Unknown preset '{}'", argv[i]));
                return std::nullopt;
            }
        } else if (arg == "--agent" && has_value) {
            opts.agent_id = argv[++i];
        } else {
            print_usage();
            return std::nullopt;
        }
    }
    return opts;
}

} // anonymous namespace

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_shield) {
        g_shield->close();
    }
    exit(0);
}

int main(int argc, char* argv[]) {
    try {
        const auto opts = parse_args(argc, argv);
        if (!opts) {
            return 1;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        ShieldConfig config;
        if (!opts->config_file.empty()) {
            utils::log::info(std::format("Loading configuration from {}", opts->config_file));
            auto loaded = ConfigLoader::load_from_file(opts->config_file);
            if (!loaded.is_ok()) {
                utils::log::error(std::format("Config error: {}", loaded.error_message()));
                return 1;
            }
            config = std::move(loaded.value());
        }
        if (opts->preset) {
            config.preset = *opts->preset;
        }

        g_shield = std::make_shared<Shield>(config);

        ScanContext context;
        context.agent_id = opts->agent_id;

        std::string line;
        while (std::getline(std::cin, line)) {
            const auto result = g_shield->scan(line, context);
            std::cout << to_json_string(result) << '\n';
        }
        std::cout.flush();

        g_shield->close();
        const auto stats = g_shield->stats();
        utils::log::info(std::format("Scanned {} inputs ({} blocked, {} warned)",
            stats.total_scans, stats.blocked, stats.warned));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
