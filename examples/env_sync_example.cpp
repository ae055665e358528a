#include "envsync/core/errors.hpp"
#include "envsync/core/logging.hpp"
#include "envsync/sync/config.hpp"
#include "envsync/sync/manager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace envsync;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --source <dir> --target <dir> [options]\n"
              << "\n"
              << "Options:\n"
              << "  -s, --source <path>       Source path\n"
              << "  -t, --target <path>       Target path\n"
              << "      --strategy <name>     source-wins | target-wins | merge | manual | skip (default: merge)\n"
              << "      --direction <name>    source-to-target | target-to-source | bidirectional\n"
              << "  -w, --workers <n>         Parallel workers per directory (default: 8)\n"
              << "  -n, --dry-run             Report what would change without writing\n"
              << "  -v, --verbose             Debug logging\n"
              << "      --include-hidden      Include dot files and directories\n"
              << "      --no-backup           Do not back up replaced or removed files\n"
              << "  -c, --config <file>       JSON configuration, applied before the flags above\n"
              << "      --status-file <file>  Write a JSON status report\n"
              << "  -h, --help                Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    configure_logging(false);

    sync::SyncOptions options = sync::environment_defaults({}, {});
    std::optional<fs::path> config_file;
    std::optional<fs::path> status_file;

    std::optional<fs::path> source;
    std::optional<fs::path> target;
    std::optional<std::string> strategy;
    std::optional<std::string> direction;
    std::optional<int> workers;
    bool dry_run = false;
    bool verbose = false;
    bool include_hidden = false;
    bool no_backup = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-s" || arg == "--source") && i + 1 < argc) {
            source = fs::path(argv[++i]);
        } else if ((arg == "-t" || arg == "--target") && i + 1 < argc) {
            target = fs::path(argv[++i]);
        } else if (arg == "--strategy" && i + 1 < argc) {
            strategy = argv[++i];
        } else if (arg == "--direction" && i + 1 < argc) {
            direction = argv[++i];
        } else if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            try {
                workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid worker count: " << argv[i] << "\n";
                return EXIT_FAILURE;
            }
        } else if (arg == "-n" || arg == "--dry-run") {
            dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--include-hidden") {
            include_hidden = true;
        } else if (arg == "--no-backup") {
            no_backup = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = fs::path(argv[++i]);
        } else if (arg == "--status-file" && i + 1 < argc) {
            status_file = fs::path(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (config_file) {
        auto loaded = sync::load_options(*config_file, options);
        if (loaded.is_error()) {
            spdlog::error("Cannot load {}: {}", config_file->string(), loaded.message());
            return EXIT_FAILURE;
        }
        options = std::move(loaded.value());
    }

    if (source) options.source_root = *source;
    if (target) options.target_root = *target;
    if (workers) options.max_workers = *workers;
    if (dry_run) options.dry_run = true;
    if (verbose) options.verbose = true;
    if (include_hidden) options.include_hidden = true;
    if (no_backup) options.backup_enabled = false;
    if (strategy) {
        auto parsed = sync::parse_conflict_strategy(*strategy);
        if (parsed.is_error()) {
            spdlog::error("{}", parsed.message());
            return EXIT_FAILURE;
        }
        options.conflict_strategy = parsed.value();
    }
    if (direction) {
        auto parsed = sync::parse_direction(*direction);
        if (parsed.is_error()) {
            spdlog::error("{}", parsed.message());
            return EXIT_FAILURE;
        }
        options.direction = parsed.value();
    }

    configure_logging(options.verbose);

    std::optional<sync::SyncConfiguration> config;
    try {
        config.emplace(std::move(options));
    } catch (const ConfigurationError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    sync::SyncManager manager(std::move(*config));
    const auto result = manager.run();

    const auto summary = manager.summary();
    spdlog::info("{}: {}", result.success ? "OK" : "FAILED", result.message);
    spdlog::info("Items: {}  succeeded: {}  failed: {}  changed: {}  bytes: {}",
                 summary.total, summary.succeeded, summary.failed, summary.changed,
                 summary.bytes_transferred);

    if (status_file) {
        if (auto written = sync::write_status_report(*status_file, manager.results()); written.is_error()) {
            spdlog::error("Cannot write status report: {}", written.message());
            return EXIT_FAILURE;
        }
        spdlog::info("Status report written to {}", status_file->string());
    }

    return summary.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
