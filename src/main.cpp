#include "stratify/application/stratify_app.hpp"
#include "stratify/io/file_system.hpp"
#include "stratify/io/log_sink.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

auto print_usage() -> void {
    std::cout << "Usage: stratify [options]\n";
    std::cout << "  -p, --project <dir>      Project root to scan (default: .)\n";
    std::cout << "  -c, --config <file>      Configuration file (default: stratify.yaml in the project)\n";
    std::cout << "      --dry-run            Preview fixes without modifying files\n";
    std::cout << "      --scan-only          Report violations and exit\n";
    std::cout << "      --backup <name>      Backup strategy: staging or memory\n";
    std::cout << "      --max-failures <n>   Abandon remaining fixes after n failures\n";
    std::cout << "  -j, --jobs <n>           Apply independent fixes in parallel\n";
    std::cout << "      --fallthrough        Try the next fixer when one skips\n";
    std::cout << "  -q, --quiet              Suppress informational output\n";
    std::cout << "  -h, --help               Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  stratify -p ~/src/platform --scan-only   # CI gate\n";
    std::cout << "  stratify -p ~/src/platform --dry-run     # Preview\n";
    std::cout << "  stratify -p ~/src/platform -j 4          # Apply\n";
}

[[noreturn]] auto usage_error(const std::string& message) -> void {
    std::cerr << "error: " << message << "\n";
    std::cerr << "Try 'stratify --help' for more information.\n";
    std::exit(stratify::EXIT_USAGE);
}

auto parse_count(const std::string& option, const std::string& value) -> size_t {
    size_t consumed = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &consumed);
    } catch (const std::logic_error&) {
        usage_error(option + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || value.front() == '-') {
        usage_error(option + " expects a number, got '" + value + "'");
    }
    return static_cast<size_t>(parsed);
}

auto parse_args(int argc, char* argv[]) -> stratify::Config {
    stratify::Config config;

    auto value_of = [&](int& i, const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            usage_error(option + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-p" || arg == "--project") {
            config.project_root = value_of(i, arg);
        } else if (arg == "-c" || arg == "--config") {
            config.config_file = value_of(i, arg);
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--scan-only") {
            config.scan_only = true;
        } else if (arg == "--backup") {
            config.backup_strategy = value_of(i, arg);
        } else if (arg == "--max-failures") {
            config.max_failures = parse_count(arg, value_of(i, arg));
        } else if (arg == "-j" || arg == "--jobs") {
            config.jobs = parse_count(arg, value_of(i, arg));
        } else if (arg == "--fallthrough") {
            config.fallthrough = true;
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(0);
        } else {
            usage_error("unknown option '" + arg + "'");
        }
    }

    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config = parse_args(argc, argv);

    stratify::StratifyApp app(std::make_unique<stratify::FileSystem>(),
                              std::make_unique<stratify::StreamLogSink>(std::cerr, std::cerr, config.quiet),
                              std::cout);
    return app.run(config);
}
