#pragma once

#include "stratify/config/config_loader.hpp"
#include "stratify/core/fix_result.hpp"
#include "stratify/core/violation.hpp"
#include "stratify/interfaces.hpp"
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stratify {

// Command line settings; unset optionals defer to the project configuration
struct Config {
    std::filesystem::path project_root = ".";
    std::optional<std::filesystem::path> config_file;
    bool dry_run = false;
    bool scan_only = false;
    bool quiet = false;
    bool fallthrough = false;
    std::optional<std::string> backup_strategy;
    std::optional<size_t> max_failures;
    std::optional<size_t> jobs;
};

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILURES = 1;
inline constexpr int EXIT_USAGE = 2;

class StratifyApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<ILogSink> log_;
    std::ostream& report_out_;

public:
    StratifyApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<ILogSink> log,
                std::ostream& report_out);

    // discover -> detect -> fix -> report; returns the process exit status
    auto run(const Config& config) -> int;

    // Every violation found in the project's modules, deduplicated
    auto scan(const std::filesystem::path& project_root, const ProjectConfig& project)
        -> std::vector<StructureViolation>;

    auto remediate(const std::vector<StructureViolation>& violations,
                   const std::filesystem::path& project_root, const ProjectConfig& project,
                   bool dry_run) -> std::vector<FixResult>;

private:
    auto load_configuration(const Config& config, const std::filesystem::path& project_root)
        -> ProjectConfig;
};

} // namespace stratify
