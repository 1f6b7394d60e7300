#include "stratify/application/stratify_app.hpp"
#include "stratify/application/rule_catalog.hpp"
#include "stratify/backup/backup_registry.hpp"
#include "stratify/errors.hpp"
#include "stratify/remediation/orchestrator.hpp"
#include "stratify/report/console_reporter.hpp"
#include "stratify/scan/module_scanner.hpp"
#include <algorithm>
#include <set>

namespace stratify {

StratifyApp::StratifyApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<ILogSink> log,
                         std::ostream& report_out)
    : filesystem_(std::move(filesystem)), log_(std::move(log)), report_out_(report_out) {}

auto StratifyApp::run(const Config& config) -> int {
    std::error_code ec;
    auto project_root = std::filesystem::absolute(config.project_root, ec).lexically_normal();
    if (ec || !filesystem_->is_directory(project_root)) {
        log_->error("Project directory does not exist: " + config.project_root.string());
        return EXIT_USAGE;
    }

    ProjectConfig project;
    try {
        project = load_configuration(config, project_root);
    } catch (const ConfigError& e) {
        log_->error(e.what());
        return EXIT_USAGE;
    }

    std::vector<StructureViolation> violations;
    try {
        violations = scan(project_root, project);
    } catch (const IoError& e) {
        log_->error(e.what());
        return EXIT_FAILURES;
    }

    ConsoleReporter reporter(report_out_, project_root);
    reporter.report_violations(violations);

    if (config.scan_only) {
        return violations.empty() ? EXIT_OK : EXIT_FAILURES;
    }
    if (violations.empty()) {
        return EXIT_OK;
    }

    auto results = remediate(violations, project_root, project, config.dry_run);
    reporter.report_results(results, config.dry_run);

    auto failed = std::any_of(results.begin(), results.end(),
                              [](const FixResult& result) { return result.status == FixStatus::FAILED; });
    return failed ? EXIT_FAILURES : EXIT_OK;
}

auto StratifyApp::load_configuration(const Config& config, const std::filesystem::path& project_root)
    -> ProjectConfig {
    auto project = config.config_file ? ConfigLoader::load_file(*config.config_file)
                                      : ConfigLoader::load_project(project_root);
    if (project.source) {
        log_->info("Using configuration " + project.source->string());
    }

    // Command line wins over the file
    if (config.backup_strategy) {
        project.backup_strategy = *config.backup_strategy;
    }
    if (config.max_failures) {
        project.max_failures = *config.max_failures;
    }
    if (config.jobs) {
        project.jobs = std::max<size_t>(1, *config.jobs);
    }
    if (config.fallthrough) {
        project.fallthrough_on_skip = true;
    }
    return project;
}

auto StratifyApp::scan(const std::filesystem::path& project_root, const ProjectConfig& project)
    -> std::vector<StructureViolation> {
    auto modules = discover_modules(*filesystem_, project_root);
    log_->info("Scanning " + std::to_string(modules.size()) + " module(s) in " + project_root.string());

    auto detectors = RuleCatalog::default_detectors(*filesystem_, project.type_mappings);

    std::vector<StructureViolation> violations;
    std::set<std::string> seen;
    for (const auto& module : modules) {
        for (const auto& detector : detectors) {
            for (auto& violation : detector->detect(module)) {
                if (seen.insert(violation_key(violation)).second) {
                    violations.push_back(std::move(violation));
                }
            }
        }
    }
    return violations;
}

auto StratifyApp::remediate(const std::vector<StructureViolation>& violations,
                            const std::filesystem::path& project_root, const ProjectConfig& project,
                            bool dry_run) -> std::vector<FixResult> {
    BackupStrategyRegistry backups;
    auto& backup = backups.select(project.backup_strategy, *log_);
    auto registry = RuleCatalog::default_fixers();

    RemediationOrchestrator orchestrator(registry, backup,
                                         OrchestratorOptions{
                                             .fallthrough_on_skip = project.fallthrough_on_skip,
                                             .max_failures = project.max_failures,
                                             .jobs = project.jobs,
                                             .disabled_rules = project.disabled_rules,
                                             .disabled_fixers = project.disabled_fixers,
                                         });

    FixerContext context{
        .project_root = project_root,
        .module_root = project_root,
        .dry_run = dry_run,
        .log = *log_,
        .filesystem = *filesystem_,
        .type_mappings = project.type_mappings,
        .base_namespace = project.base_namespace,
        .project_name = project.project_name,
    };

    if (dry_run) {
        log_->info("Dry run: no files will be modified");
    }
    return orchestrator.fix_all(violations, context);
}

} // namespace stratify
