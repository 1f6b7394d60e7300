#include "mocks.hpp"
#include "stratify/backup/memory_backup_strategy.hpp"
#include "stratify/backup/staging_backup_strategy.hpp"
#include "stratify/errors.hpp"
#include "stratify/io/file_system.hpp"
#include "stratify/io/log_sink.hpp"
#include "stratify/remediation/orchestrator.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <gtest/gtest.h>

namespace stratify {

using testing_support::read_text;
using testing_support::TempDir;
using testing_support::write_text;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        target_ = temp_.path() / "agent" / "Facade.java";
        write_text(target_, "original");
    }

    // Registers a mock fixer and returns a handle for setting expectations
    auto add_fixer(const std::string& name, int priority, std::vector<std::string> rules,
                   std::vector<std::filesystem::path> targets = {}) -> NiceMock<MockFixer>& {
        auto fixer = std::make_unique<NiceMock<MockFixer>>();
        ON_CALL(*fixer, name()).WillByDefault(Return(name));
        ON_CALL(*fixer, priority()).WillByDefault(Return(priority));
        ON_CALL(*fixer, supported_rules()).WillByDefault(Return(rules));
        ON_CALL(*fixer, target_files(_, _)).WillByDefault(Return(targets));
        auto& handle = *fixer;
        registry_.register_fixer(std::move(fixer));
        return handle;
    }

    auto context(bool dry_run = false) -> FixerContext {
        return FixerContext{
            .project_root = temp_.path(),
            .module_root = temp_.path(),
            .dry_run = dry_run,
            .log = log_,
            .filesystem = fs_,
            .type_mappings = mappings_,
        };
    }

    static auto violation(const std::string& rule_id, const std::string& where = "agent") -> StructureViolation {
        return StructureViolation{.rule_id = rule_id, .message = rule_id + " breach", .location = where};
    }

    TempDir temp_;
    FileSystem fs_;
    RecordingLogSink log_;
    TypeMappingTable mappings_ = default_type_mappings();
    FixerRegistry registry_;
    MemoryBackupStrategy backup_;
    std::filesystem::path target_;
};

TEST_F(OrchestratorTest, ThrowingFixerIsRolledBack)
{
    auto created = temp_.path() / "agent" / "agent-api" / "pom.xml";
    auto& fixer = add_fixer("Breaker", 50, {"MS-001"}, {target_, created});
    EXPECT_CALL(fixer, fix(_, _)).WillOnce(Invoke([&](const StructureViolation&, const FixerContext&) -> FixResult {
        write_text(target_, "half written");
        write_text(created, "<project/>");
        throw IoError("disk full");
    }));
    RemediationOrchestrator orchestrator(registry_, backup_);

    auto results = orchestrator.fix_all({violation("MS-001")}, context());

    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].status, FixStatus::FAILED);
    EXPECT_EQ(results[0].error_message, "disk full");
    EXPECT_EQ(read_text(target_), "original");
    EXPECT_FALSE(std::filesystem::exists(temp_.path() / "agent" / "agent-api"));
    EXPECT_TRUE(log_.contains("rolling back"));
    EXPECT_EQ(backup_.pending_transactions(), 0);
}

TEST_F(OrchestratorTest, ReportedFailureIsRolledBackToo)
{
    StagingBackupStrategy staging;
    auto& fixer = add_fixer("Partial", 50, {"FA-002"}, {target_});
    EXPECT_CALL(fixer, fix(_, _)).WillOnce(Invoke([&](const StructureViolation& v, const FixerContext&) {
        write_text(target_, "partial");
        return fix_failed(v, "second write refused");
    }));
    RemediationOrchestrator orchestrator(registry_, staging);

    auto result = orchestrator.fix_one(violation("FA-002"), context());

    EXPECT_EQ(result.status, FixStatus::FAILED);
    EXPECT_TRUE(result.modified_files.empty());
    EXPECT_EQ(read_text(target_), "original");
    EXPECT_FALSE(std::filesystem::exists(temp_.path() / ".remediation"));
}

TEST_F(OrchestratorTest, UnrestorableFileKeepsStagedBackup)
{
    StagingBackupStrategy staging;
    auto& fixer = add_fixer("Wrecker", 50, {"FA-002"}, {target_});
    EXPECT_CALL(fixer, fix(_, _)).WillOnce(Invoke([&](const StructureViolation&, const FixerContext&) -> FixResult {
        std::filesystem::remove(target_);
        std::filesystem::create_directories(target_ / "obstruction");
        throw IoError("interrupted");
    }));
    RemediationOrchestrator orchestrator(registry_, staging);

    auto result = orchestrator.fix_one(violation("FA-002"), context());

    EXPECT_EQ(result.status, FixStatus::FAILED);
    EXPECT_TRUE(log_.contains("Could not restore " + target_.string()));
    EXPECT_TRUE(log_.contains("Backup kept at"));
    EXPECT_TRUE(std::filesystem::exists(temp_.path() / ".remediation" / "staging"));
}

TEST_F(OrchestratorTest, SuccessfulFixIsCommitted)
{
    auto& fixer = add_fixer("Writer", 50, {"FA-002"}, {target_});
    EXPECT_CALL(fixer, fix(_, _)).WillOnce(Invoke([&](const StructureViolation& v, const FixerContext&) {
        write_text(target_, "fixed");
        return fix_applied(v, false, "rewrote", {target_}, {});
    }));
    RemediationOrchestrator orchestrator(registry_, backup_);

    auto result = orchestrator.fix_one(violation("FA-002"), context());

    EXPECT_EQ(result.status, FixStatus::FIXED);
    EXPECT_EQ(read_text(target_), "fixed");
    EXPECT_EQ(backup_.pending_transactions(), 0);
}

TEST_F(OrchestratorTest, HighestPriorityFixerWins)
{
    auto& low = add_fixer("Low", 10, {"MS-001"});
    auto& high = add_fixer("High", 90, {"MS-001"});
    EXPECT_CALL(low, fix(_, _)).Times(0);
    EXPECT_CALL(high, fix(_, _)).WillOnce(Invoke([](const StructureViolation& v, const FixerContext&) {
        return fix_skipped(v, "nothing to do");
    }));
    RemediationOrchestrator orchestrator(registry_, backup_);

    auto result = orchestrator.fix_one(violation("MS-001"), context());

    EXPECT_EQ(result.status, FixStatus::SKIPPED);
    EXPECT_EQ(result.description, "nothing to do");
}

TEST_F(OrchestratorTest, FallthroughTriesNextFixer)
{
    auto& first = add_fixer("First", 90, {"MS-001"});
    auto& second = add_fixer("Second", 10, {"MS-001"});
    EXPECT_CALL(first, fix(_, _)).WillOnce(Invoke([](const StructureViolation& v, const FixerContext&) {
        return fix_skipped(v, "not mine");
    }));
    EXPECT_CALL(second, fix(_, _)).WillOnce(Invoke([](const StructureViolation& v, const FixerContext&) {
        return fix_applied(v, false, "done", {}, {});
    }));
    RemediationOrchestrator orchestrator(registry_, backup_, OrchestratorOptions{.fallthrough_on_skip = true});

    auto result = orchestrator.fix_one(violation("MS-001"), context());

    EXPECT_EQ(result.status, FixStatus::FIXED);
    EXPECT_EQ(result.description, "done");
}

TEST_F(OrchestratorTest, MissingFixerYieldsSkipped)
{
    RemediationOrchestrator orchestrator(registry_, backup_);

    auto results = orchestrator.fix_all({violation("FX-002")}, context());

    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].status, FixStatus::SKIPPED);
    EXPECT_EQ(results[0].description, "No fixer registered for rule: FX-002");
}

TEST_F(OrchestratorTest, DisabledRulesAndFixers)
{
    auto& disabled = add_fixer("Disabled", 90, {"MS-001"});
    auto& fallback = add_fixer("Fallback", 10, {"MS-001"});
    add_fixer("Ignored", 50, {"AG-005"});
    EXPECT_CALL(disabled, fix(_, _)).Times(0);
    EXPECT_CALL(fallback, fix(_, _)).WillOnce(Invoke([](const StructureViolation& v, const FixerContext&) {
        return fix_applied(v, false, "fallback fixed it", {}, {});
    }));
    RemediationOrchestrator orchestrator(
        registry_, backup_, OrchestratorOptions{.disabled_rules = {"AG-005"}, .disabled_fixers = {"Disabled"}});

    auto results = orchestrator.fix_all({violation("AG-005"), violation("MS-001")}, context());

    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].description, "fallback fixed it");
}

TEST_F(OrchestratorTest, AbandonsAfterFailureThreshold)
{
    auto& fixer = add_fixer("Failing", 50, {"MS-001"});
    EXPECT_CALL(fixer, fix(_, _)).WillOnce(Invoke([](const StructureViolation&, const FixerContext&) -> FixResult {
        throw std::runtime_error("boom");
    }));
    RemediationOrchestrator orchestrator(registry_, backup_, OrchestratorOptions{.max_failures = 1});

    auto results = orchestrator.fix_all({violation("MS-001", "a"), violation("MS-001", "b"), violation("MS-001", "c")},
                                        context());

    ASSERT_EQ(results.size(), 3);
    EXPECT_EQ(results[0].status, FixStatus::FAILED);
    EXPECT_EQ(results[1].status, FixStatus::SKIPPED);
    EXPECT_EQ(results[1].description, "Abandoned after 1 failures");
    EXPECT_EQ(results[2].violation.location, "c");
}

TEST_F(OrchestratorTest, ResultsFollowRuleOrder)
{
    auto& fixer = add_fixer("Any", 50, {"MS-001", "AG-005", "FA-002"});
    ON_CALL(fixer, fix(_, _)).WillByDefault(Invoke([](const StructureViolation& v, const FixerContext&) {
        return fix_skipped(v, v.rule_id);
    }));
    RemediationOrchestrator orchestrator(registry_, backup_);

    auto results = orchestrator.fix_all({violation("MS-001"), violation("FA-002"), violation("AG-005")}, context());

    ASSERT_EQ(results.size(), 3);
    EXPECT_EQ(results[0].violation.rule_id, "AG-005");
    EXPECT_EQ(results[1].violation.rule_id, "FA-002");
    EXPECT_EQ(results[2].violation.rule_id, "MS-001");
}

TEST_F(OrchestratorTest, ParallelJobsRunEveryDisjointFix)
{
    std::vector<std::filesystem::path> files;
    for (int i = 0; i < 6; ++i) {
        files.push_back(temp_.path() / ("F" + std::to_string(i) + ".java"));
        write_text(files.back(), "before");
    }

    auto fixer = std::make_unique<NiceMock<MockFixer>>();
    ON_CALL(*fixer, name()).WillByDefault(Return("Parallel"));
    ON_CALL(*fixer, priority()).WillByDefault(Return(50));
    ON_CALL(*fixer, supported_rules()).WillByDefault(Return(std::vector<std::string>{"FA-002"}));
    ON_CALL(*fixer, target_files(_, _)).WillByDefault(Invoke([](const StructureViolation& v, const FixerContext&) {
        return std::vector<std::filesystem::path>{v.location};
    }));
    std::atomic<int> calls{0};
    ON_CALL(*fixer, fix(_, _)).WillByDefault(Invoke([&](const StructureViolation& v, const FixerContext&) {
        ++calls;
        write_text(v.location, "after");
        return fix_applied(v, false, "rewrote", {v.location}, {});
    }));
    registry_.register_fixer(std::move(fixer));

    std::vector<StructureViolation> violations;
    for (const auto& file : files) {
        violations.push_back(violation("FA-002", file.string()));
    }
    // Two fixes for the same file must not overlap
    violations.push_back(violation("FA-002", files[0].string()));

    RemediationOrchestrator orchestrator(registry_, backup_, OrchestratorOptions{.jobs = 4});
    auto results = orchestrator.fix_all(violations, context());

    ASSERT_EQ(results.size(), 7);
    EXPECT_EQ(calls.load(), 7);
    EXPECT_EQ(summarize(results).fixed, 7);
    for (const auto& file : files) {
        EXPECT_EQ(read_text(file), "after");
    }
    EXPECT_EQ(results[6].violation.location, files[0]);
    EXPECT_EQ(backup_.pending_transactions(), 0);
}

TEST_F(OrchestratorTest, DryRunTakesNoBackup)
{
    MockBackupStrategy backup;
    EXPECT_CALL(backup, backup(_, _)).Times(0);
    auto& fixer = add_fixer("Planner", 50, {"FA-002"}, {target_});
    EXPECT_CALL(fixer, fix(_, _)).WillOnce(Invoke([&](const StructureViolation& v, const FixerContext& ctx) {
        return fix_applied(v, ctx.dry_run, "would rewrite", {target_}, {});
    }));
    RemediationOrchestrator orchestrator(registry_, backup);

    auto result = orchestrator.fix_one(violation("FA-002"), context(true));

    EXPECT_EQ(result.status, FixStatus::DRY_RUN);
    EXPECT_TRUE(result.modified_files.empty());
    EXPECT_EQ(read_text(target_), "original");
}

TEST_F(OrchestratorTest, BackupFailureFailsWithoutRunningFixer)
{
    MockBackupStrategy backup;
    EXPECT_CALL(backup, backup(_, _)).WillOnce(Invoke([](const std::vector<std::filesystem::path>&, const std::filesystem::path&) -> BackupHandle {
        throw IoError("staging directory not writable");
    }));
    auto& fixer = add_fixer("Writer", 50, {"FA-002"}, {target_});
    EXPECT_CALL(fixer, fix(_, _)).Times(0);
    RemediationOrchestrator orchestrator(registry_, backup);

    auto result = orchestrator.fix_one(violation("FA-002"), context());

    EXPECT_EQ(result.status, FixStatus::FAILED);
    EXPECT_EQ(result.error_message, "Backup failed: staging directory not writable");
}

TEST(FixSummaryTest, CountsEachStatus)
{
    StructureViolation v{.rule_id = "MS-001"};
    std::vector<FixResult> results{fix_skipped(v, "a"), fix_failed(v, "b"), fix_applied(v, true, "c", {}, {}),
                                   fix_applied(v, false, "d", {}, {}), fix_skipped(v, "e")};

    auto summary = summarize(results);

    EXPECT_EQ(summary, (FixSummary{.fixed = 1, .skipped = 2, .failed = 1, .dry_run = 1}));
    EXPECT_EQ(summary.total(), 5);
}

} // namespace stratify
