#include "stratify/backup/memory_backup_strategy.hpp"
#include "stratify/fix/facade_return_type_fixer.hpp"
#include "stratify/io/file_system.hpp"
#include "stratify/io/log_sink.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace stratify {

using testing_support::read_text;
using testing_support::TempDir;
using testing_support::write_text;

class FacadeReturnTypeFixerTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = temp_.path() / "agent" / "agent-facade" / "src" / "main" / "java" / "AgentFacade.java";
        write_text(source_, original_);
    }

    auto context(bool dry_run) -> FixerContext {
        return FixerContext{
            .project_root = temp_.path(),
            .module_root = temp_.path(),
            .dry_run = dry_run,
            .log = log_,
            .filesystem = fs_,
            .type_mappings = mappings_,
        };
    }

    auto violation_for(const std::string& core_type) const -> StructureViolation {
        return StructureViolation{
            .rule_id = "FA-002",
            .rule_category = "Facade",
            .message = "Method registry() returns " + core_type + " instead of an API type",
            .location = source_,
        };
    }

    TempDir temp_;
    FileSystem fs_;
    RecordingLogSink log_;
    TypeMappingTable mappings_ = default_type_mappings();
    std::filesystem::path source_;
    std::string original_ =
        "package dev.engineeringlab.agent.facade;\n"
        "\n"
        "import dev.engineeringlab.agent.core.DefaultAgentRegistry;\n"
        "\n"
        "public class AgentFacade {\n"
        "    public DefaultAgentRegistry registry() {\n"
        "        return AgentRuntime.registry();\n"
        "    }\n"
        "}\n";
};

TEST_F(FacadeReturnTypeFixerTest, RewritesSignatureAndImports)
{
    FacadeReturnTypeFixer fixer;

    auto result = fixer.fix(violation_for("DefaultAgentRegistry"), context(false));

    ASSERT_EQ(result.status, FixStatus::FIXED);
    EXPECT_EQ(result.description, "Change return type from DefaultAgentRegistry to AgentRegistry");
    ASSERT_EQ(result.modified_files.size(), 1);
    EXPECT_EQ(result.modified_files[0], source_);

    auto content = read_text(source_);
    EXPECT_NE(content.find("public AgentRegistry registry() {"), std::string::npos);
    EXPECT_NE(content.find("import dev.engineeringlab.agent.registry.AgentRegistry;"), std::string::npos);
    EXPECT_EQ(content.find("DefaultAgentRegistry"), std::string::npos);

    // One signature pair, one added import, one removed import
    ASSERT_EQ(result.diffs.size(), 3);
    EXPECT_EQ(result.diffs[0].removed, "public DefaultAgentRegistry registry() {");
    EXPECT_EQ(result.diffs[0].added, "public AgentRegistry registry() {");
    EXPECT_EQ(result.diffs[1].added, "import dev.engineeringlab.agent.registry.AgentRegistry;");
    EXPECT_EQ(result.diffs[2].removed, "import dev.engineeringlab.agent.core.DefaultAgentRegistry;");
}

TEST_F(FacadeReturnTypeFixerTest, SecondRunNeedsNoChanges)
{
    FacadeReturnTypeFixer fixer;
    ASSERT_EQ(fixer.fix(violation_for("DefaultAgentRegistry"), context(false)).status, FixStatus::FIXED);
    auto after_first = read_text(source_);

    auto result = fixer.fix(violation_for("DefaultAgentRegistry"), context(false));

    EXPECT_EQ(result.status, FixStatus::SKIPPED);
    EXPECT_EQ(result.description, "No changes needed - return type already correct or not found");
    EXPECT_EQ(read_text(source_), after_first);
}

TEST_F(FacadeReturnTypeFixerTest, DryRunMatchesFullRunWithoutWriting)
{
    FacadeReturnTypeFixer fixer;

    auto preview = fixer.fix(violation_for("DefaultAgentRegistry"), context(true));

    EXPECT_EQ(preview.status, FixStatus::DRY_RUN);
    EXPECT_TRUE(preview.modified_files.empty());
    EXPECT_EQ(read_text(source_), original_);

    auto applied = fixer.fix(violation_for("DefaultAgentRegistry"), context(false));
    EXPECT_EQ(preview.description, applied.description);
    EXPECT_EQ(preview.diffs, applied.diffs);
    EXPECT_EQ(preview.planned_files, applied.planned_files);
}

TEST_F(FacadeReturnTypeFixerTest, UnmatchedTypeLeavesFileIdentical)
{
    FacadeReturnTypeFixer fixer;

    auto result = fixer.fix(violation_for("DefaultAgentManager"), context(false));

    EXPECT_EQ(result.status, FixStatus::SKIPPED);
    EXPECT_EQ(read_text(source_), original_);
}

TEST_F(FacadeReturnTypeFixerTest, InferredMappingIsFlagged)
{
    write_text(source_, "package a;\npublic class F {\n    public SchedulerImpl scheduler() {\n        return null;\n    }\n}\n");
    FacadeReturnTypeFixer fixer;

    auto result = fixer.fix(violation_for("SchedulerImpl"), context(false));

    ASSERT_EQ(result.status, FixStatus::FIXED);
    EXPECT_EQ(result.description, "Change return type from SchedulerImpl to Scheduler (inferred mapping, verify imports)");
    EXPECT_NE(read_text(source_).find("public Scheduler scheduler() {"), std::string::npos);
}

TEST_F(FacadeReturnTypeFixerTest, UnresolvableViolationsAreSkipped)
{
    FacadeReturnTypeFixer fixer;

    auto no_file = violation_for("DefaultAgentRegistry");
    no_file.location = temp_.path() / "missing.java";
    EXPECT_EQ(fixer.fix(no_file, context(false)).status, FixStatus::SKIPPED);

    auto no_type = violation_for("DefaultAgentRegistry");
    no_type.message = "Facade looks odd";
    auto result = fixer.fix(no_type, context(false));
    EXPECT_EQ(result.status, FixStatus::SKIPPED);
    EXPECT_EQ(result.description, "Could not determine core type from violation message");

    auto other_rule = violation_for("DefaultAgentRegistry");
    other_rule.rule_id = "MS-001";
    EXPECT_EQ(fixer.fix(other_rule, context(false)).status, FixStatus::SKIPPED);

    EXPECT_EQ(read_text(source_), original_);
}

TEST_F(FacadeReturnTypeFixerTest, DirectoryLocationUsesFirstSourceFile)
{
    FacadeReturnTypeFixer fixer;
    auto violation = violation_for("DefaultAgentRegistry");
    violation.location = source_.parent_path();

    auto targets = fixer.target_files(violation, context(false));

    ASSERT_EQ(targets.size(), 1);
    EXPECT_EQ(targets[0], source_);
}

TEST_F(FacadeReturnTypeFixerTest, GuardsOwnWriteWithBackup)
{
    MemoryBackupStrategy backup;
    auto ctx = context(false);
    ctx.backup = &backup;
    FacadeReturnTypeFixer fixer;

    auto result = fixer.fix(violation_for("DefaultAgentRegistry"), ctx);

    EXPECT_EQ(result.status, FixStatus::FIXED);
    EXPECT_EQ(backup.pending_transactions(), 0);
}

} // namespace stratify
