#include "stratify/fix/wrapper_install_fixer.hpp"
#include "stratify/io/file_system.hpp"
#include "stratify/io/log_sink.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace stratify {

using testing_support::aggregator_pom;
using testing_support::read_text;
using testing_support::TempDir;
using testing_support::write_text;

class WrapperInstallFixerTest : public ::testing::Test {
protected:
    void SetUp() override {
        module_ = temp_.path() / "platform";
        write_text(module_ / "pom.xml", aggregator_pom("platform"));
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

    auto violation_at(const std::string& relative) const -> StructureViolation {
        return StructureViolation{.rule_id = "AG-005", .message = "wrapper missing", .location = module_ / relative};
    }

    TempDir temp_;
    FileSystem fs_;
    RecordingLogSink log_;
    TypeMappingTable mappings_ = default_type_mappings();
    std::filesystem::path module_;
};

TEST_F(WrapperInstallFixerTest, InstallsOnlyTheMissingFile)
{
    write_text(module_ / "mvnw", "custom script");
    write_text(module_ / ".mvn" / "wrapper" / "maven-wrapper.properties", "custom=1\n");
    WrapperInstallFixer fixer;

    auto result = fixer.fix(violation_at("mvnw.cmd"), context(false));

    ASSERT_EQ(result.status, FixStatus::FIXED);
    EXPECT_EQ(result.description, "Install Maven wrapper (1 file)");
    ASSERT_EQ(result.modified_files.size(), 1);
    EXPECT_EQ(result.modified_files[0], module_ / "mvnw.cmd");
    EXPECT_FALSE(read_text(module_ / "mvnw.cmd").empty());
    EXPECT_EQ(read_text(module_ / "mvnw"), "custom script");
    EXPECT_EQ(read_text(module_ / ".mvn" / "wrapper" / "maven-wrapper.properties"), "custom=1\n");
}

TEST_F(WrapperInstallFixerTest, SecondRunIsSkipped)
{
    WrapperInstallFixer fixer;
    ASSERT_EQ(fixer.fix(violation_at("mvnw"), context(false)).status, FixStatus::FIXED);

    auto result = fixer.fix(violation_at("mvnw"), context(false));

    EXPECT_EQ(result.status, FixStatus::SKIPPED);
    EXPECT_EQ(result.description, "All Maven wrapper files already exist");
}

TEST_F(WrapperInstallFixerTest, FullInstallMarksScriptExecutable)
{
    WrapperInstallFixer fixer;

    auto result = fixer.fix(violation_at(".mvn/wrapper"), context(false));

    ASSERT_EQ(result.status, FixStatus::FIXED);
    EXPECT_EQ(result.description, "Install Maven wrapper (3 files)");
    EXPECT_EQ(result.modified_files.size(), 3);
    auto perms = std::filesystem::status(module_ / "mvnw").permissions();
    EXPECT_NE(perms & std::filesystem::perms::owner_exec, std::filesystem::perms::none);
    EXPECT_NE(read_text(module_ / ".mvn" / "wrapper" / "maven-wrapper.properties").find("distributionUrl="),
              std::string::npos);
}

TEST_F(WrapperInstallFixerTest, DryRunTouchesNothing)
{
    WrapperInstallFixer fixer;

    auto result = fixer.fix(violation_at("mvnw"), context(true));

    EXPECT_EQ(result.status, FixStatus::DRY_RUN);
    EXPECT_TRUE(result.modified_files.empty());
    EXPECT_EQ(result.planned_files.size(), 3);
    ASSERT_FALSE(result.diffs.empty());
    EXPECT_EQ(result.diffs[0].added, "create directory: .mvn/wrapper");
    EXPECT_FALSE(std::filesystem::exists(module_ / "mvnw"));
    EXPECT_FALSE(std::filesystem::exists(module_ / ".mvn"));
}

TEST_F(WrapperInstallFixerTest, TargetFilesAreTheMissingAssets)
{
    write_text(module_ / "mvnw", "");
    WrapperInstallFixer fixer;

    auto targets = fixer.target_files(violation_at("mvnw.cmd"), context(false));

    ASSERT_EQ(targets.size(), 2);
    EXPECT_EQ(targets[0], module_ / "mvnw.cmd");
    EXPECT_EQ(targets[1], module_ / ".mvn/wrapper/maven-wrapper.properties");
}

TEST(WrapperTemplatesTest, ThreeAssetsScriptExecutable)
{
    auto assets = wrapper_assets();

    ASSERT_EQ(assets.size(), 3);
    EXPECT_EQ(assets[0].relative_path, WRAPPER_SCRIPT);
    EXPECT_TRUE(assets[0].executable);
    EXPECT_EQ(assets[2].relative_path, WRAPPER_PROPERTIES);
    EXPECT_FALSE(assets[2].executable);
}

} // namespace stratify
