#include "stratify/application/stratify_app.hpp"
#include "stratify/io/file_system.hpp"
#include "stratify/io/log_sink.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace stratify {

using testing_support::aggregator_pom;
using testing_support::jar_pom;
using testing_support::read_text;
using testing_support::TempDir;
using testing_support::write_text;

// A platform tree with one layered module missing its api and core layers
// and one pure aggregator without the Maven wrapper
class StratifyAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = temp_.path();
        write_text(root_ / "agent" / "pom.xml", aggregator_pom("agent"));
        write_text(root_ / "agent" / "agent-facade" / "pom.xml", jar_pom("agent-facade"));
        write_text(root_ / "group" / "pom.xml", aggregator_pom("group"));
    }

    auto make_app() -> StratifyApp {
        auto log = std::make_unique<RecordingLogSink>();
        log_ = log.get();
        return StratifyApp(std::make_unique<FileSystem>(), std::move(log), report_);
    }

    auto config() const -> Config {
        Config config;
        config.project_root = root_;
        return config;
    }

    TempDir temp_;
    std::filesystem::path root_;
    std::ostringstream report_;
    RecordingLogSink* log_ = nullptr;
};

TEST_F(StratifyAppTest, ScanFindsEveryViolationOnce)
{
    auto app = make_app();

    auto violations = app.scan(root_, ProjectConfig{});

    ASSERT_EQ(violations.size(), 5);
    EXPECT_EQ(violations[0].rule_id, "MS-001");
    EXPECT_EQ(violations[1].rule_id, "MS-002");
    for (size_t i = 2; i < violations.size(); ++i) {
        EXPECT_EQ(violations[i].rule_id, "AG-005");
    }
}

TEST_F(StratifyAppTest, ScanOnlyReportsAndFails)
{
    auto app = make_app();
    auto settings = config();
    settings.scan_only = true;

    EXPECT_EQ(app.run(settings), EXIT_FAILURES);
    EXPECT_NE(report_.str().find("5 violation(s) found"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(root_ / "agent" / "agent-api"));
}

TEST_F(StratifyAppTest, CleanTreeExitsZero)
{
    std::filesystem::remove_all(root_ / "agent");
    std::filesystem::remove_all(root_ / "group");
    auto app = make_app();

    EXPECT_EQ(app.run(config()), EXIT_OK);
    EXPECT_EQ(report_.str(), "No violations found\n");
}

TEST_F(StratifyAppTest, DryRunLeavesTreeUntouched)
{
    auto before = read_text(root_ / "agent" / "pom.xml");
    auto app = make_app();
    auto settings = config();
    settings.dry_run = true;

    EXPECT_EQ(app.run(settings), EXIT_OK);

    EXPECT_EQ(read_text(root_ / "agent" / "pom.xml"), before);
    EXPECT_FALSE(std::filesystem::exists(root_ / "agent" / "agent-api"));
    EXPECT_FALSE(std::filesystem::exists(root_ / "group" / "mvnw"));
    EXPECT_NE(report_.str().find("would be fixed"), std::string::npos);
    EXPECT_NE(report_.str().find("+ create: agent-api/pom.xml"), std::string::npos);
    EXPECT_TRUE(log_->contains("Dry run: no files will be modified"));
}

TEST_F(StratifyAppTest, FullRunRepairsTree)
{
    auto app = make_app();

    EXPECT_EQ(app.run(config()), EXIT_OK);

    EXPECT_TRUE(std::filesystem::is_regular_file(root_ / "agent" / "agent-api" / "pom.xml"));
    EXPECT_TRUE(std::filesystem::is_regular_file(root_ / "agent" / "agent-core" / "pom.xml"));
    auto parent = read_text(root_ / "agent" / "pom.xml");
    EXPECT_NE(parent.find("<module>agent-api</module>"), std::string::npos);
    EXPECT_NE(parent.find("<module>agent-core</module>"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(root_ / "group" / "mvnw"));
    EXPECT_TRUE(std::filesystem::exists(root_ / "group" / ".mvn" / "wrapper" / "maven-wrapper.properties"));

    // Nothing is left for a second pass
    std::ostringstream second_report;
    StratifyApp again(std::make_unique<FileSystem>(), std::make_unique<RecordingLogSink>(), second_report);
    auto settings = config();
    settings.scan_only = true;
    EXPECT_EQ(again.run(settings), EXIT_OK);
    EXPECT_EQ(second_report.str(), "No violations found\n");
}

TEST_F(StratifyAppTest, ParallelRunMatchesSequential)
{
    auto app = make_app();
    auto settings = config();
    settings.jobs = 4;
    settings.backup_strategy = "memory";

    EXPECT_EQ(app.run(settings), EXIT_OK);

    EXPECT_TRUE(std::filesystem::is_directory(root_ / "agent" / "agent-api"));
    EXPECT_TRUE(std::filesystem::is_directory(root_ / "agent" / "agent-core"));
    EXPECT_TRUE(std::filesystem::exists(root_ / "group" / "mvnw.cmd"));
}

TEST_F(StratifyAppTest, DisabledRuleFromConfigurationIsLeftAlone)
{
    write_text(root_ / "stratify.yaml", "namespace: dev.engineeringlab\n"
                                        "remediation:\n"
                                        "  disabled-rules: [AG-005]\n");
    auto app = make_app();

    EXPECT_EQ(app.run(config()), EXIT_OK);

    EXPECT_TRUE(std::filesystem::is_directory(root_ / "agent" / "agent-api"));
    EXPECT_FALSE(std::filesystem::exists(root_ / "group" / "mvnw"));
    EXPECT_TRUE(log_->contains("Skipping disabled rule AG-005"));
    EXPECT_TRUE(log_->contains("Using configuration"));
}

TEST_F(StratifyAppTest, MalformedConfigurationIsUsageError)
{
    write_text(root_ / "stratify.yaml", "namespace: [broken\n");
    auto app = make_app();

    EXPECT_EQ(app.run(config()), EXIT_USAGE);
    EXPECT_FALSE(std::filesystem::exists(root_ / "agent" / "agent-api"));
}

TEST_F(StratifyAppTest, ExplicitConfigWithoutNamespaceIsUsageError)
{
    write_text(root_ / "elsewhere.yaml", "project: orphan\n");
    auto app = make_app();
    auto settings = config();
    settings.config_file = root_ / "elsewhere.yaml";

    EXPECT_EQ(app.run(settings), EXIT_USAGE);
}

TEST_F(StratifyAppTest, MissingProjectDirectoryIsUsageError)
{
    auto app = make_app();
    auto settings = config();
    settings.project_root = root_ / "does-not-exist";

    EXPECT_EQ(app.run(settings), EXIT_USAGE);
    EXPECT_TRUE(log_->contains("Project directory does not exist"));
}

} // namespace stratify
