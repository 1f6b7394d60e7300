#include "stratify/detect/facade_return_type_detector.hpp"
#include "stratify/detect/missing_module_detector.hpp"
#include "stratify/detect/wrapper_presence_detector.hpp"
#include "stratify/io/file_system.hpp"
#include "stratify/scan/module_scanner.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace stratify {

using testing_support::aggregator_pom;
using testing_support::jar_pom;
using testing_support::TempDir;
using testing_support::write_text;

class StructureDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = temp_.path() / "agent";
        write_text(root_ / "pom.xml", aggregator_pom("agent"));
        write_text(root_ / "agent-facade" / "pom.xml", jar_pom("agent-facade"));
    }

    auto facade_source_dir() const -> std::filesystem::path {
        return root_ / "agent-facade" / "src" / "main" / "java" / "dev" / "engineeringlab" / "agent" / "facade";
    }

    TempDir temp_;
    FileSystem fs_;
    std::filesystem::path root_;
};

TEST_F(StructureDetectorTest, MissingApiAndCoreReported)
{
    MissingModuleDetector detector(fs_);

    auto violations = detector.detect(scan_module(fs_, root_));

    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].rule_id, "MS-001");
    EXPECT_EQ(violations[0].rule_category, "ModuleStructure");
    EXPECT_EQ(violations[0].location, root_);
    EXPECT_NE(violations[0].message.find("API module 'agent-api' must exist"), std::string::npos);
    EXPECT_EQ(violations[1].rule_id, "MS-002");
    EXPECT_NE(violations[1].message.find("'agent-core'"), std::string::npos);
}

TEST_F(StructureDetectorTest, CompleteLayeringHasNoMissingModules)
{
    std::filesystem::create_directories(root_ / "agent-api");
    std::filesystem::create_directories(root_ / "agent-core");
    MissingModuleDetector detector(fs_);

    EXPECT_TRUE(detector.detect(scan_module(fs_, root_)).empty());
}

TEST_F(StructureDetectorTest, PureAggregatorNeedsNoLayers)
{
    auto group = temp_.path() / "group";
    write_text(group / "pom.xml", aggregator_pom("group"));
    MissingModuleDetector detector(fs_);

    EXPECT_TRUE(detector.detect(scan_module(fs_, group)).empty());
}

TEST_F(StructureDetectorTest, FacadeReturningCoreTypeIsFlagged)
{
    write_text(facade_source_dir() / "AgentFacade.java",
               "package dev.engineeringlab.agent.facade;\n"
               "\n"
               "import dev.engineeringlab.agent.core.DefaultAgentRegistry;\n"
               "\n"
               "public class AgentFacade {\n"
               "    public DefaultAgentRegistry registry() {\n"
               "        return registry;\n"
               "    }\n"
               "    public SchedulerImpl scheduler() { return null; }\n"
               "    private DefaultAgentManager manager() { return null; }\n"
               "    public String name() { return \"agent\"; }\n"
               "}\n");
    FacadeReturnTypeDetector detector(fs_, default_type_mappings());

    auto violations = detector.detect(scan_module(fs_, root_));

    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].rule_id, "FA-002");
    EXPECT_EQ(violations[0].rule_category, "Facade");
    EXPECT_EQ(violations[0].message, "Method registry() returns DefaultAgentRegistry instead of an API type");
    EXPECT_EQ(violations[0].location, facade_source_dir() / "AgentFacade.java");
    EXPECT_EQ(violations[0].found, "AgentFacade.registry() returns DefaultAgentRegistry at line 6");
    EXPECT_EQ(violations[1].message, "Method scheduler() returns SchedulerImpl instead of an API type");
}

TEST_F(StructureDetectorTest, FacadeInterfacesAreIgnored)
{
    FacadeReturnTypeDetector detector(fs_, default_type_mappings());

    auto violations = detector.analyze_source("Api.java",
                                              "public interface Api {\n"
                                              "    DefaultAgentRegistry registry();\n"
                                              "}\n");

    EXPECT_TRUE(violations.empty());
}

TEST_F(StructureDetectorTest, ModuleWithoutFacadeIsNotInspected)
{
    auto plain = temp_.path() / "plain";
    write_text(plain / "pom.xml", aggregator_pom("plain"));
    FacadeReturnTypeDetector detector(fs_, default_type_mappings());

    EXPECT_TRUE(detector.detect(scan_module(fs_, plain)).empty());
}

TEST_F(StructureDetectorTest, WrapperViolationPerMissingItem)
{
    auto group = temp_.path() / "group";
    write_text(group / "pom.xml", aggregator_pom("platform-group"));
    write_text(group / "mvnw", "#!/bin/sh\n");
    WrapperPresenceDetector detector(fs_);

    auto violations = detector.detect(scan_module(fs_, group));

    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].rule_id, "AG-005");
    EXPECT_EQ(violations[0].rule_category, "Aggregator");
    EXPECT_EQ(violations[0].location, group / "mvnw.cmd");
    EXPECT_NE(violations[0].message.find("Pure aggregator 'platform-group' must have"), std::string::npos);
    EXPECT_EQ(violations[1].location, group / ".mvn/wrapper");
}

TEST_F(StructureDetectorTest, WrapperPropertiesMissingInsideExistingDirectory)
{
    auto group = temp_.path() / "group";
    write_text(group / "pom.xml", aggregator_pom("group"));
    write_text(group / "mvnw", "");
    write_text(group / "mvnw.cmd", "");
    std::filesystem::create_directories(group / ".mvn" / "wrapper");
    WrapperPresenceDetector detector(fs_);

    auto violations = detector.detect(scan_module(fs_, group));

    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].location, group / ".mvn/wrapper/maven-wrapper.properties");
}

TEST_F(StructureDetectorTest, LayeredModuleIsNotPureAggregator)
{
    WrapperPresenceDetector detector(fs_);

    EXPECT_TRUE(detector.detect(scan_module(fs_, root_)).empty());
}

} // namespace stratify
