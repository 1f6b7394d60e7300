#include "stratify/io/file_system.hpp"
#include "stratify/scan/module_scanner.hpp"
#include "stratify/scan/module_source_index.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace stratify {

using testing_support::aggregator_pom;
using testing_support::jar_pom;
using testing_support::TempDir;
using testing_support::write_text;

class ModuleScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = temp_.path() / "agent-parent";
        write_text(root_ / "pom.xml", aggregator_pom("agent-parent"));
        write_text(root_ / "agent-core" / "pom.xml", jar_pom("agent-core"));
        write_text(root_ / "agent-facade" / "pom.xml", jar_pom("agent-facade"));
    }

    TempDir temp_;
    FileSystem fs_;
    std::filesystem::path root_;
};

TEST_F(ModuleScannerTest, DetectsLayerSubmodulesUnderBaseName)
{
    auto info = scan_module(fs_, root_);

    EXPECT_EQ(info.base_name, "agent");
    EXPECT_FALSE(info.has_api);
    EXPECT_TRUE(info.has_core);
    EXPECT_FALSE(info.has_spi);
    EXPECT_TRUE(info.has_facade);
    EXPECT_TRUE(info.has_submodules);
    EXPECT_EQ(info.submodule_path("api"), root_ / "agent-api");
}

TEST_F(ModuleScannerTest, CommonSubmoduleCountsAsSubmoduleOnly)
{
    auto plain = temp_.path() / "tools";
    write_text(plain / "pom.xml", aggregator_pom("tools"));
    std::filesystem::create_directories(plain / "tools-common");

    auto info = scan_module(fs_, plain);

    EXPECT_FALSE(info.has_layer_submodules());
    EXPECT_TRUE(info.has_submodules);
}

TEST_F(ModuleScannerTest, DiscoveryWalksTreeAndSkipsBuildOutput)
{
    write_text(root_ / "target" / "stale" / "pom.xml", jar_pom("stale"));
    write_text(root_ / ".remediation" / "staging" / "1" / "pom.xml.bak", "");
    write_text(root_ / ".hidden" / "pom.xml", jar_pom("hidden"));

    auto modules = discover_modules(fs_, root_);

    ASSERT_EQ(modules.size(), 3);
    EXPECT_EQ(modules[0].path, root_);
    EXPECT_EQ(modules[1].path, root_ / "agent-core");
    EXPECT_EQ(modules[2].path, root_ / "agent-facade");
}

TEST_F(ModuleScannerTest, PackagingAndAggregatorChecks)
{
    EXPECT_EQ(read_packaging(fs_, root_), "pom");
    EXPECT_EQ(read_packaging(fs_, root_ / "agent-core"), "jar");
    EXPECT_FALSE(read_packaging(fs_, temp_.path()).has_value());

    EXPECT_TRUE(is_aggregator(fs_, root_));
    EXPECT_FALSE(is_aggregator(fs_, root_ / "agent-core"));
    EXPECT_FALSE(is_pure_aggregator(fs_, scan_module(fs_, root_)));
}

TEST_F(ModuleScannerTest, PackagingDefaultsToJar)
{
    write_text(temp_.path() / "lib" / "pom.xml", "<project><artifactId>lib</artifactId></project>");

    EXPECT_EQ(read_packaging(fs_, temp_.path() / "lib"), "jar");
}

TEST_F(ModuleScannerTest, SourceRootsCoverModuleAndLayers)
{
    write_text(root_ / "agent-core" / "src" / "main" / "java" / "a" / "Impl.java", "class Impl {}");
    write_text(root_ / "agent-core" / "src" / "main" / "java" / "a" / "package-info.java", "package a;");
    write_text(root_ / "agent-core" / "src" / "main" / "java" / "a" / "notes.txt", "");
    ModuleSourceIndex index(fs_);
    auto info = scan_module(fs_, root_);

    auto roots = index.source_roots(info);
    ASSERT_EQ(roots.size(), 1);
    EXPECT_EQ(roots[0], root_ / "agent-core" / "src" / "main" / "java");

    auto files = index.source_files(roots[0]);
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(files[0].filename(), "Impl.java");
}

} // namespace stratify
