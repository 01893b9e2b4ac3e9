// File: tests/unit/test_cli.cpp
// Purpose: Drive the apicheck command line against files on disk.
// Key invariants: Exit code 0 means no violations, 1 means violations were
//                 reported, 2 means usage or catalog failure.
// Ownership/Lifetime: Each test owns a scratch directory under the system
//                     temp path and removes it on teardown.
// Links: tools/apicheck/cli.hpp

#include <gtest/gtest.h>

#include "common/ClassFileBuilder.hpp"
#include "tools/apicheck/cli.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using apicheck::tests::ClassFileBuilder;
using apicheck::tools::runCLI;

namespace fs = std::filesystem;

namespace
{

constexpr const char *kCatalog = R"XML(<?xml version="1.0" encoding="utf-8"?>
<api version="1">
  <class name="java/lang/Object" since="1" />
  <class name="android/app/Activity" since="1">
    <extends name="java/lang/Object" />
    <method name="getActionBar()Landroid/app/ActionBar;" since="11" />
  </class>
  <class name="android/view/ViewGroup" since="1">
    <extends name="java/lang/Object" />
  </class>
  <class name="android/widget/GridLayout" since="14">
    <extends name="android/view/ViewGroup" />
  </class>
</api>
)XML";

class CliTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("apicheck_cli_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_ / "bin");
        fs::create_directories(dir_ / "res/layout");
        write("api-versions.xml", kCatalog);

        ClassFileBuilder b("foo/bar/ApiCallTest", "android/app/Activity");
        b.setSourceFile("ApiCallTest.java");
        b.method("method", "()V")
            .line(20)
            .aload0()
            .invokeVirtual("foo/bar/ApiCallTest", "getActionBar", "()Landroid/app/ActionBar;")
            .pop()
            .returnVoid();
        write("bin/ApiCallTest.class", b.build());
        write("res/layout/main.xml", "<LinearLayout>\n  <GridLayout />\n</LinearLayout>\n");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string &rel, const std::string &contents)
    {
        std::ofstream out(dir_ / rel, std::ios::binary);
        out << contents;
    }

    std::string path(const std::string &rel) const
    {
        return (dir_ / rel).generic_string();
    }

    int run(std::vector<std::string> args)
    {
        args.insert(args.begin(), "apicheck");
        std::vector<char *> argv;
        for (auto &a : args)
            argv.push_back(a.data());
        out_.str(std::string());
        err_.str(std::string());
        return runCLI(static_cast<int>(argv.size()), argv.data(), out_, err_);
    }

    fs::path dir_;
    std::ostringstream out_;
    std::ostringstream err_;
};

} // namespace

TEST_F(CliTest, ReportsViolationsWithExitCodeOne)
{
    const int rc = run({"--catalog", path("api-versions.xml"), "--min", "1", "--base", dir_.generic_string(),
                        "--class", path("bin/ApiCallTest.class") + "=" + path("src/foo/bar/ApiCallTest.java"),
                        path("res/layout/main.xml")});
    EXPECT_EQ(rc, 1) << err_.str();
    EXPECT_EQ(out_.str(),
              "res/layout/main.xml:2: Error: View requires API level 14 (current min is 1): <GridLayout>\n"
              "src/foo/bar/ApiCallTest.java:20: Error: Call requires API level 11 (current min is 1): "
              "android.app.Activity#getActionBar\n");
    EXPECT_TRUE(err_.str().empty()) << err_.str();
}

TEST_F(CliTest, CleanRunExitsZero)
{
    const int rc = run({"--catalog", path("api-versions.xml"), "--min", "14", "--jobs", "2",
                        path("bin/ApiCallTest.class"), path("res/layout/main.xml")});
    EXPECT_EQ(rc, 0) << err_.str();
    EXPECT_EQ(out_.str(), "No warnings.\n");
}

TEST_F(CliTest, SourcePathFallsBackToSourceFileAttribute)
{
    const int rc = run({"--catalog", path("api-versions.xml"), "--min", "4", path("bin/ApiCallTest.class")});
    EXPECT_EQ(rc, 1);
    EXPECT_EQ(out_.str(),
              "foo/bar/ApiCallTest.java:20: Error: Call requires API level 11 (current min is 4): "
              "android.app.Activity#getActionBar\n");
}

TEST_F(CliTest, UnreadableInputIsSkipped)
{
    write("bin/Broken.class", "not a class file");
    const int rc = run({"--catalog", path("api-versions.xml"), "--min", "1", "--base", dir_.generic_string(),
                        path("bin/Broken.class"), "--layout", path("res/layout/main.xml")});
    EXPECT_EQ(rc, 1);
    EXPECT_NE(err_.str().find("unit-parse"), std::string::npos) << err_.str();
    EXPECT_NE(err_.str().find("skipped 1 unreadable file: "), std::string::npos) << err_.str();
    EXPECT_EQ(out_.str(),
              "res/layout/main.xml:2: Error: View requires API level 14 (current min is 1): <GridLayout>\n");
}

TEST_F(CliTest, CatalogFailureExitsTwo)
{
    EXPECT_EQ(run({"--catalog", path("missing.xml"), "--min", "1", path("bin/ApiCallTest.class")}), 2);
    EXPECT_NE(err_.str().find("catalog-load"), std::string::npos) << err_.str();
    EXPECT_TRUE(out_.str().empty());

    write("broken.xml", "<api><class name=\"x\"></api>");
    EXPECT_EQ(run({"--catalog", path("broken.xml"), "--min", "1"}), 2);
    EXPECT_NE(err_.str().find("catalog-load"), std::string::npos) << err_.str();
}

TEST_F(CliTest, UsageErrorsExitTwo)
{
    EXPECT_EQ(run({"--min", "1"}), 2);
    EXPECT_NE(err_.str().find("--catalog is required"), std::string::npos);
    EXPECT_NE(err_.str().find("Usage: apicheck"), std::string::npos);

    EXPECT_EQ(run({"--catalog", path("api-versions.xml")}), 2);
    EXPECT_NE(err_.str().find("--min is required"), std::string::npos);

    EXPECT_EQ(run({"--catalog", path("api-versions.xml"), "--min", "-3"}), 2);
    EXPECT_NE(err_.str().find("invalid --min value '-3'"), std::string::npos);

    EXPECT_EQ(run({"--catalog", path("api-versions.xml"), "--min", "1", "--jobs", "many"}), 2);
    EXPECT_EQ(run({"--catalog", path("api-versions.xml"), "--min", "1", "--bogus"}), 2);
    EXPECT_EQ(run({"--catalog", path("api-versions.xml"), "--min", "1", "notes.txt"}), 2);
    EXPECT_EQ(run({"--catalog"}), 2);
    EXPECT_NE(err_.str().find("missing value for --catalog"), std::string::npos);
}

TEST_F(CliTest, HelpExitsZero)
{
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out_.str().find("Usage: apicheck"), std::string::npos);
}
