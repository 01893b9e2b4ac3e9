// File: tests/unit/test_support_utils.cpp
// Purpose: Path, list-formatting and diagnostic helpers.
// Key invariants: Output strings match what the CLI prints byte for byte.
// Ownership/Lifetime: Standalone test executable.
// Links: support/path_utils.hpp, support/text_utils.hpp, support/diag_expected.hpp

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/path_utils.hpp"
#include "support/source_manager.hpp"
#include "support/text_utils.hpp"
#include "support/trace.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace apicheck::support;

TEST(FormatList, JoinsAllItemsWithoutLimit)
{
    EXPECT_EQ(formatList({"foo", "bar", "baz"}, 0), "foo, bar, baz");
    EXPECT_EQ(formatList({"foo", "bar", "baz"}, 3), "foo, bar, baz");
    EXPECT_EQ(formatList({"foo"}, 0), "foo");
    EXPECT_EQ(formatList({}, 0), "");
}

TEST(FormatList, TruncatesWithRemainderCount)
{
    EXPECT_EQ(formatList({"foo", "bar", "baz"}, 2), "foo, bar... (1 more)");
    EXPECT_EQ(formatList({"a", "b", "c", "d", "e"}, 1), "a... (4 more)");
}

TEST(PathUtils, IsXmlFileIgnoresCase)
{
    EXPECT_TRUE(isXmlFile("foo.xml"));
    EXPECT_TRUE(isXmlFile("foo.Xml"));
    EXPECT_TRUE(isXmlFile("foo.XML"));
    EXPECT_TRUE(isXmlFile("res/layout/main.xml"));

    EXPECT_FALSE(isXmlFile("foo.png"));
    EXPECT_FALSE(isXmlFile("xml"));
    EXPECT_FALSE(isXmlFile("foo.xmlx"));
}

TEST(PathUtils, IsClassFile)
{
    EXPECT_TRUE(isClassFile("bin/classes/foo/Bar.class"));
    EXPECT_TRUE(isClassFile("Bar.CLASS"));
    EXPECT_FALSE(isClassFile("Bar.java"));
    EXPECT_FALSE(isClassFile(".class"));
}

TEST(PathUtils, NormalizeCollapsesDotDotAndBackslashes)
{
    EXPECT_EQ(normalizePath("a/b/../c\\file.txt"), "a/c/file.txt");
    EXPECT_EQ(normalizePath(""), ".");
}

TEST(PathUtils, RelativeToBaseDirectory)
{
    EXPECT_EQ(relativeTo("/proj/src/Foo.java", "/proj"), "src/Foo.java");
    EXPECT_EQ(relativeTo("/proj/src/Foo.java", ""), "/proj/src/Foo.java");
    // Paths outside the base, or already relative, are kept as given.
    EXPECT_EQ(relativeTo("/elsewhere/x.xml", "/proj"), "/elsewhere/x.xml");
    EXPECT_EQ(relativeTo("foo/Bar.java", "/proj"), "foo/Bar.java");
}

TEST(Diagnostics, PrintsPathCodeAndMessage)
{
    std::ostringstream os;
    printDiag(makeError(DiagCode::UnitParse, "bin/Foo.class", "bad magic"), os);
    EXPECT_EQ(os.str(), "bin/Foo.class: error: unit-parse: bad magic\n");
}

TEST(Diagnostics, UsesSourceManagerPathAndLine)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("res/layout/../layout/main.xml");
    ASSERT_NE(id, 0u);
    EXPECT_EQ(sm.addFile("res/layout/main.xml"), id);

    Diag d = makeError(SourceLoc{id, 7}, "unexpected end tag");
    std::ostringstream os;
    printDiag(d, os, &sm);
    EXPECT_EQ(os.str(), "res/layout/main.xml:7: error: unexpected end tag\n");
}

TEST(Diagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine de;
    de.report(makeError(DiagCode::UnitParse, "a.class", "truncated"));
    Diagnostic note;
    note.severity = Severity::Warning;
    note.message = "odd";
    de.report(note);
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 1u);
    ASSERT_EQ(de.diagnostics().size(), 2u);
    EXPECT_EQ(de.diagnostics()[0].code, DiagCode::UnitParse);
}

TEST(Expected, CarriesValueOrDiagnostic)
{
    Expected<int> ok(42);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<int> bad(makeError(DiagCode::CatalogLoad, "api.xml", "missing"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, DiagCode::CatalogLoad);
    Diag taken = std::move(bad).takeError();
    EXPECT_EQ(taken.path, "api.xml");

    Expected<void> fine;
    EXPECT_TRUE(fine);
}

TEST(Trace, ForcedOnWritesPrefixedLines)
{
    std::ostringstream os;
    setTraceStream(os);
    setTraceEnabled(false);
    trace("hidden");
    EXPECT_TRUE(os.str().empty());

    setTraceEnabled(true);
    EXPECT_TRUE(traceEnabled());
    trace("parsed 3/3 class files");
    setTraceEnabled(false);
    setTraceStream(std::cerr);
    EXPECT_EQ(os.str(), "[apicheck] parsed 3/3 class files\n");
}
