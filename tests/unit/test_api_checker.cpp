// File: tests/unit/test_api_checker.cpp
// Purpose: End-to-end checks over in-memory class files and layouts.
// Key invariants: Results are sorted by (file, line) with discovery order as
//                 tie-break and do not depend on the worker count.
// Ownership/Lifetime: Standalone test executable.
// Links: check/ApiChecker.hpp, report/Reporter.hpp

#include <gtest/gtest.h>

#include "check/ApiChecker.hpp"
#include "common/ClassFileBuilder.hpp"
#include "report/Reporter.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace apicheck;
using check::CompiledUnit;
using check::ResourceFile;
using tests::ClassFileBuilder;

namespace
{

catalog::ApiCatalog makeCatalog()
{
    catalog::ApiCatalog api;
    api.addClass("java/lang/Object", 1);
    api.addClass("android/app/Activity", 1);
    api.addClass("android/app/ActionBar", 11);
    api.addClass("android/view/View", 1);
    api.addClass("android/widget/GridLayout", 14);
    api.addClass("android/animation/ValueAnimator", 11);
    api.addMethod("android/app/Activity", "getActionBar", "()", 11);
    api.addMethod("android/view/View", "setAlpha", "(F)", 11);
    api.addMethod("android/view/View", "setScrollX", "(I)", 14);
    api.addField("android/view/View", "LAYER_TYPE_HARDWARE", 11);
    api.addUiTag("GridLayout", 14);
    api.addUiTag("LinearLayout", 1);
    api.addEdge({"android/app/Activity", "java/lang/Object"});
    api.addEdge({"android/view/View", "java/lang/Object"});
    api.addEdge({"android/widget/GridLayout", "android/view/View"});
    return api;
}

/// The classic Activity subclass calling an API 11 method from line 20.
CompiledUnit activityUnit()
{
    ClassFileBuilder b("foo/bar/ApiCallTest", "android/app/Activity");
    b.method("<init>", "()V")
        .line(17)
        .aload0()
        .invokeSpecial("android/app/Activity", "<init>", "()V")
        .returnVoid();
    b.method("method", "()V")
        .line(20)
        .aload0()
        .invokeVirtual("foo/bar/ApiCallTest", "getActionBar", "()Landroid/app/ActionBar;")
        .pop()
        .returnVoid();
    return {"bin/foo/bar/ApiCallTest.class", "src/foo/bar/ApiCallTest.java", b.build()};
}

/// Layout whose GridLayout element starts on line 21.
ResourceFile gridLayout(std::string path = "res/layout/main.xml")
{
    std::string text = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                       "<LinearLayout xmlns:android=\"http://schemas.android.com/apk/res/android\"\n";
    for (int line = 3; line <= 19; ++line)
        text += "    android:attr" + std::to_string(line) + "=\"x\"\n";
    text += "    >\n"
            "    <GridLayout android:columnCount=\"2\" />\n"
            "</LinearLayout>\n";
    return {std::move(path), std::move(text)};
}

std::vector<std::string> formatted(const check::ScanResult &result)
{
    std::vector<std::string> lines;
    for (const auto &v : result.violations)
        lines.push_back(report::formatViolation(v));
    return lines;
}

} // namespace

TEST(ApiChecker, ReportsInheritedCallAgainstMinVersion)
{
    const auto api = makeCatalog();
    const std::vector<CompiledUnit> units = {activityUnit()};

    const auto low = check::scan(units, {}, 1, api);
    const std::vector<std::string> expected = {
        "src/foo/bar/ApiCallTest.java:20: Error: Call requires API level 11 (current min is 1): "
        "android.app.Activity#getActionBar"};
    EXPECT_EQ(formatted(low), expected);
    EXPECT_EQ(low.violations[0].unitIndex, 0u);
    EXPECT_EQ(low.diagnostics.errorCount(), 0u);

    const auto high = check::scan(units, {}, 11, api);
    EXPECT_TRUE(high.violations.empty());
}

TEST(ApiChecker, ReportsLayoutTagAgainstMinVersion)
{
    const auto api = makeCatalog();
    const std::vector<ResourceFile> layouts = {gridLayout()};

    const auto low = check::scan({}, layouts, 1, api);
    const std::vector<std::string> expected = {
        "res/layout/main.xml:21: Error: View requires API level 14 (current min is 1): "
        "<GridLayout>"};
    EXPECT_EQ(formatted(low), expected);

    EXPECT_TRUE(check::scan({}, layouts, 14, api).violations.empty());
}

TEST(ApiChecker, NoViolationsPrintsNoWarnings)
{
    const auto api = makeCatalog();
    const auto result = check::scan({activityUnit()}, {gridLayout()}, 20, api);
    std::ostringstream os;
    report::printReport(result.violations, os);
    EXPECT_EQ(os.str(), "No warnings.\n");
}

TEST(ApiChecker, ClassAndMemberOnSameLineAreBothReported)
{
    ClassFileBuilder b("foo/Same");
    b.method("m", "(Ljava/lang/Object;)V")
        .line(9)
        .op(0x2B) // aload_1
        .checkCast("android/app/ActionBar")
        .pop()
        .getStatic("android/view/View", "LAYER_TYPE_HARDWARE", "I")
        .pop()
        .returnVoid();
    const std::vector<CompiledUnit> units = {{"Same.class", "Same.java", b.build()}};

    const auto result = check::scan(units, {}, 4, makeCatalog());
    const std::vector<std::string> expected = {
        "Same.java:9: Error: Class requires API level 11 (current min is 4): android.app.ActionBar",
        "Same.java:9: Error: Field requires API level 11 (current min is 4): "
        "android.view.View#LAYER_TYPE_HARDWARE",
    };
    EXPECT_EQ(formatted(result), expected);
}

TEST(ApiChecker, ViolationsShrinkAsMinVersionGrows)
{
    ClassFileBuilder b("foo/Mixed", "android/view/View");
    b.method("m", "()V")
        .line(3)
        .aload0()
        .invokeVirtual("foo/Mixed", "setScrollX", "(I)V")
        .line(4)
        .aload0()
        .invokeVirtual("foo/Mixed", "setAlpha", "(F)V")
        .line(5)
        .newObject("android/animation/ValueAnimator")
        .pop()
        .returnVoid();
    const std::vector<CompiledUnit> units = {{"Mixed.class", "Mixed.java", b.build()}};
    const std::vector<ResourceFile> layouts = {gridLayout()};
    const auto api = makeCatalog();

    std::vector<std::string> previous = formatted(check::scan(units, layouts, 1, api));
    EXPECT_EQ(previous.size(), 4u);
    for (int min = 2; min <= 15; ++min)
    {
        const auto result = check::scan(units, layouts, min, api);
        EXPECT_LE(result.violations.size(), previous.size()) << "min " << min;
        for (const auto &v : result.violations)
            EXPECT_GT(v.required, min);
        previous = formatted(result);
    }
    EXPECT_TRUE(previous.empty());
}

TEST(ApiChecker, UnreadableUnitDoesNotStopTheScan)
{
    const std::vector<CompiledUnit> units = {
        {"bin/Broken.class", "Broken.java", std::string("\xCA\xFE\xBA", 3)},
        activityUnit(),
    };
    const std::vector<ResourceFile> layouts = {
        {"res/layout/bad.xml", std::string("<LinearLayout>")},
        gridLayout(),
    };

    const auto result = check::scan(units, layouts, 1, makeCatalog());
    EXPECT_EQ(result.violations.size(), 2u);
    const std::vector<std::string> failed = {"bin/Broken.class", "res/layout/bad.xml"};
    EXPECT_EQ(result.failedPaths, failed);
    ASSERT_EQ(result.diagnostics.errorCount(), 2u);
    for (const auto &d : result.diagnostics.diagnostics())
        EXPECT_EQ(d.code, support::DiagCode::UnitParse);

    std::ostringstream err;
    result.diagnostics.printAll(err, &result.sources);
    EXPECT_EQ(err.str().rfind("bin/Broken.class: error: unit-parse: ", 0), 0u) << err.str();
    EXPECT_NE(err.str().find("res/layout/bad.xml: error: unit-parse: "), std::string::npos);
}

TEST(ApiChecker, OrdersByFileThenNumericLine)
{
    ClassFileBuilder late("foo/Late", "android/view/View");
    late.method("m", "()V")
        .line(10)
        .aload0()
        .invokeVirtual("foo/Late", "setAlpha", "(F)V")
        .line(9)
        .aload0()
        .invokeVirtual("foo/Late", "setScrollX", "(I)V")
        .returnVoid();
    ClassFileBuilder early("foo/Early");
    early.method("m", "()V").line(30).newObject("android/app/ActionBar").pop().returnVoid();

    const std::vector<CompiledUnit> units = {
        {"Late.class", "src/b/Late.java", late.build()},
        {"Early.class", "src/a/Early.java", early.build()},
    };
    const auto result = check::scan(units, {}, 1, makeCatalog());
    ASSERT_EQ(result.violations.size(), 3u);
    EXPECT_EQ(result.violations[0].reference.file, "src/a/Early.java");
    EXPECT_EQ(result.violations[1].reference.line, 9u);
    EXPECT_EQ(result.violations[2].reference.line, 10u);
    EXPECT_EQ(result.violations[1].reference.signature.member, "setScrollX");
}

TEST(ApiChecker, WorkerCountDoesNotChangeResults)
{
    const auto api = makeCatalog();
    std::vector<CompiledUnit> units;
    for (int i = 0; i < 12; ++i)
    {
        ClassFileBuilder b("foo/Unit" + std::to_string(i), "android/app/Activity");
        b.method("m", "()V")
            .line(static_cast<uint16_t>(5 + i % 3))
            .aload0()
            .invokeVirtual("android/app/Activity", "getActionBar", "()Landroid/app/ActionBar;")
            .pop()
            .newObject("android/app/ActionBar")
            .pop()
            .returnVoid();
        units.push_back({"Unit.class", "src/Shared.java", b.build()});
    }

    std::vector<std::vector<std::string>> runs;
    for (size_t jobs : {1u, 2u, 8u})
    {
        check::CheckOptions options;
        options.minVersion = 1;
        options.jobs = jobs;
        const auto result = check::ApiChecker(api, options).run(units, {gridLayout()});
        runs.push_back(formatted(result));
    }
    EXPECT_EQ(runs[0].size(), 25u);
    EXPECT_EQ(runs[0], runs[1]);
    EXPECT_EQ(runs[0], runs[2]);
}

TEST(ApiChecker, SuppressedScopesProduceNothing)
{
    ClassFileBuilder b("foo/bar/Quiet", "android/app/Activity");
    b.method("loud", "()V")
        .line(4)
        .aload0()
        .invokeVirtual("foo/bar/Quiet", "getActionBar", "()Landroid/app/ActionBar;")
        .pop()
        .returnVoid();
    b.method("quiet", "()V")
        .suppress({"NewApi"})
        .line(8)
        .aload0()
        .invokeVirtual("foo/bar/Quiet", "getActionBar", "()Landroid/app/ActionBar;")
        .pop()
        .returnVoid();

    const auto result = check::scan({{"Quiet.class", "Quiet.java", b.build()}}, {}, 1, makeCatalog());
    ASSERT_EQ(result.violations.size(), 1u);
    EXPECT_EQ(result.violations[0].reference.line, 4u);
}

TEST(ApiChecker, DerivesSourcePathAndRelativizesToBase)
{
    ClassFileBuilder b("foo/bar/Derived", "android/app/Activity");
    b.setSourceFile("Derived.java");
    b.method("m", "()V")
        .line(3)
        .aload0()
        .invokeVirtual("foo/bar/Derived", "getActionBar", "()Landroid/app/ActionBar;")
        .pop()
        .returnVoid();

    check::CheckOptions options;
    options.baseDir = "/work/proj";
    const auto result = check::ApiChecker(makeCatalog(), options)
                            .run({{"bin/foo/bar/Derived.class", "", b.build()}},
                                 {gridLayout("/work/proj/res/layout/main.xml")});
    ASSERT_EQ(result.violations.size(), 2u);
    EXPECT_EQ(result.violations[0].reference.file, "foo/bar/Derived.java");
    EXPECT_EQ(result.violations[1].reference.file, "res/layout/main.xml");
}

TEST(ApiChecker, ReportsParameterAndLocalTypes)
{
    catalog::ApiCatalog api = makeCatalog();
    api.addClass("org/w3c/dom/DOMLocator", 8);

    // class P {
    // 20   void m(org.w3c.dom.DOMLocator locator) {}
    // 22   @SuppressLint("NewApi") void quiet(org.w3c.dom.DOMLocator locator) {}
    // 24   void body() { @SuppressLint("NewApi") android.widget.GridLayout g = null; }
    // }
    ClassFileBuilder b("foo/P");
    auto &m = b.method("m", "(Lorg/w3c/dom/DOMLocator;)V");
    m.line(20).returnVoid();
    m.local("this", "Lfoo/P;", 0, 1, 0).local("locator", "Lorg/w3c/dom/DOMLocator;", 0, 1, 1);
    auto &quiet = b.method("quiet", "(Lorg/w3c/dom/DOMLocator;)V");
    quiet.suppress({"NewApi"}).line(22).returnVoid();
    quiet.local("locator", "Lorg/w3c/dom/DOMLocator;", 0, 1, 1);
    // Annotations on local variables are not kept in the class file.
    auto &body = b.method("body", "()V");
    body.line(24).op(0x01).op(0x4C).returnVoid(); // aconst_null, astore_1
    body.local("g", "Landroid/widget/GridLayout;", 2, 1, 1);

    const auto result = check::scan({{"P.class", "foo/P.java", b.build()}}, {}, 1, api);
    const std::vector<std::string> expected = {
        "foo/P.java:20: Error: Class requires API level 8 (current min is 1): org.w3c.dom.DOMLocator",
        "foo/P.java:24: Error: Class requires API level 14 (current min is 1): android.widget.GridLayout",
    };
    EXPECT_EQ(formatted(result), expected);
}

TEST(ApiChecker, FieldSuppressionCoversOnlyItsInitializer)
{
    // class Grid {
    //  5   @SuppressLint("NewApi") GridLayout mFirst = new GridLayout(null);
    //  6   @SuppressLint("NewApi") GridLayout mGrid;
    // 10   Grid(Context c) { super();
    // 12       mGrid = new GridLayout(c);
    // 13   }
    // }
    const std::string grid = "Landroid/widget/GridLayout;";
    ClassFileBuilder b("foo/Grid");
    b.addField("mFirst", grid, std::vector<std::string>{"NewApi"});
    b.addField("mGrid", grid, std::vector<std::string>{"NewApi"});
    b.method("<init>", "(Landroid/content/Context;)V")
        .line(10)
        .aload0()
        .invokeSpecial("java/lang/Object", "<init>", "()V")
        .line(5)
        .aload0()
        .newObject("android/widget/GridLayout")
        .putField("foo/Grid", "mFirst", grid)
        .line(12)
        .aload0()
        .newObject("android/widget/GridLayout")
        .putField("foo/Grid", "mGrid", grid)
        .line(13)
        .returnVoid();

    const auto result = check::scan({{"Grid.class", "Grid.java", b.build()}}, {}, 1, makeCatalog());
    const std::vector<std::string> expected = {
        "Grid.java:12: Error: Class requires API level 14 (current min is 1): android.widget.GridLayout",
    };
    EXPECT_EQ(formatted(result), expected);
}

namespace
{

/// Synthetic holder javac emits for `switch (mode)` over an enum in foo.Foo,
/// with the switch statement on line 20.
std::string switchMapClass()
{
    const std::string mode = "android/graphics/PorterDuff$Mode";
    ClassFileBuilder b("foo/Foo$1");
    b.setSourceFile("Foo.java");
    b.addInnerClass("foo/Foo$1", "foo/Foo", "");
    b.addField("$SwitchMap$android$graphics$PorterDuff$Mode", "[I");
    auto &clinit = b.method("<clinit>", "()V", 0x0008);
    clinit.line(20)
        .invokeStatic(mode, "values", "()[L" + mode + ";")
        .op(0xBE) // arraylength
        .op(0xBC)
        .op(0x0A) // newarray int
        .putStatic("foo/Foo$1", "$SwitchMap$android$graphics$PorterDuff$Mode", "[I")
        .getStatic("foo/Foo$1", "$SwitchMap$android$graphics$PorterDuff$Mode", "[I")
        .getStatic(mode, "OVERLAY", "L" + mode + ";")
        .invokeVirtual(mode, "ordinal", "()I")
        .op(0x04) // iconst_1
        .op(0x4F) // iastore
        .returnVoid()
        .handler("java/lang/NoSuchFieldError")
        .pop()
        .returnVoid();
    return b.build();
}

catalog::ApiCatalog switchCatalog()
{
    catalog::ApiCatalog api = makeCatalog();
    api.addClass("android/graphics/PorterDuff$Mode", 1);
    api.addMethod("android/graphics/PorterDuff$Mode", "values", "()", 5);
    api.addField("android/graphics/PorterDuff$Mode", "OVERLAY", 11);
    return api;
}

} // namespace

TEST(ApiChecker, ReportsEnumSwitchMapAtSwitchLine)
{
    const auto result =
        check::scan({{"bin/foo/Foo$1.class", "", switchMapClass()}}, {}, 4, switchCatalog());
    ASSERT_EQ(result.violations.size(), 2u);

    const auto &values = result.violations[0];
    EXPECT_EQ(values.reference.kind, catalog::ElementKind::Method);
    EXPECT_EQ(values.reference.signature.member, "values");
    EXPECT_EQ(values.reference.file, "foo/Foo.java");
    EXPECT_EQ(values.reference.line, 20u);
    EXPECT_EQ(values.required, 5);

    const auto &overlay = result.violations[1];
    EXPECT_EQ(overlay.reference.kind, catalog::ElementKind::Field);
    EXPECT_EQ(overlay.reference.signature.member, "OVERLAY");
    EXPECT_EQ(overlay.reference.file, "foo/Foo.java");
    EXPECT_EQ(overlay.reference.line, 20u);
    EXPECT_EQ(overlay.required, 11);
}

TEST(ApiChecker, OuterClassSuppressionReachesSwitchMap)
{
    ClassFileBuilder outer("foo/Foo");
    outer.setSourceFile("Foo.java");
    outer.suppress({"NewApi"});
    outer.addInnerClass("foo/Foo$1", "foo/Foo", "");

    const std::vector<CompiledUnit> units = {
        {"bin/foo/Foo.class", "", outer.build()},
        {"bin/foo/Foo$1.class", "", switchMapClass()},
    };
    const auto result = check::scan(units, {}, 4, switchCatalog());
    EXPECT_TRUE(result.violations.empty());
    EXPECT_EQ(result.diagnostics.errorCount(), 0u);
}
