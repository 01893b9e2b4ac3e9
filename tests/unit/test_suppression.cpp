// File: tests/unit/test_suppression.cpp
// Purpose: @SuppressLint scope lookup for references found in class files.
// Key invariants: Field, method and class scopes are consulted innermost
//                 first, then the lexically enclosing classes.
// Ownership/Lifetime: Standalone test executable.
// Links: check/SuppressionIndex.hpp

#include <gtest/gtest.h>

#include "check/SuppressionIndex.hpp"
#include "classfile/ClassReader.hpp"
#include "common/ClassFileBuilder.hpp"

#include <string>

using namespace apicheck;
using check::kNewApiCheckId;
using check::Reference;
using tests::ClassFileBuilder;

namespace
{

void add(check::SuppressionIndex &index, ClassFileBuilder &b)
{
    auto cls = classfile::parseClassFile(b.build(), "Test.class");
    ASSERT_TRUE(cls) << cls.error().message;
    index.addClass(cls.value());
}

Reference at(std::string owner, std::string method = {}, std::string desc = {}, std::string field = {})
{
    Reference r;
    r.kind = catalog::ElementKind::Method;
    r.signature = {"android/app/Activity", "getActionBar", "()"};
    r.line = 1;
    r.enclosing = {std::move(owner), std::move(method), std::move(desc), std::move(field)};
    return r;
}

} // namespace

TEST(Suppression, MethodScope)
{
    check::SuppressionIndex index;
    ClassFileBuilder b("foo/A");
    b.method("quiet", "()V").suppress({"NewApi"}).returnVoid();
    b.method("quiet", "(I)V").returnVoid();
    b.method("other", "()V").suppress({"HardcodedText"}).returnVoid();
    add(index, b);

    EXPECT_TRUE(index.isSuppressed(at("foo/A", "quiet", "()V"), kNewApiCheckId));
    // Overloads are separate declarations.
    EXPECT_FALSE(index.isSuppressed(at("foo/A", "quiet", "(I)V"), kNewApiCheckId));
    EXPECT_FALSE(index.isSuppressed(at("foo/A", "other", "()V"), kNewApiCheckId));
    EXPECT_TRUE(index.isSuppressed(at("foo/A", "other", "()V"), "HardcodedText"));
    EXPECT_FALSE(index.isSuppressed(at("foo/A"), kNewApiCheckId));
}

TEST(Suppression, ClassAndFieldScopes)
{
    check::SuppressionIndex index;
    ClassFileBuilder quiet("foo/Quiet");
    quiet.suppress({"NewApi"});
    quiet.method("m", "()V").returnVoid();
    add(index, quiet);

    ClassFileBuilder holder("foo/Holder");
    holder.addField("mInfo", "Ljava/lang/Object;", std::vector<std::string>{"NewApi"});
    holder.addField("mOther", "Ljava/lang/Object;");
    holder.method("<init>", "()V").returnVoid();
    add(index, holder);

    EXPECT_TRUE(index.isSuppressed(at("foo/Quiet", "m", "()V"), kNewApiCheckId));
    EXPECT_TRUE(index.isSuppressed(at("foo/Quiet"), kNewApiCheckId));
    EXPECT_TRUE(index.isSuppressed(at("foo/Holder", "<init>", "()V", "mInfo"), kNewApiCheckId));
    EXPECT_FALSE(index.isSuppressed(at("foo/Holder", "<init>", "()V", "mOther"), kNewApiCheckId));
    EXPECT_FALSE(index.isSuppressed(at("foo/Holder", "<init>", "()V"), kNewApiCheckId));
}

TEST(Suppression, AllAndEmptyListSuppressEverything)
{
    check::SuppressionIndex index;
    ClassFileBuilder b("foo/B");
    b.method("all", "()V").suppress({"all"}).returnVoid();
    b.method("bare", "()V").suppress({}).returnVoid();
    b.method("many", "()V").suppress({"Wakelock", "NewApi"}).returnVoid();
    add(index, b);

    EXPECT_TRUE(index.isSuppressed(at("foo/B", "all", "()V"), kNewApiCheckId));
    EXPECT_TRUE(index.isSuppressed(at("foo/B", "bare", "()V"), kNewApiCheckId));
    EXPECT_TRUE(index.isSuppressed(at("foo/B", "many", "()V"), kNewApiCheckId));
}

TEST(Suppression, UnknownOrEmptyEnclosingIsNotSuppressed)
{
    check::SuppressionIndex index;
    EXPECT_FALSE(index.isSuppressed(at("foo/Nowhere", "m", "()V"), kNewApiCheckId));
    EXPECT_FALSE(index.isSuppressed(at(""), kNewApiCheckId));
}

TEST(Suppression, MemberClassInheritsOuterScopes)
{
    check::SuppressionIndex index;
    ClassFileBuilder outer("foo/Outer");
    outer.suppress({"NewApi"});
    outer.addInnerClass("foo/Outer$Inner", "foo/Outer", "Inner");
    add(index, outer);

    ClassFileBuilder inner("foo/Outer$Inner");
    inner.addInnerClass("foo/Outer$Inner", "foo/Outer", "Inner");
    inner.method("m", "()V").returnVoid();
    add(index, inner);

    EXPECT_TRUE(index.isSuppressed(at("foo/Outer$Inner", "m", "()V"), kNewApiCheckId));
}

TEST(Suppression, LocalClassInheritsEnclosingMethod)
{
    check::SuppressionIndex index;
    ClassFileBuilder outer("foo/Host");
    outer.method("quiet", "()V").suppress({"NewApi"}).returnVoid();
    outer.method("loud", "()V").returnVoid();
    add(index, outer);

    ClassFileBuilder anon("foo/Host$1");
    anon.setEnclosingMethod("foo/Host", "quiet", "()V");
    anon.method("run", "()V").returnVoid();
    add(index, anon);

    ClassFileBuilder other("foo/Host$2");
    other.setEnclosingMethod("foo/Host", "loud", "()V");
    other.method("run", "()V").returnVoid();
    add(index, other);

    EXPECT_TRUE(index.isSuppressed(at("foo/Host$1", "run", "()V"), kNewApiCheckId));
    EXPECT_FALSE(index.isSuppressed(at("foo/Host$2", "run", "()V"), kNewApiCheckId));
}

TEST(Suppression, FallsBackToNameWhenNestingIsUnrecorded)
{
    check::SuppressionIndex index;
    ClassFileBuilder outer("foo/Shell");
    outer.suppress({"NewApi"});
    add(index, outer);

    // Neither InnerClasses nor EnclosingMethod: the '$' in the name is used.
    ClassFileBuilder nested("foo/Shell$Deep$Deeper");
    nested.method("m", "()V").returnVoid();
    add(index, nested);

    EXPECT_TRUE(index.isSuppressed(at("foo/Shell$Deep$Deeper", "m", "()V"), kNewApiCheckId));

    ClassFileBuilder plain("foo/Plain$");
    plain.method("m", "()V").returnVoid();
    add(index, plain);
    EXPECT_FALSE(index.isSuppressed(at("foo/Plain$", "m", "()V"), kNewApiCheckId));
}
