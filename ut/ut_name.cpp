#include <stg/patch/error.h>
#include <stg/patch/name.h>

#include <gtest/gtest.h>

using namespace Stg;

TEST(PatchName, Valid) {
    for (const auto& name : {"p0", "fix-crash", "a.b", "x+1", "1234", "deadbeef", "p@x", "{base}x", "über"}) {
        EXPECT_TRUE(PatchName::IsValid(name)) << name;
        EXPECT_EQ(PatchName::Make(name).Str(), name);
    }
}

TEST(PatchName, Invalid) {
    for (const auto& name : {"", "a/b", "@", "{base}", ".hidden", "end.", "a..b", "name.lock", "x@{1}", "a b",
                             "a~b", "a^b", "a:b", "a?b", "a*b", "a[b", "a\\b", "tab\t"}) {
        EXPECT_FALSE(PatchName::IsValid(name)) << name;
        EXPECT_FALSE(PatchName::TryMake(name));
    }
}

TEST(PatchName, MakeThrows) {
    try {
        PatchName::Make("a/b");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::InvalidPatchName);
        EXPECT_EQ(std::string(e.what()), "invalid patch name 'a/b': must not contain '/'");
    }
}

TEST(PatchName, ControlCharacters) {
    EXPECT_FALSE(PatchName::IsValid(std::string_view("a\0b", 3)));
    EXPECT_FALSE(PatchName::IsValid("a\x7f"));
}

TEST(PatchName, Compare) {
    EXPECT_EQ(PatchName::Make("p1"), PatchName::Make("p1"));
    EXPECT_LT(PatchName::Make("p1"), PatchName::Make("p2"));
    EXPECT_EQ(fmt::format("{}", PatchName::Make("p1")), "p1");
}

TEST(BranchName, Valid) {
    EXPECT_TRUE(IsValidBranchName("main"));
    EXPECT_TRUE(IsValidBranchName("feature/fix-1"));

    EXPECT_FALSE(IsValidBranchName(""));
    EXPECT_FALSE(IsValidBranchName("/main"));
    EXPECT_FALSE(IsValidBranchName("main/"));
    EXPECT_FALSE(IsValidBranchName("a//b"));
    EXPECT_FALSE(IsValidBranchName("a/.b"));
    EXPECT_FALSE(IsValidBranchName("a b"));
    EXPECT_FALSE(IsValidBranchName("a..b"));
}
