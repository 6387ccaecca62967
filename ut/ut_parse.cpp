#include <stg/patch/parse.h>

#include <gtest/gtest.h>

using namespace Stg;

namespace {

PatchLocator NameLocator(const std::string_view name, const std::string_view offsets = "") {
    return PatchLocator(PatchId(PatchName::Make(name)), PatchOffsets::Parse(offsets));
}

ErrorKind LocatorErrorKind(const std::string_view text) {
    try {
        ParseLocator(text);
    } catch (const Error& e) {
        return e.Kind();
    }
    ADD_FAILURE() << "no error for '" << text << "'";
    return ErrorKind::MalformedSyntax;
}

} // namespace

TEST(ParseLocator, Name) {
    EXPECT_EQ(ParseLocator("p0"), NameLocator("p0"));
    EXPECT_EQ(ParseLocator("p0~2+1"), NameLocator("p0", "~2+1"));
    // Trailing `+` chains stay a part of the name until resolution.
    EXPECT_EQ(ParseLocator("p+1"), NameLocator("p+1"));
    // Digits and hex strings are names syntactically.
    EXPECT_EQ(ParseLocator("3"), NameLocator("3"));
    EXPECT_EQ(ParseLocator("deadbeef~"), NameLocator("deadbeef", "~"));
}

TEST(ParseLocator, Symbolic) {
    EXPECT_EQ(ParseLocator("@"), PatchLocator(PatchId(PatchId::Top{})));
    EXPECT_EQ(ParseLocator("@~2"), PatchLocator(PatchId(PatchId::Top{}), PatchOffsets::Parse("~2")));
    EXPECT_EQ(ParseLocator("{base}+1"), PatchLocator(PatchId(PatchId::Base{}), PatchOffsets::Parse("+1")));
    EXPECT_EQ(ParseLocator("{base}"), PatchLocator(PatchId(PatchId::Base{})));
}

TEST(ParseLocator, SymbolicPrefixOfName) {
    // `@` and `{base}` followed by other characters are names.
    EXPECT_EQ(ParseLocator("@foo"), NameLocator("@foo"));
    EXPECT_EQ(ParseLocator("{base}x"), NameLocator("{base}x"));
}

TEST(ParseLocator, BelowLast) {
    EXPECT_EQ(ParseLocator("^"), PatchLocator(PatchId(PatchId::BelowLast{})));
    EXPECT_EQ(ParseLocator("^2"), PatchLocator(PatchId(PatchId::BelowLast{2})));
    EXPECT_EQ(ParseLocator("^-1"), PatchLocator(PatchId(PatchId::BelowLast{-1})));
    EXPECT_EQ(ParseLocator("^0+1"), PatchLocator(PatchId(PatchId::BelowLast{0}), PatchOffsets::Parse("+1")));

    EXPECT_EQ(LocatorErrorKind("^-"), ErrorKind::MalformedSyntax);
    EXPECT_EQ(LocatorErrorKind("^-x"), ErrorKind::MalformedSyntax);
}

TEST(ParseLocator, OffsetOnly) {
    EXPECT_EQ(ParseLocator("~"), PatchLocator(PatchId(PatchId::BelowTop{}), PatchOffsets::Parse("~")));
    EXPECT_EQ(ParseLocator("+3"), PatchLocator(PatchId(PatchId::BelowTop{}), PatchOffsets::Parse("+3")));
}

TEST(ParseLocator, Errors) {
    EXPECT_EQ(LocatorErrorKind(""), ErrorKind::MalformedSyntax);
    EXPECT_EQ(LocatorErrorKind("p0^"), ErrorKind::MalformedSyntax);
    EXPECT_EQ(LocatorErrorKind("@~x"), ErrorKind::MalformedSyntax);
    EXPECT_EQ(LocatorErrorKind("a/b"), ErrorKind::InvalidPatchName);
    EXPECT_EQ(LocatorErrorKind("@{1}"), ErrorKind::InvalidPatchName);
}

TEST(ParseLocator, ToString) {
    for (const auto& text : {"p0", "@", "@~2", "{base}+1", "^", "^3", "^-1", "~", "+2~", "p0~~3+"}) {
        EXPECT_EQ(ParseLocator(text).ToString(), text);
    }
}

TEST(ParseRange, Single) {
    const auto range = ParseRange("p1~");

    ASSERT_TRUE(range.Single());
    EXPECT_EQ(*range.Single(), NameLocator("p1", "~"));
}

TEST(ParseRange, Bounds) {
    EXPECT_EQ(ParseRange("p0..p2"), PatchRange(PatchRangeBounds{NameLocator("p0"), NameLocator("p2")}));
    EXPECT_EQ(ParseRange("..p2"), PatchRange(PatchRangeBounds{std::nullopt, NameLocator("p2")}));
    EXPECT_EQ(ParseRange("p0.."), PatchRange(PatchRangeBounds{NameLocator("p0"), std::nullopt}));
    EXPECT_EQ(ParseRange(".."), PatchRange(PatchRangeBounds{}));
    EXPECT_EQ(ParseRange("{base}+1..@").ToString(), "{base}+1..@");
}

TEST(ParseRange, Errors) {
    EXPECT_THROW(ParseRange("p0..p1..p2"), Error);
    EXPECT_THROW(ParseRange("p0...p1"), Error);
    EXPECT_THROW(ParseRange("a/b..p1"), Error);
}

TEST(ParsePatchLikeSpec, Suffix) {
    const auto spec = ParsePatchLikeSpec("{base}~^2");

    EXPECT_EQ(spec.patch_loc, PatchLocator(PatchId(PatchId::Base{}), PatchOffsets::Parse("~")));
    EXPECT_EQ(spec.suffix.text, "^2");
    EXPECT_EQ(spec.ToString(), "{base}~^2");

    EXPECT_EQ(ParsePatchLikeSpec("p1@{1}").suffix.text, "@{1}");
    EXPECT_EQ(ParsePatchLikeSpec("@~2^").suffix.text, "^");
    EXPECT_TRUE(ParsePatchLikeSpec("p1+2").suffix.Empty());
}

TEST(ParseSingleRevisionSpec, Kinds) {
    {
        const auto spec = ParseSingleRevisionSpec("main:p1~");
        const auto* branch = std::get_if<SingleRevisionSpec::Branch>(&spec.Get());

        ASSERT_TRUE(branch);
        EXPECT_EQ(branch->branch, "main");
        EXPECT_EQ(branch->patch_like.patch_loc, NameLocator("p1", "~"));
    }
    {
        const auto spec = ParseSingleRevisionSpec("HEAD~3");
        const auto* both = std::get_if<SingleRevisionSpec::PatchAndGitLike>(&spec.Get());

        ASSERT_TRUE(both);
        EXPECT_EQ(both->revision, "HEAD~3");
        EXPECT_EQ(both->patch_like.patch_loc, NameLocator("HEAD", "~3"));
    }
    {
        const auto spec = ParseSingleRevisionSpec("@~1^");
        const auto* patch = std::get_if<SingleRevisionSpec::PatchLike>(&spec.Get());

        ASSERT_TRUE(patch);
        EXPECT_EQ(patch->patch_like.suffix.text, "^");
    }

    EXPECT_TRUE(std::holds_alternative<SingleRevisionSpec::PatchLike>(ParseSingleRevisionSpec("~").Get()));
    EXPECT_TRUE(std::holds_alternative<SingleRevisionSpec::PatchLike>(ParseSingleRevisionSpec("^-1").Get()));
}

TEST(ParseSingleRevisionSpec, GitLike) {
    for (const auto& text : {"origin/main", "HEAD:path/to", "@{1}", ":p1", "a b:p1"}) {
        const auto spec = ParseSingleRevisionSpec(text);
        const auto* git = std::get_if<SingleRevisionSpec::GitLike>(&spec.Get());

        ASSERT_TRUE(git) << text;
        EXPECT_EQ(git->revision, text);
        EXPECT_EQ(spec.ToString(), text);
    }
}

TEST(ParseSingleRevisionSpec, Empty) {
    try {
        ParseSingleRevisionSpec("");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::MalformedSyntax);
    }
}

TEST(ParseRevisionSpec, Ranges) {
    {
        const auto spec = ParseRevisionSpec("p0..p2");
        const auto* bounds = std::get_if<PatchRangeBounds>(&spec.Get());

        ASSERT_TRUE(bounds);
        EXPECT_EQ(*bounds, (PatchRangeBounds{NameLocator("p0"), NameLocator("p2")}));
    }
    {
        const auto spec = ParseRevisionSpec("feature/x:..p2");
        const auto* range = std::get_if<RangeRevisionSpec::BranchRange>(&spec.Get());

        ASSERT_TRUE(range);
        EXPECT_EQ(range->branch, "feature/x");
        EXPECT_EQ(range->bounds, (PatchRangeBounds{std::nullopt, NameLocator("p2")}));
        EXPECT_EQ(spec.ToString(), "feature/x:..p2");
    }
    {
        const auto spec = ParseRevisionSpec("main:p1");
        const auto* single = std::get_if<SingleRevisionSpec>(&spec.Get());

        ASSERT_TRUE(single);
        EXPECT_TRUE(std::holds_alternative<SingleRevisionSpec::Branch>(single->Get()));
    }
}

TEST(ParseRevisionSpec, Errors) {
    try {
        ParseRevisionSpec("a b:p0..p1");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::MalformedSyntax);
    }
    try {
        ParseRevisionSpec("p0..x:y");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::InvalidPatchName);
    }
}
