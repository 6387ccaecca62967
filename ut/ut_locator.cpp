#include <stg/patch/parse.h>
#include <ut/lib/stack.h>

#include <gtest/gtest.h>

using namespace Stg;

namespace {

class LocatorTest : public ::testing::Test {
protected:
    LocatorTest()
        : stack_(UT::MakeSnapshot({"p0", "p1", "p2"}, {"p3", "p4"}, {"h0", "h1"})) {
    }

    std::string Resolve(
        const std::string_view text, const LocationConstraint constraint = LocationConstraint::All
    ) const {
        return ResolveLocator(ParseLocator(text), stack_, constraint).Str();
    }

    StackPosition Position(const std::string_view text, const bool allow_below_stack = false) const {
        return ResolvePosition(ParseLocator(text), stack_, allow_below_stack);
    }

    std::optional<ErrorKind> ErrorOf(const std::string_view text) const {
        try {
            Resolve(text);
        } catch (const Error& e) {
            return e.Kind();
        }
        return std::nullopt;
    }

protected:
    StackSnapshot stack_;
};

} // namespace

TEST_F(LocatorTest, Names) {
    EXPECT_EQ(Resolve("p0"), "p0");
    EXPECT_EQ(Resolve("p3"), "p3");
    EXPECT_EQ(Resolve("h1"), "h1");
    EXPECT_EQ(Resolve("p1+2"), "p3");
    EXPECT_EQ(Resolve("p3~~"), "p1");
    EXPECT_EQ(Resolve("p0~0"), "p0");

    EXPECT_EQ(ErrorOf("nope"), ErrorKind::UnknownPatch);
}

TEST_F(LocatorTest, Top) {
    EXPECT_EQ(Resolve("@"), "p2");
    EXPECT_EQ(Resolve("@~"), "p1");
    EXPECT_EQ(Resolve("@+1"), "p3");
    // Offset-only locators are relative to the top.
    EXPECT_EQ(Resolve("~"), "p1");
    EXPECT_EQ(Resolve("~2"), "p0");
    EXPECT_EQ(Resolve("+"), "p3");
    EXPECT_EQ(Resolve("+4"), "h1");

    EXPECT_EQ(ErrorOf("+5"), ErrorKind::OutOfRangeIndex);
}

TEST_F(LocatorTest, Base) {
    EXPECT_EQ(Resolve("{base}+1"), "p0");
    EXPECT_EQ(Resolve("{base}+3"), "p2");
    // Offsets from the base are summed before landing.
    EXPECT_EQ(Resolve("{base}~1+2"), "p0");
    EXPECT_EQ(Resolve("{base}+2~1"), "p0");
    EXPECT_EQ(Resolve("{base}~~+4"), "p1");
    EXPECT_EQ(Resolve("p0~1+1"), "p0");

    EXPECT_EQ(ErrorOf("{base}"), ErrorKind::InvalidOffset);
    EXPECT_EQ(ErrorOf("{base}~1+1"), ErrorKind::InvalidOffset);
    EXPECT_EQ(ErrorOf("{base}+9"), ErrorKind::OutOfRangeIndex);
    EXPECT_EQ(ErrorOf("{base}~"), ErrorKind::InvalidOffset);
    EXPECT_EQ(ErrorOf("{base}+1~"), ErrorKind::InvalidOffset);
    EXPECT_EQ(ErrorOf("p0~"), ErrorKind::InvalidOffset);
    EXPECT_EQ(ErrorOf("p0~2"), ErrorKind::OutOfRangeIndex);
}

TEST_F(LocatorTest, BelowLast) {
    EXPECT_EQ(Resolve("^"), "p4");
    EXPECT_EQ(Resolve("^0"), "p4");
    EXPECT_EQ(Resolve("^1"), "p3");
    EXPECT_EQ(Resolve("^4"), "p0");
    EXPECT_EQ(Resolve("^-1"), "h0");
    EXPECT_EQ(Resolve("^-2"), "h1");
    EXPECT_EQ(Resolve("^~"), "p3");

    EXPECT_EQ(ErrorOf("^5"), ErrorKind::OutOfRangeIndex);
    EXPECT_EQ(ErrorOf("^-3"), ErrorKind::OutOfRangeIndex);
}

TEST_F(LocatorTest, AbsoluteIndex) {
    EXPECT_EQ(Resolve("0"), "p0");
    EXPECT_EQ(Resolve("4"), "p4");
    EXPECT_EQ(Resolve("6"), "h1");
    EXPECT_EQ(Resolve("1+1"), "p2");

    EXPECT_EQ(ErrorOf("7"), ErrorKind::OutOfRangeIndex);
    EXPECT_EQ(ErrorOf("12"), ErrorKind::OutOfRangeIndex);
}

TEST_F(LocatorTest, CommitPrefix) {
    const auto hex = stack_.PatchCommit(PatchName::Make("p1")).ToHex();

    EXPECT_EQ(Resolve(hex.substr(0, 7)), "p1");
    EXPECT_EQ(Resolve(hex), "p1");
    EXPECT_EQ(Resolve(hex.substr(0, 7) + "~"), "p0");
    // Too short for a prefix.
    EXPECT_EQ(ErrorOf("abc"), ErrorKind::UnknownPatch);
}

TEST_F(LocatorTest, Constraints) {
    EXPECT_EQ(Resolve("p1", LocationConstraint::Applied), "p1");
    EXPECT_EQ(Resolve("p3", LocationConstraint::Visible), "p3");
    EXPECT_EQ(Resolve("h0", LocationConstraint::Hidden), "h0");

    try {
        Resolve("@+1", LocationConstraint::Applied);
        FAIL() << "expected an exception";
    } catch (const ConstraintError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::ConstraintViolation);
        EXPECT_EQ(e.Patch(), PatchName::Make("p3"));
        EXPECT_EQ(e.Group(), LocationGroup::Unapplied);
        EXPECT_EQ(e.Allowed(), std::vector<LocationGroup>{LocationGroup::Applied});
        EXPECT_EQ(std::string(e.what()), "patch 'p3' is unapplied, expected applied");
    }

    try {
        Resolve("h1", LocationConstraint::Visible);
        FAIL() << "expected an exception";
    } catch (const ConstraintError& e) {
        EXPECT_EQ(std::string(e.what()), "patch 'h1' is hidden, expected applied or unapplied");
    }

    try {
        Resolve("h0", LocationConstraint::Applied);
        FAIL() << "expected an exception";
    } catch (const ConstraintError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::ConstraintViolation);
        EXPECT_EQ(e.Patch(), PatchName::Make("h0"));
        EXPECT_EQ(e.Group(), LocationGroup::Hidden);
        EXPECT_EQ(e.Allowed(), std::vector<LocationGroup>{LocationGroup::Applied});
    }
}

TEST_F(LocatorTest, BelowStack) {
    EXPECT_EQ(Position("{base}", true), BASE_POSITION);
    EXPECT_EQ(Position("p0~", true), BASE_POSITION);
    EXPECT_EQ(Position("{base}~2", true), -3);
    EXPECT_EQ(Position("@~5", true), -3);
    EXPECT_EQ(Position("p1", true), 1);
}

TEST_F(LocatorTest, HugeOffset) {
    EXPECT_EQ(ErrorOf("@+4294967296"), ErrorKind::OutOfRangeIndex);
    EXPECT_EQ(ErrorOf("@~4294967296"), ErrorKind::OutOfRangeIndex);
}

TEST(Locator, NamePrecedence) {
    // Digits matching a patch name are never an index.
    const auto stack = UT::MakeSnapshot({"1", "a"});

    EXPECT_EQ(ResolveLocator(ParseLocator("1"), stack, LocationConstraint::All).Str(), "1");
    EXPECT_EQ(ResolveLocator(ParseLocator("0"), stack, LocationConstraint::All).Str(), "1");
}

TEST(Locator, NameWithPlus) {
    {
        const auto stack = UT::MakeSnapshot({"p", "p+1", "q"});
        EXPECT_EQ(ResolveLocator(ParseLocator("p+1"), stack, LocationConstraint::All).Str(), "p+1");
    }
    {
        const auto stack = UT::MakeSnapshot({"p", "q", "r"});
        EXPECT_EQ(ResolveLocator(ParseLocator("p+1"), stack, LocationConstraint::All).Str(), "q");
        EXPECT_EQ(ResolveLocator(ParseLocator("p+1+1"), stack, LocationConstraint::All).Str(), "r");
        EXPECT_EQ(ResolveLocator(ParseLocator("p+"), stack, LocationConstraint::All).Str(), "q");
    }
}

TEST(Locator, AmbiguousCommitPrefix) {
    StackSnapshot::Patches patches;

    patches.applied = {PatchName::Make("x"), PatchName::Make("y")};
    patches.commits.emplace(PatchName::Make("x"), HashId::FromHex("abcd100000000000000000000000000000000000"));
    patches.commits.emplace(PatchName::Make("y"), HashId::FromHex("abcd200000000000000000000000000000000000"));

    const StackSnapshot stack(std::move(patches), HashId(), HashId::FromHex("abcd200000000000000000000000000000000000"));

    EXPECT_EQ(ResolveLocator(ParseLocator("abcd1"), stack, LocationConstraint::All).Str(), "x");
    EXPECT_EQ(ResolveLocator(ParseLocator("ABCD2"), stack, LocationConstraint::All).Str(), "y");

    try {
        ResolveLocator(ParseLocator("abcd"), stack, LocationConstraint::All);
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::AmbiguousCommitPrefix);
    }
}

TEST(Locator, NothingApplied) {
    const auto stack = UT::MakeSnapshot({}, {"u0", "u1"});

    EXPECT_EQ(ResolvePosition(ParseLocator("@"), stack, true), BASE_POSITION);
    EXPECT_EQ(ResolveLocator(ParseLocator("+"), stack, LocationConstraint::All).Str(), "u0");
    EXPECT_EQ(ResolveLocator(ParseLocator("^"), stack, LocationConstraint::All).Str(), "u1");
    EXPECT_THROW(ResolveLocator(ParseLocator("@"), stack, LocationConstraint::All), Error);

    try {
        ResolveLocator(ParseLocator("@~1"), stack, LocationConstraint::All);
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::OutOfRangeIndex);
    }
}

TEST(Locator, Programmatic) {
    const auto stack = UT::MakeSnapshot({"p0", "p1"}, {"p2"});

    EXPECT_EQ(ResolvePosition(PatchLocator(PatchId(PatchId::BelowTop{2})), stack, false), 2);
    EXPECT_THROW(ResolvePosition(PatchLocator(PatchId(PatchId::BelowTop{3})), stack, false), Error);
}
