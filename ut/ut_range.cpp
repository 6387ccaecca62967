#include <stg/patch/parse.h>
#include <ut/lib/stack.h>

#include <gtest/gtest.h>

using namespace Stg;

namespace {

using Names = std::vector<std::string>;

class RangeTest : public ::testing::Test {
protected:
    RangeTest()
        : stack_(UT::MakeSnapshot({"p0", "p1", "p2"}, {"p3", "p4"}, {"h0", "h1"})) {
    }

    Names Resolve(const std::string_view text, const RangeConstraint constraint) const {
        Names result;

        for (const auto& name : ResolveRange(ParseRange(text), stack_, constraint)) {
            result.push_back(name.Str());
        }
        return result;
    }

protected:
    StackSnapshot stack_;
};

} // namespace

TEST_F(RangeTest, Closed) {
    EXPECT_EQ(Resolve("p0..p2", RangeConstraint::All), (Names{"p0", "p1", "p2"}));
    EXPECT_EQ(Resolve("p1..p1", RangeConstraint::All), (Names{"p1"}));
    EXPECT_EQ(Resolve("p2..h0", RangeConstraint::All), (Names{"p2", "p3", "p4", "h0"}));
    EXPECT_EQ(Resolve("{base}+1..@", RangeConstraint::Applied), (Names{"p0", "p1", "p2"}));
}

TEST_F(RangeTest, Single) {
    EXPECT_EQ(Resolve("p1", RangeConstraint::All), (Names{"p1"}));
    EXPECT_EQ(Resolve("@", RangeConstraint::Applied), (Names{"p2"}));
    EXPECT_THROW(Resolve("p3", RangeConstraint::Applied), ConstraintError);
}

TEST_F(RangeTest, OpenEnds) {
    EXPECT_EQ(Resolve("..", RangeConstraint::All), (Names{"p0", "p1", "p2", "p3", "p4", "h0", "h1"}));
    EXPECT_EQ(Resolve("..", RangeConstraint::Visible), (Names{"p0", "p1", "p2", "p3", "p4"}));
    EXPECT_EQ(Resolve("..", RangeConstraint::Applied), (Names{"p0", "p1", "p2"}));
    EXPECT_EQ(Resolve("..", RangeConstraint::Unapplied), (Names{"p3", "p4"}));
    EXPECT_EQ(Resolve("..", RangeConstraint::Hidden), (Names{"h0", "h1"}));
    EXPECT_EQ(Resolve("..p3", RangeConstraint::All), (Names{"p0", "p1", "p2", "p3"}));
    EXPECT_EQ(Resolve("p3..", RangeConstraint::Visible), (Names{"p3", "p4"}));
}

TEST_F(RangeTest, AppliedBoundary) {
    // Open-ended ranges started from an applied patch stop at the top.
    EXPECT_EQ(Resolve("..", RangeConstraint::AllWithAppliedBoundary), (Names{"p0", "p1", "p2"}));
    EXPECT_EQ(Resolve("p1..", RangeConstraint::AllWithAppliedBoundary), (Names{"p1", "p2"}));
    EXPECT_EQ(Resolve("..", RangeConstraint::VisibleWithAppliedBoundary), (Names{"p0", "p1", "p2"}));
    // Otherwise they go up to the last allowed patch.
    EXPECT_EQ(Resolve("p3..", RangeConstraint::AllWithAppliedBoundary), (Names{"p3", "p4", "h0", "h1"}));
    EXPECT_EQ(Resolve("p3..", RangeConstraint::VisibleWithAppliedBoundary), (Names{"p3", "p4"}));
    // Explicit ends are not limited.
    EXPECT_EQ(Resolve("p1..p4", RangeConstraint::VisibleWithAppliedBoundary), (Names{"p1", "p2", "p3", "p4"}));
}

TEST_F(RangeTest, Inverted) {
    try {
        Resolve("p2..p0", RangeConstraint::All);
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::InvertedRange);
        EXPECT_EQ(std::string(e.what()), "patch range 'p2..p0' is inverted: 'p2' is above 'p0'");
    }
}

TEST_F(RangeTest, ConstraintViolation) {
    try {
        Resolve("p1..p3", RangeConstraint::Applied);
        FAIL() << "expected an exception";
    } catch (const ConstraintError& e) {
        EXPECT_EQ(e.Patch(), PatchName::Make("p3"));
        EXPECT_EQ(e.Group(), LocationGroup::Unapplied);
    }

    EXPECT_THROW(Resolve("h0..", RangeConstraint::Visible), ConstraintError);
    EXPECT_THROW(Resolve("p2..", RangeConstraint::Unapplied), ConstraintError);
}

TEST_F(RangeTest, Errors) {
    EXPECT_THROW(Resolve("p1..nope", RangeConstraint::All), Error);
    EXPECT_THROW(Resolve("{base}..p1", RangeConstraint::All), Error);
}

TEST_F(RangeTest, Multiple) {
    const std::vector<PatchRange> ranges = {ParseRange("p0"), ParseRange("p3..p4"), ParseRange("p0")};
    const auto names = ResolveRanges(ranges, stack_, RangeConstraint::Visible);

    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0].Str(), "p0");
    EXPECT_EQ(names[1].Str(), "p3");
    EXPECT_EQ(names[2].Str(), "p4");
    EXPECT_EQ(names[3].Str(), "p0");
}

TEST(Range, EmptyGroups) {
    const auto stack = UT::MakeSnapshot({}, {"u0"});

    EXPECT_TRUE(ResolveRange(ParseRange(".."), stack, RangeConstraint::Applied).empty());
    EXPECT_TRUE(ResolveRange(ParseRange(".."), stack, RangeConstraint::Hidden).empty());
    EXPECT_EQ(ResolveRange(ParseRange(".."), stack, RangeConstraint::AllWithAppliedBoundary).size(), 1u);
    EXPECT_TRUE(ResolveRange(ParseRange(".."), UT::MakeSnapshot({}), RangeConstraint::All).empty());
}
