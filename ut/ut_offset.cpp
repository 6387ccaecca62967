#include <stg/patch/error.h>
#include <stg/patch/offset.h>

#include <gtest/gtest.h>

using namespace Stg;

namespace {

int64_t Delta(const PatchOffsets& offsets) {
    int64_t value = 0;

    for (const auto& atom : offsets.Atoms()) {
        const auto n = int64_t(atom.Magnitude());
        value += atom.kind == PatchOffsetAtom::Kind::Plus ? n : -n;
    }
    return value;
}

} // namespace

TEST(PatchOffsets, Parse) {
    const auto offsets = PatchOffsets::Parse("~~2+3+");
    const auto atoms = offsets.Atoms();

    ASSERT_EQ(atoms.size(), 4u);
    EXPECT_EQ(atoms[0], (PatchOffsetAtom{PatchOffsetAtom::Kind::Tilde, std::nullopt}));
    EXPECT_EQ(atoms[1], (PatchOffsetAtom{PatchOffsetAtom::Kind::Tilde, 2}));
    EXPECT_EQ(atoms[2], (PatchOffsetAtom{PatchOffsetAtom::Kind::Plus, 3}));
    EXPECT_EQ(atoms[3], (PatchOffsetAtom{PatchOffsetAtom::Kind::Plus, std::nullopt}));

    EXPECT_EQ(Delta(offsets), 1);
    // Spelling is kept.
    EXPECT_EQ(offsets.Str(), "~~2+3+");
}

TEST(PatchOffsets, Empty) {
    const auto offsets = PatchOffsets::Parse("");

    EXPECT_TRUE(offsets.Empty());
    EXPECT_TRUE(offsets.Atoms().empty());
    EXPECT_EQ(offsets, PatchOffsets());
}

TEST(PatchOffsets, ExplicitZero) {
    const auto atoms = PatchOffsets::Parse("~0+0").Atoms();

    ASSERT_EQ(atoms.size(), 2u);
    EXPECT_EQ(atoms[0].Magnitude(), 0u);
    EXPECT_EQ(atoms[1].Magnitude(), 0u);
    // `~0` differs from `~` in spelling.
    EXPECT_NE(PatchOffsets::Parse("~0"), PatchOffsets::Parse("~"));
}

TEST(PatchOffsets, Malformed) {
    for (const auto& text : {"x", "~x", "+-1", "~1a", "^1", " ~"}) {
        try {
            PatchOffsets::Parse(text);
            ADD_FAILURE() << "expected an exception for '" << text << "'";
        } catch (const Error& e) {
            EXPECT_EQ(e.Kind(), ErrorKind::MalformedSyntax) << text;
        }
    }
}

TEST(PatchOffsets, TooLarge) {
    try {
        PatchOffsets::Parse("~99999999999999999999999");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::MalformedSyntax);
    }
}

TEST(PatchOffsets, Recognize) {
    EXPECT_EQ(PatchOffsets::Recognize(""), 0u);
    EXPECT_EQ(PatchOffsets::Recognize("~2+1^2"), 4u);
    EXPECT_EQ(PatchOffsets::Recognize("+@{1}"), 1u);
    EXPECT_EQ(PatchOffsets::Recognize("abc"), 0u);
}

TEST(PatchOffsets, Append) {
    const auto offsets = PatchOffsets::Parse("~2").Append(PatchOffsets::Parse("+1"));

    EXPECT_EQ(offsets.Str(), "~2+1");
    EXPECT_EQ(offsets.Atoms().size(), 2u);
}

TEST(PatchOffsets, ReparseFromString) {
    for (const auto& text : {"", "~", "+", "~~2+3+", "~0+0", "+12~3"}) {
        const auto offsets = PatchOffsets::Parse(text);
        const auto reparsed = PatchOffsets::Parse(offsets.Str());

        EXPECT_EQ(reparsed.Atoms(), offsets.Atoms()) << text;
        EXPECT_EQ(reparsed, offsets) << text;
    }
}
