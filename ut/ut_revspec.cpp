#include <stg/patch/parse.h>
#include <stg/patch/revspec.h>
#include <ut/lib/stack.h>

#include <gtest/gtest.h>

using namespace Stg;

namespace {

class RevisionTest : public ::testing::Test {
protected:
    RevisionTest()
        : store_(UT::MemoryStore::Make())
        , main_(UT::MakeBranchStack(*store_, "main", {"p0", "p1", "p2"}, {"p3"}, {"h0"}))
        , dev_(UT::MakeBranchStack(*store_, "dev", {"d0", "d1"})) {
        store_->SetCurrentBranch("main");
    }

    StGitRevision Resolve(const std::string_view text) const {
        return ResolveRevision(ParseSingleRevisionSpec(text), main_.stack, *store_, *store_);
    }

    StGitBoundaryRevisions ResolveRange(const std::string_view text) const {
        return ResolveRevisions(ParseRevisionSpec(text), main_.stack, *store_, *store_);
    }

    HashId PatchCommit(const UT::BranchStack& branch, const std::string& name) const {
        return branch.stack.PatchCommit(PatchName::Make(name));
    }

protected:
    std::shared_ptr<UT::MemoryStore> store_;
    UT::BranchStack main_;
    UT::BranchStack dev_;
};

} // namespace

TEST_F(RevisionTest, Patch) {
    const auto rev = Resolve("p1");

    ASSERT_TRUE(rev.patchname);
    EXPECT_EQ(*rev.patchname, PatchName::Make("p1"));
    EXPECT_EQ(rev.commit->Id(), PatchCommit(main_, "p1"));

    EXPECT_EQ(*Resolve("@").patchname, PatchName::Make("p2"));
    EXPECT_EQ(*Resolve("^").patchname, PatchName::Make("p3"));
    EXPECT_EQ(*Resolve("p0+3").patchname, PatchName::Make("p3"));
    EXPECT_EQ(*Resolve("h0").patchname, PatchName::Make("h0"));
}

TEST_F(RevisionTest, Base) {
    const auto rev = Resolve("{base}");

    EXPECT_FALSE(rev.patchname);
    EXPECT_EQ(rev.commit->Id(), main_.stack.Base());
    EXPECT_EQ(rev.commit->Id(), main_.history.back());

    EXPECT_FALSE(Resolve("p0~").patchname);
    EXPECT_EQ(Resolve("p0~").commit->Id(), main_.stack.Base());
    EXPECT_EQ(*Resolve("{base}+1").patchname, PatchName::Make("p0"));
}

TEST_F(RevisionTest, BelowBase) {
    EXPECT_EQ(Resolve("{base}~").commit->Id(), main_.history[1]);
    EXPECT_EQ(Resolve("{base}~2").commit->Id(), main_.history[0]);
    EXPECT_EQ(Resolve("@~4").commit->Id(), main_.history[1]);
    EXPECT_EQ(Resolve("p0~~~").commit->Id(), main_.history[0]);
    EXPECT_FALSE(Resolve("p0~3").patchname);

    // Beyond the root of the history.
    EXPECT_THROW(Resolve("{base}~3"), Error);
}

TEST_F(RevisionTest, Suffix) {
    const auto rev = Resolve("p1^");

    EXPECT_FALSE(rev.patchname);
    EXPECT_EQ(rev.commit->Id(), PatchCommit(main_, "p0"));

    EXPECT_EQ(Resolve("@~1^").commit->Id(), PatchCommit(main_, "p0"));
    EXPECT_EQ(Resolve("{base}~^").commit->Id(), main_.history[0]);
    EXPECT_EQ(Resolve("p3^").commit->Id(), main_.stack.Base());
    EXPECT_EQ(Resolve("p2~2").commit->Id(), PatchCommit(main_, "p0"));

    try {
        Resolve("p0^2");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownCommit);
    }
}

TEST_F(RevisionTest, NothingApplied) {
    const auto empty = UT::MakeBranchStack(*store_, "empty", {}, {"u0"});
    const auto rev = ResolveRevision(ParseSingleRevisionSpec("@"), empty.stack, *store_, *store_);

    EXPECT_FALSE(rev.patchname);
    EXPECT_EQ(rev.commit->Id(), empty.history.back());

    EXPECT_EQ(*ResolveRevision(ParseSingleRevisionSpec("+"), empty.stack, *store_, *store_).patchname, PatchName::Make("u0"));
}

TEST_F(RevisionTest, GitFallback) {
    const auto head = Resolve("HEAD");

    EXPECT_FALSE(head.patchname);
    EXPECT_EQ(head.commit->Id(), main_.stack.Top());

    EXPECT_EQ(Resolve("dev").commit->Id(), dev_.stack.Top());
    EXPECT_EQ(Resolve("dev~2").commit->Id(), dev_.stack.Base());
    EXPECT_EQ(Resolve("refs/heads/dev").commit->Id(), dev_.stack.Top());
    EXPECT_EQ(Resolve(main_.history[0].ToHex()).commit->Id(), main_.history[0]);

    // Out of range indices are tried as revisions too.
    store_->SetReference("refs/tags/9", main_.history[1]);
    EXPECT_EQ(Resolve("9").commit->Id(), main_.history[1]);

    try {
        Resolve("nope");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownCommit);
    }
}

TEST_F(RevisionTest, PatchNamePrecedence) {
    store_->SetReference("refs/tags/p1", main_.history[0]);

    const auto rev = Resolve("p1");

    ASSERT_TRUE(rev.patchname);
    EXPECT_EQ(rev.commit->Id(), PatchCommit(main_, "p1"));
}

TEST_F(RevisionTest, Branch) {
    const auto rev = Resolve("dev:d0");

    ASSERT_TRUE(rev.patchname);
    EXPECT_EQ(*rev.patchname, PatchName::Make("d0"));
    EXPECT_EQ(rev.commit->Id(), PatchCommit(dev_, "d0"));

    EXPECT_EQ(Resolve("dev:@").commit->Id(), dev_.stack.Top());
    EXPECT_EQ(Resolve("dev:{base}").commit->Id(), dev_.stack.Base());
    EXPECT_EQ(Resolve("dev:{base}~").commit->Id(), dev_.history[1]);
    EXPECT_EQ(Resolve("main:p1^").commit->Id(), PatchCommit(main_, "p0"));

    // Patches of the current branch are not visible through another branch.
    EXPECT_THROW(Resolve("dev:p1"), Error);

    try {
        Resolve("other:@");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownBranch);
    }
}

TEST_F(RevisionTest, Range) {
    const auto result = ResolveRange("p0..p1");
    const auto* pair = std::get_if<std::pair<StGitRevision, StGitRevision>>(&result);

    ASSERT_TRUE(pair);
    EXPECT_EQ(*pair->first.patchname, PatchName::Make("p0"));
    EXPECT_EQ(*pair->second.patchname, PatchName::Make("p1"));
    EXPECT_EQ(pair->first.commit->Id(), PatchCommit(main_, "p0"));
    EXPECT_EQ(pair->second.commit->Id(), PatchCommit(main_, "p1"));
}

TEST_F(RevisionTest, RangeOpenEnds) {
    {
        const auto result = ResolveRange("..");
        const auto& pair = std::get<std::pair<StGitRevision, StGitRevision>>(result);

        EXPECT_EQ(*pair.first.patchname, PatchName::Make("p0"));
        EXPECT_EQ(*pair.second.patchname, PatchName::Make("p2"));
    }
    {
        const auto result = ResolveRange("p3..");
        const auto& pair = std::get<std::pair<StGitRevision, StGitRevision>>(result);

        EXPECT_EQ(*pair.first.patchname, PatchName::Make("p3"));
        EXPECT_EQ(*pair.second.patchname, PatchName::Make("h0"));
    }
    {
        const auto result = ResolveRange("dev:..");
        const auto& pair = std::get<std::pair<StGitRevision, StGitRevision>>(result);

        EXPECT_EQ(pair.first.commit->Id(), PatchCommit(dev_, "d0"));
        EXPECT_EQ(pair.second.commit->Id(), PatchCommit(dev_, "d1"));
    }
}

TEST_F(RevisionTest, RangeSinglePatch) {
    const auto result = ResolveRange("p1..p1");
    const auto& pair = std::get<std::pair<StGitRevision, StGitRevision>>(result);

    EXPECT_EQ(pair.first.commit.get(), pair.second.commit.get());
    EXPECT_EQ(*pair.first.patchname, *pair.second.patchname);
}

TEST_F(RevisionTest, RangeErrors) {
    const auto empty = UT::MakeBranchStack(*store_, "empty", {});

    try {
        ResolveRevisions(ParseRevisionSpec(".."), empty.stack, *store_, *store_);
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::OutOfRangeIndex);
    }

    try {
        ResolveRange("p2..p0");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::InvertedRange);
    }
}

TEST_F(RevisionTest, NotARange) {
    const auto result = ResolveRange("p1");
    const auto* rev = std::get_if<StGitRevision>(&result);

    ASSERT_TRUE(rev);
    EXPECT_EQ(*rev->patchname, PatchName::Make("p1"));
    EXPECT_EQ(std::get<StGitRevision>(ResolveRange("dev")).commit->Id(), dev_.stack.Top());
}
