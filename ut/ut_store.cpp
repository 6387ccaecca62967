#include <ut/lib/stack.h>

#include <gtest/gtest.h>

using namespace Stg;

TEST(MemoryStore, Put) {
    auto store = UT::MemoryStore::Make();

    const auto root = UT::MakeCommit(*store, "root\n");
    const auto child = UT::MakeCommit(*store, "child\n", {root});

    EXPECT_EQ(store->Size(), 2u);
    // Same content yields the same commit.
    EXPECT_EQ(UT::MakeCommit(*store, "root\n"), root);
    EXPECT_EQ(store->Size(), 2u);

    const auto commit = store->LookupCommit(child);

    EXPECT_EQ(commit->Id(), child);
    EXPECT_EQ(commit->Message(), "child\n");
    ASSERT_EQ(commit->Parents().size(), 1u);
    EXPECT_EQ(commit->Parents()[0], root);

    // Handles are shared.
    EXPECT_EQ(store->LookupCommit(child).get(), commit.get());

    try {
        store->LookupCommit(HashId::Make(DataType::Blob, "missing"));
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownCommit);
    }
}

TEST(MemoryStore, References) {
    auto store = UT::MemoryStore::Make();

    const auto root = UT::MakeCommit(*store, "root\n");
    const auto child = UT::MakeCommit(*store, "child\n", {root});

    store->SetReference("refs/heads/main", child);
    store->SetReference("refs/tags/v1", root);

    EXPECT_EQ(store->LookupRevision("main")->Id(), child);
    EXPECT_EQ(store->LookupRevision("heads/main")->Id(), child);
    EXPECT_EQ(store->LookupRevision("refs/heads/main")->Id(), child);
    EXPECT_EQ(store->LookupRevision("v1")->Id(), root);
    EXPECT_EQ(store->LookupRevision("main~")->Id(), root);
    EXPECT_EQ(store->LookupRevision("main^1")->Id(), root);
    EXPECT_EQ(store->LookupRevision(child.ToHex())->Id(), child);

    // HEAD requires a current branch.
    EXPECT_THROW(store->LookupRevision("HEAD"), Error);
    store->SetCurrentBranch("main");
    EXPECT_EQ(store->LookupRevision("HEAD")->Id(), child);
    EXPECT_EQ(store->LookupRevision("@~1")->Id(), root);

    EXPECT_THROW(store->LookupRevision("main~2"), Error);
    EXPECT_THROW(store->LookupRevision("other"), Error);
}

TEST(MemoryStore, ApplySuffix) {
    auto store = UT::MemoryStore::Make();

    const auto root = UT::MakeCommit(*store, "root\n");
    const auto child = UT::MakeCommit(*store, "child\n", {root});
    const auto commit = store->LookupCommit(child);

    EXPECT_EQ(store->ApplySuffix(*commit, "^")->Id(), root);
    EXPECT_EQ(store->ApplySuffix(*commit, "~1")->Id(), root);
    EXPECT_EQ(store->ApplySuffix(*commit, "^0")->Id(), child);

    try {
        store->ApplySuffix(*commit, "^2");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownCommit);
    }
}

TEST(MemoryStore, CommitPrefix) {
    auto store = UT::MemoryStore::Make();

    const auto root = UT::MakeCommit(*store, "root\n");
    EXPECT_EQ(store->LookupRevision(root.ToShortHex(7))->Id(), root);
    EXPECT_EQ(store->LookupRevision(root.ToShortHex(4) + "~0")->Id(), root);

    // Generate commits until two of them share an abbreviated id.
    absl::flat_hash_map<std::string, HashId> prefixes;
    std::optional<std::string> shared;

    for (int i = 0; i < 5000 && !shared; ++i) {
        const auto id = UT::MakeCommit(*store, fmt::format("commit {}\n", i));

        if (!prefixes.emplace(id.ToShortHex(4), id).second) {
            shared = id.ToShortHex(4);
        }
    }
    ASSERT_TRUE(shared);

    try {
        store->LookupRevision(*shared);
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::AmbiguousCommitPrefix);
    }
}

TEST(MemoryStore, GetStack) {
    auto store = UT::MemoryStore::Make();

    try {
        store->GetStack(std::nullopt);
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownBranch);
        EXPECT_EQ(std::string(e.what()), "not on a branch");
    }

    const auto main = UT::MakeBranchStack(*store, "main", {"p0", "p1"}, {"p2"});
    store->SetReference("refs/heads/plain", main.stack.Base());

    EXPECT_EQ(store->GetStack("main").Applied(), main.stack.Applied());
    EXPECT_THROW(store->GetStack(std::nullopt), Error);

    store->SetCurrentBranch("main");
    EXPECT_EQ(store->GetStack(std::nullopt).Top(), main.stack.Top());
    EXPECT_EQ(store->GetStack(std::nullopt).Unapplied(), main.stack.Unapplied());

    try {
        store->GetStack("plain");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownBranch);
        EXPECT_EQ(std::string(e.what()), "branch 'plain' is not initialized");
    }

    try {
        store->GetStack("other");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownBranch);
        EXPECT_EQ(std::string(e.what()), "branch 'other' not found");
    }
}
