#include <stg/object/commit.h>

#include <gtest/gtest.h>

using namespace Stg;

static CommitBuilder MakeCommitBuilder() {
    CommitBuilder commit;
    commit.author.name = "John";
    commit.author.email = "john@example.com";
    commit.author.when = 1;
    commit.tree = HashId::Make(DataType::Tree, "");
    commit.message = "test\n";
    return commit;
}

TEST(ObjectCommit, Serialize) {
    const auto commit = MakeCommitBuilder();

    EXPECT_EQ(
        commit.Serialize(),
        "tree 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n"
        "author John <john@example.com> 1 +0000\n"
        "committer John <john@example.com> 1 +0000\n"
        "\n"
        "test\n"
    );
}

TEST(ObjectCommit, Make) {
    const auto c = Commit::Make(MakeCommitBuilder());

    EXPECT_EQ(c.Id().ToHex(), "10dac94ab54d4af294a926bf7b93a3bbbb2b8764");
    EXPECT_EQ(c.Tree(), HashId::Make(DataType::Tree, ""));
    EXPECT_EQ(c.Author().name, "John");
    EXPECT_EQ(c.Committer().name, "");
    EXPECT_EQ(c.Message(), "test\n");
    EXPECT_TRUE(c.Parents().empty());
}

TEST(ObjectCommit, Parents) {
    auto commit = MakeCommitBuilder();
    const auto root = Commit::Make(commit);

    commit.parents.push_back(root.Id());
    commit.parents.push_back(HashId());

    const auto c = Commit::Make(commit);

    ASSERT_EQ(c.Parents().size(), 2u);
    EXPECT_EQ(c.Parents()[0], root.Id());
    EXPECT_EQ(c.Parents()[1], HashId());
    EXPECT_NE(c.Id(), root.Id());
    EXPECT_NE(commit.Serialize().find(fmt::format("parent {}\n", root.Id())), std::string::npos);
}

TEST(ObjectCommit, MessageTitle) {
    EXPECT_EQ(MessageTitle("first line\n\nbody"), "first line");
    EXPECT_EQ(MessageTitle("single"), "single");
    EXPECT_EQ(MessageTitle(""), "");
}

TEST(ObjectCommit, MessageLines) {
    const auto lines = MessageLines("  title  \n\n   body line\nlast\t\n\n");

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "title");
    EXPECT_EQ(lines[1], "body line");
    EXPECT_EQ(lines[2], "last");

    EXPECT_TRUE(MessageLines("").empty());
    EXPECT_TRUE(MessageLines(" \n \n").empty());
}
