#include <stg/git/repository.h>
#include <stg/patch/error.h>
#include <stg/patch/parse.h>
#include <stg/patch/revspec.h>

#include <gtest/gtest.h>
#include <git2.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>

using namespace Stg;

namespace {

void Check(int error_code) {
    if (error_code < 0) {
        const git_error* error = git_error_last();
        FAIL() << error_code << " " << ((error && error->message) ? error->message : "???");
    }
}

HashId ToHashId(const git_oid& oid) {
    return HashId::FromBytes(oid.id);
}

/**
 * Creates a repository with the stack
 *
 *   c0 - c1 - p0 - p1   (main)
 *          \
 *           p2
 *
 * where p0 and p1 are applied and p2 is unapplied.
 */
class GitRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::git_libgit2_init();

        dir_ = std::filesystem::temp_directory_path()
            / fmt::format("stg-git-{}", ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        ASSERT_NO_FATAL_FAILURE(Check(::git_repository_init(&repo_, dir_.c_str(), 0)));
        ASSERT_NO_FATAL_FAILURE(Check(::git_signature_new(&sig_, "John", "john@example.com", 1700000000, 0)));

        ASSERT_NO_FATAL_FAILURE(empty_tree_ = WriteTree({}));

        ASSERT_NO_FATAL_FAILURE(c0_ = MakeCommit("c0\n", empty_tree_, {}));
        ASSERT_NO_FATAL_FAILURE(c1_ = MakeCommit("c1\n", empty_tree_, {c0_}));
        ASSERT_NO_FATAL_FAILURE(p0_ = MakeCommit("p0 title\n\nbody\n", empty_tree_, {c1_}));
        ASSERT_NO_FATAL_FAILURE(p1_ = MakeCommit("p1 title\n", empty_tree_, {p0_}));
        ASSERT_NO_FATAL_FAILURE(p2_ = MakeCommit("p2 title\n", empty_tree_, {c1_}));

        ASSERT_NO_FATAL_FAILURE(SetReference("refs/heads/main", p1_));
        ASSERT_NO_FATAL_FAILURE(SetReference("refs/heads/plain", c1_));
        ASSERT_NO_FATAL_FAILURE(Check(::git_repository_set_head(repo_, "refs/heads/main")));

        ASSERT_NO_FATAL_FAILURE(WriteStack(
            "main",
            nlohmann::json{
                {"version", 5},
                {"prev", nullptr},
                {"head", ToHashId(p1_).ToHex()},
                {"applied", nlohmann::json::array({"p0", "p1"})},
                {"unapplied", nlohmann::json::array({"p2"})},
                {"hidden", nlohmann::json::array()},
                {"patches",
                 {
                     {"p0", {{"oid", ToHashId(p0_).ToHex()}}},
                     {"p1", {{"oid", ToHashId(p1_).ToHex()}}},
                     {"p2", {{"oid", ToHashId(p2_).ToHex()}}},
                 }},
            }
        ));
    }

    void TearDown() override {
        ::git_signature_free(sig_);
        ::git_repository_free(repo_);
        ::git_libgit2_shutdown();

        std::filesystem::remove_all(dir_);
    }

    git_oid WriteTree(const std::vector<std::pair<std::string, git_oid>>& blobs) {
        git_treebuilder* builder = nullptr;
        git_oid oid{};

        Check(::git_treebuilder_new(&builder, repo_, nullptr));
        for (const auto& [name, blob] : blobs) {
            Check(::git_treebuilder_insert(nullptr, builder, name.c_str(), &blob, GIT_FILEMODE_BLOB));
        }
        Check(::git_treebuilder_write(&oid, builder));
        ::git_treebuilder_free(builder);
        return oid;
    }

    git_oid MakeCommit(const std::string& message, const git_oid& tree_id, const std::vector<git_oid>& parents) {
        git_tree* tree = nullptr;
        std::vector<git_commit*> commits;
        git_oid oid{};

        Check(::git_tree_lookup(&tree, repo_, &tree_id));
        for (const auto& parent : parents) {
            git_commit* c = nullptr;
            Check(::git_commit_lookup(&c, repo_, &parent));
            commits.push_back(c);
        }

        // Stacks in the test have linear history only.
        if (commits.empty()) {
            Check(::git_commit_create_v(&oid, repo_, nullptr, sig_, sig_, nullptr, message.c_str(), tree, 0));
        } else {
            Check(::git_commit_create_v(
                &oid, repo_, nullptr, sig_, sig_, nullptr, message.c_str(), tree, 1, commits.front()
            ));
        }

        for (auto* c : commits) {
            ::git_commit_free(c);
        }
        ::git_tree_free(tree);
        return oid;
    }

    void SetReference(const std::string& name, const git_oid& oid) {
        git_reference* ref = nullptr;

        Check(::git_reference_create(&ref, repo_, name.c_str(), &oid, 1, "test"));
        ::git_reference_free(ref);
    }

    void WriteStack(const std::string& branch, const nlohmann::json& metadata) {
        const auto content = metadata.dump();
        git_oid blob{};

        Check(::git_blob_create_from_buffer(&blob, repo_, content.data(), content.size()));

        const auto tree = WriteTree({{"stack.json", blob}});
        const auto commit = MakeCommit("stack metadata\n", tree, {});

        SetReference("refs/stacks/" + branch, commit);
    }

protected:
    std::filesystem::path dir_;
    git_repository* repo_{nullptr};
    git_signature* sig_{nullptr};
    git_oid empty_tree_{};
    git_oid c0_{};
    git_oid c1_{};
    git_oid p0_{};
    git_oid p1_{};
    git_oid p2_{};
};

} // namespace

TEST_F(GitRepositoryTest, CurrentBranch) {
    Git::Repository repo(dir_);

    EXPECT_EQ(repo.CurrentBranch(), "main");
    EXPECT_TRUE(std::filesystem::equivalent(repo.GitDir(), dir_ / ".git"));
}

TEST_F(GitRepositoryTest, GetStack) {
    Git::Repository repo(dir_);

    const auto stack = repo.GetStack(std::nullopt);

    ASSERT_EQ(stack.Applied().size(), 2u);
    EXPECT_EQ(stack.Applied()[0].Str(), "p0");
    EXPECT_EQ(stack.Applied()[1].Str(), "p1");
    ASSERT_EQ(stack.Unapplied().size(), 1u);
    EXPECT_EQ(stack.Unapplied()[0].Str(), "p2");
    EXPECT_TRUE(stack.Hidden().empty());

    EXPECT_EQ(stack.Base(), ToHashId(c1_));
    EXPECT_EQ(stack.Top(), ToHashId(p1_));
    EXPECT_EQ(stack.PatchCommit(PatchName::Make("p2")), ToHashId(p2_));

    EXPECT_EQ(repo.GetStack("main").Top(), stack.Top());
}

TEST_F(GitRepositoryTest, GetStackErrors) {
    Git::Repository repo(dir_);

    try {
        repo.GetStack("plain");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownBranch);
        EXPECT_EQ(std::string(e.what()), "branch 'plain' is not initialized");
    }

    try {
        repo.GetStack("other");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownBranch);
        EXPECT_EQ(std::string(e.what()), "branch 'other' not found");
    }
}

TEST_F(GitRepositoryTest, UnsupportedVersion) {
    ASSERT_NO_FATAL_FAILURE(WriteStack(
        "plain",
        nlohmann::json{
            {"version", 4},
            {"head", ToHashId(c1_).ToHex()},
            {"applied", nlohmann::json::array()},
            {"unapplied", nlohmann::json::array()},
            {"hidden", nlohmann::json::array()},
            {"patches", nlohmann::json::object()},
        }
    ));

    Git::Repository repo(dir_);

    EXPECT_THROW(repo.GetStack("plain"), std::runtime_error);
}

TEST_F(GitRepositoryTest, NothingApplied) {
    ASSERT_NO_FATAL_FAILURE(WriteStack(
        "plain",
        nlohmann::json{
            {"version", 5},
            {"prev", nullptr},
            {"head", ToHashId(c1_).ToHex()},
            {"applied", nlohmann::json::array()},
            {"unapplied", nlohmann::json::array({"p2"})},
            {"hidden", nlohmann::json::array()},
            {"patches", {{"p2", {{"oid", ToHashId(p2_).ToHex()}}}}},
        }
    ));

    Git::Repository repo(dir_);
    const auto stack = repo.GetStack("plain");

    EXPECT_TRUE(stack.Applied().empty());
    EXPECT_EQ(stack.Base(), ToHashId(c1_));
    EXPECT_EQ(stack.Top(), ToHashId(c1_));
}

TEST_F(GitRepositoryTest, LookupCommit) {
    Git::Repository repo(dir_);

    const auto commit = repo.LookupCommit(ToHashId(p0_));

    EXPECT_EQ(commit->Id(), ToHashId(p0_));
    EXPECT_EQ(commit->Message(), "p0 title\n\nbody\n");
    EXPECT_EQ(commit->Author().name, "John");
    EXPECT_EQ(commit->Author().when, 1700000000);
    EXPECT_EQ(commit->Tree(), HashId::Make(DataType::Tree, ""));
    ASSERT_EQ(commit->Parents().size(), 1u);
    EXPECT_EQ(commit->Parents()[0], ToHashId(c1_));

    try {
        repo.LookupCommit(HashId::Make(DataType::Blob, "missing"));
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownCommit);
    }
}

TEST_F(GitRepositoryTest, LookupRevision) {
    Git::Repository repo(dir_);

    EXPECT_EQ(repo.LookupRevision("main")->Id(), ToHashId(p1_));
    EXPECT_EQ(repo.LookupRevision("HEAD^")->Id(), ToHashId(p0_));
    EXPECT_EQ(repo.LookupRevision("main~3")->Id(), ToHashId(c0_));
    EXPECT_EQ(repo.LookupRevision(ToHashId(p2_).ToShortHex(10))->Id(), ToHashId(p2_));

    try {
        repo.LookupRevision("nope");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::UnknownCommit);
    }
}

TEST_F(GitRepositoryTest, ApplySuffix) {
    Git::Repository repo(dir_);

    const auto top = repo.LookupCommit(ToHashId(p1_));

    EXPECT_EQ(repo.ApplySuffix(*top, "~1")->Id(), ToHashId(p0_));
    EXPECT_EQ(repo.ApplySuffix(*top, "^^")->Id(), ToHashId(c1_));
    EXPECT_THROW(repo.ApplySuffix(*top, "^2"), Error);
}

TEST_F(GitRepositoryTest, ResolveRevision) {
    Git::Repository repo(dir_);

    const auto stack = repo.GetStack(std::nullopt);
    const auto resolve = [&](const std::string_view text) {
        return ResolveRevision(ParseSingleRevisionSpec(text), stack, repo, repo);
    };

    EXPECT_EQ(resolve("p0").commit->Id(), ToHashId(p0_));
    EXPECT_EQ(*resolve("@").patchname, PatchName::Make("p1"));
    EXPECT_EQ(resolve("{base}").commit->Id(), ToHashId(c1_));
    EXPECT_EQ(resolve("{base}~").commit->Id(), ToHashId(c0_));
    EXPECT_EQ(resolve("p1^").commit->Id(), ToHashId(p0_));
    EXPECT_EQ(resolve("p2^").commit->Id(), ToHashId(c1_));
    // Not a patch, so resolved by git.
    EXPECT_EQ(resolve("main~1").commit->Id(), ToHashId(p0_));
    EXPECT_FALSE(resolve("main~1").patchname);
    EXPECT_EQ(resolve("main:p2").commit->Id(), ToHashId(p2_));
}
