#include <stg/common/revparse.h>
#include <ut/lib/stack.h>

#include <gtest/gtest.h>

#include <unordered_map>

using namespace Stg;

namespace {

/// https://git-scm.com/docs/git-rev-parse.html#_specifying_revisions
class RevparseTest
    : public ::testing::Test
    , protected ReferenceResolver {
public:
    RevparseTest()
        : store_(UT::MemoryStore::Make()) {
    }

    void SetUp() override {
        const auto make = [&](const char label, const std::vector<char>& parents = {}) {
            std::vector<HashId> ids;
            for (const char p : parents) {
                ids.push_back(labels_.at(p));
            }
            labels_[label] = UT::MakeCommit(*store_, fmt::format("{}\n", label), ids);
        };

        make('G');
        make('H');
        make('I');
        make('J');
        make('E');

        make('D', {'G', 'H'});
        make('F', {'I', 'J'});
        make('B', {'D', 'E', 'F'});
        make('C', {'F'});
        make('A', {'B', 'C'});
    }

protected:
    std::optional<HashId> DoGetNthAncestor(const HashId& id, uint64_t count) const final {
        HashId result = id;

        for (; count > 0; --count) {
            const auto commit = store_->LookupCommit(result);
            if (commit->Parents().empty()) {
                return std::nullopt;
            }
            result = commit->Parents().front();
        }
        return result;
    }

    std::optional<HashId> DoGetNthParent(const HashId& id, const uint64_t n) const final {
        if (n == 0) {
            return id;
        }
        if (const auto c = store_->LookupCommit(id); c->Parents().size() >= n) {
            return c->Parents()[n - 1];
        } else {
            return {};
        }
    }

    std::optional<HashId> DoLookup(const std::string_view name) const final {
        if (name.empty()) {
            return {};
        }
        if (HashId::IsHex(name)) {
            return HashId::FromHex(name);
        }
        if (name == "HEAD") {
            return labels_.at('A');
        }
        if (auto li = labels_.find(name[0]); name.size() == 1 && li != labels_.end()) {
            return li->second;
        } else {
            return {};
        }
    }

protected:
    std::shared_ptr<UT::MemoryStore> store_;
    std::unordered_map<char, HashId> labels_;
};

TEST_F(RevparseTest, Head) {
    ASSERT_TRUE(Resolve("@"));
    ASSERT_TRUE(Resolve("@~"));
    ASSERT_TRUE(Resolve("HEAD"));
    ASSERT_TRUE(Resolve("HEAD~"));
    // @ alone is a shortcut for HEAD.
    EXPECT_EQ(Resolve("@"), Resolve("HEAD"));
    EXPECT_EQ(Resolve("@~"), Resolve("HEAD~"));
}

TEST_F(RevparseTest, Invalid) {
    // No third parent.
    EXPECT_FALSE(Resolve("A^3"));
    // No parents at all.
    EXPECT_FALSE(Resolve("G~1"));
    // Invalid pathspec.
    EXPECT_FALSE(Resolve("A~1x"));
    // Unknown name.
    EXPECT_FALSE(Resolve("X"));
    EXPECT_FALSE(Resolve("X~1"));
    // Too large counter.
    EXPECT_FALSE(Resolve("A~99999999999999999999999"));
    // Reflog and path selectors.
    EXPECT_FALSE(Resolve("A@{1}"));
    EXPECT_FALSE(Resolve("A:README"));
    EXPECT_FALSE(Resolve(""));
}

TEST_F(RevparseTest, Single) {
    const std::vector<std::vector<std::string>> cases = {
        {"A", "A^0", "A~0"},
        {"B", "A^", "A^1", "A~1"},
        {"C", "A^2"},
        {"D", "A^^", "A^1^1", "A~2"},
        {"E", "B^2", "A^^2"},
        {"F", "B^3", "A^^3"},
        {"G", "A^^^", "A^1^1^1", "A~3", "A~~~", "D^"},
        {"H", "D^2", "B^^2", "A^^^2", "A~2^2"},
        {"I", "F^", "B^3^", "A^^3^"},
        {"J", "F^2", "B^3^2", "A^^3^2"},
    };

    for (const auto& expressions : cases) {
        // Ensure all expressions are resolving to a valid value.
        for (const auto& e : expressions) {
            ASSERT_TRUE(Resolve(e)) << e;
        }
        // Compare result of expressions.
        for (size_t i = 1; i < expressions.size(); ++i) {
            EXPECT_EQ(Resolve(expressions[i - 1]), Resolve(expressions[i])) << expressions[i];
        }
        // Compare with actual hash.
        EXPECT_EQ(Resolve(expressions[0]), labels_.at(expressions[0][0]));
    }
}

TEST_F(RevparseTest, Suffix) {
    const auto a = labels_.at('A');

    EXPECT_EQ(Resolve(a, ""), a);
    EXPECT_EQ(Resolve(a, "^2"), labels_.at('C'));
    EXPECT_EQ(Resolve(a, "~2^2"), labels_.at('H'));
    EXPECT_EQ(Resolve(a, "^^3^2"), labels_.at('J'));

    EXPECT_FALSE(Resolve(a, "^3"));
    EXPECT_FALSE(Resolve(a, "~1x"));
    EXPECT_FALSE(Resolve(a, "@{1}"));
}

TEST_F(RevparseTest, FullId) {
    const auto f = labels_.at('F');

    EXPECT_EQ(Resolve(f.ToHex()), f);
    EXPECT_EQ(Resolve(f.ToHex() + "^2"), labels_.at('J'));
}

} // namespace
