#include <util/split.h>

#include <gtest/gtest.h>

#include <string>

TEST(Utils, SplitPath) {
    const auto check_abc = []<typename T>(const std::vector<T>& parts) {
        ASSERT_EQ(parts.size(), 3u);
        EXPECT_EQ(parts[0], "a");
        EXPECT_EQ(parts[1], "b");
        EXPECT_EQ(parts[2], "c");
    };

    check_abc(SplitPath("a/b/c"));
    check_abc(SplitPath("/a/b/c"));
    check_abc(SplitPath("/a//b/c/"));
    check_abc(SplitPath("a.b.c", '.'));
    check_abc(SplitString<std::string>("/a//b/c/", '/'));
}

TEST(Utils, SplitOnce) {
    {
        const auto parts = SplitOnce("p0..p1", "..");
        ASSERT_TRUE(parts);
        EXPECT_EQ(parts->first, "p0");
        EXPECT_EQ(parts->second, "p1");
    }
    {
        const auto parts = SplitOnce("..", "..");
        ASSERT_TRUE(parts);
        EXPECT_TRUE(parts->first.empty());
        EXPECT_TRUE(parts->second.empty());
    }
    {
        // Only the first separator splits.
        const auto parts = SplitOnce("dev:a:b", ":");
        ASSERT_TRUE(parts);
        EXPECT_EQ(parts->first, "dev");
        EXPECT_EQ(parts->second, "a:b");
    }

    EXPECT_FALSE(SplitOnce("p0", ".."));
    EXPECT_FALSE(SplitOnce("", ":"));
}
