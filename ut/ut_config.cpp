#include <cmd/local/config.h>
#include <util/file.h>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <filesystem>

using namespace Stg;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
            / fmt::format("stg-config-{}", ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

protected:
    std::filesystem::path dir_;
};

} // namespace

TEST(Config, Get) {
    std::map<ConfigLocation, std::unique_ptr<Config::Backend>> configs;
    // User configuration.
    configs[ConfigLocation::User] =
        Config::MakeBackend(nlohmann::json::object({{"user", {{"email", "John@mail.com"}}}}));
    // Default configuration.
    configs[ConfigLocation::Default] =
        Config::MakeBackend(nlohmann::json::object({{"user", {{"name", "John"}}}}));

    Config config(std::move(configs));

    ASSERT_TRUE(config.Get("user.name"));
    ASSERT_TRUE(config.Get("user.email"));

    EXPECT_EQ(config.Get("user.name")->get<std::string>(), "John");
    EXPECT_EQ(config.Get("user.email")->get<std::string>(), "John@mail.com");

    EXPECT_FALSE(config.Get("user.name", ConfigLocation::User));
    EXPECT_FALSE(config.Get("user.name", ConfigLocation::Repository));
    EXPECT_FALSE(config.Get("user.phone"));
}

TEST(Config, Precedence) {
    Config config;

    config.Reset(ConfigLocation::Default, Config::MakeBackend(DefaultConfig()));
    EXPECT_EQ(config.GetOr<int>("core.abbrev", 0), 7);
    EXPECT_EQ(config.GetOr<std::string>("color.ui", ""), "auto");

    config.Reset(ConfigLocation::User, Config::MakeBackend(nlohmann::json::object({{"core", {{"abbrev", 10}}}})));
    EXPECT_EQ(config.GetOr<int>("core.abbrev", 0), 10);

    config.Reset(
        ConfigLocation::Repository, Config::MakeBackend(nlohmann::json::object({{"core", {{"abbrev", 12}}}}))
    );
    EXPECT_EQ(config.GetOr<int>("core.abbrev", 0), 12);
    EXPECT_EQ(config.Get("core.abbrev", ConfigLocation::User)->get<int>(), 10);

    // Fallback for unknown keys.
    EXPECT_EQ(config.GetOr<int>("core.unknown", 42), 42);
    // Values of another type are not converted.
    EXPECT_THROW(config.GetOr<std::string>("core.abbrev", ""), nlohmann::json::exception);
}

TEST_F(ConfigFileTest, File) {
    const auto path = dir_ / "config.json";

    StringToFile(path, R"({"color": {"ui": "never"}, "core": {"abbrev": 9}})");

    Config config;
    config.Reset(ConfigLocation::User, Config::MakeBackend(path));

    EXPECT_EQ(config.GetOr<std::string>("color.ui", "auto"), "never");
    EXPECT_EQ(config.GetOr<int>("core.abbrev", 7), 9);
}

TEST_F(ConfigFileTest, MissingFile) {
    Config config;
    config.Reset(ConfigLocation::User, Config::MakeBackend(dir_ / "missing.json"));

    EXPECT_FALSE(config.Get("core.abbrev"));
}

TEST_F(ConfigFileTest, InvalidFile) {
    const auto path = dir_ / "config.json";

    StringToFile(path, "{ not a json");

    EXPECT_THROW(Config::MakeBackend(path), std::runtime_error);
}
