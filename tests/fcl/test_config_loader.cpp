#include <gtest/gtest.h>
#include <fcl/config_loader.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace fcl;
namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            ("fcl_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        config_path_ = test_dir_ / "conf" / "config.json";
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    void write_config(const std::string& text) {
        fs::create_directories(config_path_.parent_path());
        std::ofstream out(config_path_);
        out << text;
    }

    fs::path test_dir_;
    fs::path config_path_;
};

TEST_F(ConfigLoaderTest, DefaultsCoverBuiltInCategories) {
    Config config = default_config(test_dir_);

    ASSERT_EQ(config.type_rules.size(), 6u);
    EXPECT_EQ(config.type_rules[0].type, "images");
    EXPECT_EQ(config.size_buckets.back().label, "huge");
    EXPECT_FALSE(config.size_buckets.back().upper_bound.has_value());
    EXPECT_EQ(config.journal_path, test_dir_ / "db" / "actions.journal");
    EXPECT_EQ(config.default_sort_criteria, "type");
    EXPECT_EQ(config.max_undo_history, 0u);
}

TEST_F(ConfigLoaderTest, MissingFileIsCreatedFromDefaults) {
    auto config = ConfigLoader::load(config_path_);
    ASSERT_TRUE(config.ok()) << config.error().to_string();
    ASSERT_TRUE(fs::exists(config_path_));

    std::ifstream in(config_path_);
    auto j = nlohmann::json::parse(in);
    EXPECT_TRUE(j.contains("sort_criteria"));
    EXPECT_EQ(j["max_undo_history"].get<size_t>(), 0u);
}

TEST_F(ConfigLoaderTest, FileKeysOverrideDefaults) {
    write_config(R"({
        "max_undo_history": 7,
        "confirm_actions": false,
        "log_level": "DEBUG",
        "data_directory": ")" + (test_dir_ / "data").string() + R"("
    })");

    auto config = ConfigLoader::load(config_path_);
    ASSERT_TRUE(config.ok()) << config.error().to_string();
    EXPECT_EQ(config.value().max_undo_history, 7u);
    EXPECT_FALSE(config.value().confirm_actions);
    EXPECT_EQ(config.value().log_level, LogLevel::DEBUG);
    EXPECT_EQ(config.value().journal_path, test_dir_ / "data" / "db" / "actions.journal");

    // Untouched keys keep defaults
    EXPECT_TRUE(config.value().use_colors);
    EXPECT_EQ(config.value().type_rules.size(), 6u);
}

TEST_F(ConfigLoaderTest, SizeCriteriaWithNullBound) {
    write_config(R"({"sort_criteria": {"size": {"little": 100, "big": null}}})");

    auto config = ConfigLoader::load(config_path_);
    ASSERT_TRUE(config.ok());
    ASSERT_EQ(config.value().size_buckets.size(), 2u);
    EXPECT_EQ(config.value().size_buckets[0].label, "little");
    EXPECT_EQ(*config.value().size_buckets[0].upper_bound, 100u);
    EXPECT_FALSE(config.value().size_buckets[1].upper_bound.has_value());
}

TEST_F(ConfigLoaderTest, MalformedJsonIsInvalidArgument) {
    write_config("{ not json");
    auto config = ConfigLoader::load(config_path_);
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigLoaderTest, WrongValueTypeIsInvalidArgument) {
    write_config(R"({"max_undo_history": "lots"})");
    auto config = ConfigLoader::load(config_path_);
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigLoaderTest, NegativeHistoryLimitIsInvalidArgument) {
    write_config(R"({"max_undo_history": -1})");
    auto config = ConfigLoader::load(config_path_);
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error_code(), ErrorCode::INVALID_ARGUMENT);

    auto set = ConfigLoader::set_value(test_dir_ / "other.json", "max_undo_history", "-3");
    ASSERT_FALSE(set.ok());
    EXPECT_EQ(set.error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigLoaderTest, UnknownSortCriterionRejected) {
    write_config(R"({"default_sort_criteria": "colour"})");
    auto config = ConfigLoader::load(config_path_);
    EXPECT_FALSE(config.ok());
}

TEST_F(ConfigLoaderTest, SetThenGet) {
    ASSERT_TRUE(ConfigLoader::set_value(config_path_, "max_undo_history", "12").ok());
    ASSERT_TRUE(ConfigLoader::set_value(config_path_, "default_sort_criteria", "size").ok());

    auto history = ConfigLoader::get_value(config_path_, "max_undo_history");
    ASSERT_TRUE(history.ok());
    EXPECT_EQ(history.value(), "12");

    auto criterion = ConfigLoader::get_value(config_path_, "default_sort_criteria");
    ASSERT_TRUE(criterion.ok());
    EXPECT_EQ(criterion.value(), "\"size\"");
}

TEST_F(ConfigLoaderTest, UnknownKeyIsNotFound) {
    auto got = ConfigLoader::get_value(config_path_, "no_such_key");
    ASSERT_FALSE(got.ok());
    EXPECT_EQ(got.error_code(), ErrorCode::NOT_FOUND);

    auto set = ConfigLoader::set_value(config_path_, "no_such_key", "1");
    ASSERT_FALSE(set.ok());
    EXPECT_EQ(set.error_code(), ErrorCode::NOT_FOUND);
}

TEST_F(ConfigLoaderTest, ListValuesInFileOrder) {
    auto values = ConfigLoader::list_values(config_path_);
    ASSERT_TRUE(values.ok());
    ASSERT_FALSE(values.value().empty());
    EXPECT_EQ(values.value().front().first, "sort_criteria");
    EXPECT_EQ(values.value().back().first, "max_undo_history");
}
