// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "divcap/core/config_base.hpp"

using namespace divcap;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "divcap_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path test_dir;
};

// Strict config used to exercise the shared helpers
class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        config::require_exact_keys(j, "test", {"name", "value", "ratio"});
        name = config::get_field<std::string>(j, "test", "name");
        value = config::get_field<int>(j, "test", "value");
        ratio = config::get_field<double>(j, "test", "ratio");
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 1.5;

    std::filesystem::path file_path = test_dir / "test_config.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok());
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded;
    auto load_result = loaded.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->what();
    EXPECT_EQ(loaded.name, "test");
    EXPECT_EQ(loaded.value, 100);
    EXPECT_DOUBLE_EQ(loaded.ratio, 1.5);
}

TEST_F(ConfigBaseTest, MissingFileIsFileNotFound) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, MalformedJsonIsParseError) {
    auto path = test_dir / "broken.json";
    write_file(path, "{ \"name\": \"x\", ");

    TestConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, UnknownKeyRejected) {
    auto path = test_dir / "extra.json";
    write_file(path, R"({"name": "x", "value": 1, "ratio": 0.1, "colour": "red"})");

    TestConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIG);
    EXPECT_NE(std::string(result.error()->what()).find("test.colour"), std::string::npos);
}

TEST_F(ConfigBaseTest, MissingKeyRejected) {
    nlohmann::json j = {{"name", "x"}, {"value", 1}};
    TestConfig config;
    try {
        config.from_json(j);
        FAIL() << "Expected BacktestError";
    } catch (const BacktestError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_CONFIG);
        EXPECT_NE(std::string(e.what()).find("test.ratio"), std::string::npos);
    }
}

TEST_F(ConfigBaseTest, WrongTypeRejected) {
    nlohmann::json j = {{"name", "x"}, {"value", "not a number"}, {"ratio", 0.1}};
    TestConfig config;
    EXPECT_THROW(config.from_json(j), BacktestError);
}

TEST_F(ConfigBaseTest, NonObjectSectionRejected) {
    TestConfig config;
    EXPECT_THROW(config.from_json(nlohmann::json::array({1, 2})), BacktestError);
}
