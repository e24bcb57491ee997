#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "tax_ngin/core/config_loader.hpp"

using namespace tax_ngin;
using namespace tax_ngin::testing;

class ConfigLoaderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "tax_ngin_config_loader_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        TestBase::TearDown();
    }

    std::filesystem::path write_config(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigLoaderTest, MissingFileUsesDefaults) {
    auto result = ConfigLoader::load(test_dir / "absent.json");
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();

    const ReplayConfig& config = result.value();
    EXPECT_EQ(config.initial_capital, Decimal::from_int(2000000));
    EXPECT_EQ(config.max_stocks, 20);
    EXPECT_EQ(config.short_term_tax_rate, Decimal::from_string("0.20").value());
    EXPECT_EQ(config.long_term_tax_rate, Decimal::from_string("0.10").value());
    EXPECT_EQ(config.position_limit_policy, PositionLimitPolicy::WARN);
    EXPECT_EQ(config.output_dir, "output");
}

TEST_F(ConfigLoaderTest, FileOverridesDefaults) {
    auto path = write_config("config.json", R"({
        "initial_capital": "500000.50",
        "max_stocks": 5,
        "short_term_tax_rate": 0.15,
        "position_limit_policy": "CAP",
        "logging": {"filename_prefix": "custom"}
    })");

    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();

    const ReplayConfig& config = result.value();
    EXPECT_EQ(config.initial_capital, Decimal::from_string("500000.50").value());
    EXPECT_EQ(config.max_stocks, 5);
    EXPECT_EQ(config.short_term_tax_rate, Decimal::from_string("0.15").value());
    EXPECT_EQ(config.long_term_tax_rate, Decimal::from_string("0.10").value());
    EXPECT_EQ(config.position_limit_policy, PositionLimitPolicy::CAP);
    EXPECT_EQ(config.logging.filename_prefix, "custom");
    // Untouched nested logging keys keep their defaults
    EXPECT_EQ(config.logging.max_files, LoggerConfig().max_files);
}

TEST_F(ConfigLoaderTest, NumericCapitalIsAccepted) {
    auto path = write_config("numeric.json", R"({"initial_capital": 1000000})");
    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().initial_capital, Decimal::from_int(1000000));
}

TEST_F(ConfigLoaderTest, MalformedJsonIsParseError) {
    auto path = write_config("broken.json", "{ \"max_stocks\": ");
    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigLoaderTest, NonObjectIsParseError) {
    auto path = write_config("array.json", "[1, 2, 3]");
    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigLoaderTest, UnknownPolicyRejected) {
    auto path = write_config("policy.json", R"({"position_limit_policy": "IGNORE"})");
    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigLoaderTest, WrongTypeIsInvalidData) {
    auto path = write_config("types.json", R"({"max_stocks": "many"})");
    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConfigLoaderTest, ValidationFailures) {
    for (const char* content :
         {R"({"initial_capital": 0})", R"({"max_stocks": 0})",
          R"({"short_term_tax_rate": 1.0})", R"({"long_term_tax_rate": -0.1})",
          R"({"output_dir": ""})", R"({"initial_capital": "lots"})",
          R"({"short_term_tax_rate": "0.1234"})", R"({"long_term_tax_rate": "0.00005"})"}) {
        auto path = write_config("invalid.json", content);
        auto result = ConfigLoader::load(path);
        ASSERT_TRUE(result.is_error()) << content;
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA) << content;
    }
}

TEST_F(ConfigLoaderTest, PolicyStrings) {
    EXPECT_EQ(position_limit_policy_to_string(PositionLimitPolicy::ABORT), "ABORT");
    EXPECT_EQ(position_limit_policy_from_string("WARN").value(), PositionLimitPolicy::WARN);
    EXPECT_TRUE(position_limit_policy_from_string("warn").is_error());
}

TEST_F(ConfigLoaderTest, RateWithThreeDecimalsIsAccepted) {
    auto path = write_config("rates.json", R"({"short_term_tax_rate": "0.125"})");
    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    EXPECT_EQ(result.value().short_term_tax_rate, Decimal::from_string("0.125").value());
}
