/**
 * @file config_test.cpp
 * @brief Dotted-key configuration lookup
 */

#include <gtest/gtest.h>
#include <tallybook/core/config.hpp>

using namespace tallybook;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(config_.load_string(R"({
            "log_level": "debug",
            "ledger": {
                "db_path": "/tmp/ledger.db",
                "horizon_months": 6,
                "strict": true
            }
        })"));
    }

    Config config_;
};

TEST_F(ConfigTest, GetString_NestedKey) {
    EXPECT_EQ(config_.get_string("ledger.db_path"), "/tmp/ledger.db");
    EXPECT_EQ(config_.get_string("log_level", "info"), "debug");
}

TEST_F(ConfigTest, GetInt_NestedKey) {
    EXPECT_EQ(config_.get_int("ledger.horizon_months", 12), 6);
}

TEST_F(ConfigTest, GetBool_NestedKey) {
    EXPECT_TRUE(config_.get_bool("ledger.strict", false));
}

TEST_F(ConfigTest, MissingKey_ReturnsDefault) {
    EXPECT_EQ(config_.get_string("ledger.nope", "fallback"), "fallback");
    EXPECT_EQ(config_.get_int("nope.deeper", 12), 12);
    EXPECT_FALSE(config_.has("ledger.nope"));
    EXPECT_TRUE(config_.has("ledger.db_path"));
}

TEST_F(ConfigTest, WrongType_ReturnsDefault) {
    EXPECT_EQ(config_.get_int("ledger.db_path", 3), 3);
    EXPECT_EQ(config_.get_string("ledger", "x"), "x");
}

TEST_F(ConfigTest, ScalarsReadAsStrings) {
    EXPECT_EQ(config_.get_string("ledger.horizon_months"), "6");
    EXPECT_EQ(config_.get_string("ledger.strict"), "true");
}

TEST_F(ConfigTest, Set_CreatesIntermediateObjects) {
    config_.set_string("ledger.db_path", ":memory:");
    config_.set_string("extra.depth.value", "7");
    EXPECT_EQ(config_.get_string("ledger.db_path"), ":memory:");
    EXPECT_EQ(config_.get_int("extra.depth.value"), 7);
}

TEST(ConfigParseTest, InvalidJson_Rejected) {
    Config config;
    EXPECT_FALSE(config.load_string("{ not json"));
    EXPECT_FALSE(config.last_error().empty());
}

TEST(ConfigParseTest, NonObjectTopLevel_Rejected) {
    Config config;
    EXPECT_FALSE(config.load_string("[1, 2, 3]"));
}

TEST(ConfigParseTest, MissingFile_Rejected) {
    Config config;
    EXPECT_FALSE(config.load_file("/nonexistent/tallybook/config.json"));
}
