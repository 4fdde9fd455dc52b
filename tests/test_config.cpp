#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include <string>

TEST(Config, EmptyObjectKeepsDefaults){
    AppCfg c = parse_cfg("{}");
    EXPECT_EQ(c.policy.min_length, 8u);
    EXPECT_TRUE(c.policy.require_special);
    EXPECT_EQ(c.format_version, kDefaultFormat);
    EXPECT_TRUE(c.minify);
    EXPECT_EQ(c.wrapper_title, "Protected document");
}

TEST(Config, ReadsEveryKey){
    AppCfg c = parse_cfg(R"({
        "min_password_length": 12,
        "require_lowercase": false,
        "require_uppercase": false,
        "require_digit": false,
        "require_special": true,
        "special_characters": "#~",
        "format_version": 1,
        "minify": false,
        "wrapper_title": "Board minutes",
        "unknown_key": [1, 2, 3]
    })");
    EXPECT_EQ(c.policy.min_length, 12u);
    EXPECT_FALSE(c.policy.require_lowercase);
    EXPECT_FALSE(c.policy.require_uppercase);
    EXPECT_FALSE(c.policy.require_digit);
    EXPECT_EQ(c.policy.special_characters, "#~");
    EXPECT_EQ(c.format_version, FormatVersion::V1);
    EXPECT_FALSE(c.minify);
    EXPECT_EQ(c.wrapper_title, "Board minutes");
}

TEST(Config, RejectsBadDocuments){
    EXPECT_THROW(parse_cfg("{not json"), UsageError);
    EXPECT_THROW(parse_cfg("[1, 2]"), UsageError);
    EXPECT_THROW(parse_cfg(R"({"minify": "yes"})"), UsageError);
    EXPECT_THROW(parse_cfg(R"({"min_password_length": -1})"), UsageError);
    EXPECT_THROW(parse_cfg(R"({"format_version": 7})"), UsageError);
    EXPECT_THROW(parse_cfg(R"({"special_characters": ""})"), UsageError);
    EXPECT_NO_THROW(parse_cfg(R"({"special_characters": "", "require_special": false})"));
}

TEST(Config, MissingFileIsIoError){
    EXPECT_THROW(load_cfg("/nonexistent/pagelock.json"), IoError);
}

TEST(Config, ShippedExampleLoads){
    AppCfg c = load_cfg(std::string(PAGELOCK_TEST_DATA_DIR) + "/../../config/pagelock.example.json");
    EXPECT_EQ(c.policy.min_length, 12u);
    EXPECT_EQ(c.format_version, FormatVersion::V2);
}
