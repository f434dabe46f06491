#include <gtest/gtest.h>
#include "veil/config/json_config.hpp"
#include "veil/engine/masking_engine.hpp"
#include "utils/test_utils.hpp"
#include <stdexcept>

class JsonConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestUtils::cleanupConfigFiles();
    }

    void TearDown() override {
        TestUtils::cleanupConfigFiles();
    }
};

TEST_F(JsonConfigTest, EmptyObjectKeepsDefaults) {
    veil::EngineConfig config = veil::parseConfig("{}");
    EXPECT_TRUE(config.enabled);
    EXPECT_EQ(config.maskChar, '*');
    EXPECT_EQ(config.defaultMask, "***");
    EXPECT_TRUE(config.autoDetect);
    EXPECT_EQ(config.autoDetectCategories.size(), 5u);
    EXPECT_DOUBLE_EQ(config.alreadyMaskedRatio, veil::kDefaultAlreadyMaskedRatio);
    EXPECT_TRUE(config.fields.empty());
}

TEST_F(JsonConfigTest, ReadsEveryKey) {
    veil::EngineConfig config = veil::parseConfig(R"json({
        "enabled": false,
        "maskChar": "#",
        "defaultMask": "[hidden]",
        "autoDetect": false,
        "autoDetectTypes": ["email", "ipAddress", "EMAIL"],
        "alreadyMaskedRatio": 0.75,
        "sensitiveFields": [
            {"name": "cpf", "dataType": "cpf"},
            {"name": "telefone", "visibleCharsStart": 2, "visibleCharsEnd": 3},
            {"name": "Token", "caseSensitive": true, "customPattern": "tk-([0-9]+)", "formatterName": "upper"}
        ]
    })json");

    EXPECT_FALSE(config.enabled);
    EXPECT_EQ(config.maskChar, '#');
    EXPECT_EQ(config.defaultMask, "[hidden]");
    EXPECT_FALSE(config.autoDetect);
    ASSERT_EQ(config.autoDetectCategories.size(), 2u);
    EXPECT_EQ(config.autoDetectCategories[0], veil::DataCategory::EMAIL);
    EXPECT_EQ(config.autoDetectCategories[1], veil::DataCategory::IP_ADDRESS);
    EXPECT_DOUBLE_EQ(config.alreadyMaskedRatio, 0.75);

    ASSERT_EQ(config.fields.size(), 3u);
    EXPECT_EQ(config.fields[0].category, veil::DataCategory::CPF);
    EXPECT_EQ(config.fields[1].visibleStart, 2u);
    EXPECT_EQ(config.fields[1].visibleEnd, 3u);
    EXPECT_TRUE(config.fields[2].caseSensitive);
    EXPECT_EQ(config.fields[2].customPattern, "tk-([0-9]+)");
    EXPECT_EQ(config.fields[2].formatterOverrideName, "upper");
}

TEST_F(JsonConfigTest, UnknownKeysAreIgnored) {
    veil::EngineConfig config = veil::parseConfig(R"({"comment": "x", "enabled": true})");
    EXPECT_TRUE(config.enabled);
}

TEST_F(JsonConfigTest, RejectsWrongTypes) {
    EXPECT_THROW(veil::parseConfig(R"({"enabled": "yes"})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"maskChar": "##"})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"maskChar": 42})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"autoDetectTypes": "cpf"})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"autoDetectTypes": [1]})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"sensitiveFields": {}})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"([1, 2])"), std::invalid_argument);
}

TEST_F(JsonConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(veil::parseConfig(R"({"alreadyMaskedRatio": 2})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"alreadyMaskedRatio": -0.1})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"sensitiveFields": [{"name": "a", "visibleCharsStart": -1}]})"),
                 std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"sensitiveFields": [{"name": "a", "visibleCharsEnd": 1.5}]})"),
                 std::invalid_argument);
}

TEST_F(JsonConfigTest, RejectsBadFieldEntries) {
    EXPECT_THROW(veil::parseConfig(R"({"sensitiveFields": [42]})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"sensitiveFields": [{"dataType": "cpf"}]})"), std::invalid_argument);
    EXPECT_THROW(veil::parseConfig(R"({"sensitiveFields": [{"name": "a", "dataType": "passport"}]})"),
                 std::invalid_argument);
}

TEST_F(JsonConfigTest, SyntaxErrorIsInvalidArgument) {
    EXPECT_THROW(veil::parseConfig("{\"enabled\": "), std::invalid_argument);
}

TEST_F(JsonConfigTest, ConfigFromJsonValue) {
    nlohmann::json doc;
    doc["defaultMask"] = "<x>";
    nlohmann::json field;
    field["name"] = "senha";
    doc["sensitiveFields"] = nlohmann::json::array();
    doc["sensitiveFields"].push_back(field);

    veil::EngineConfig config = veil::configFromJson(doc);
    EXPECT_EQ(config.defaultMask, "<x>");
    ASSERT_EQ(config.fields.size(), 1u);
    EXPECT_EQ(config.fields[0].name, "senha");
}

TEST_F(JsonConfigTest, LoadsFileAndDrivesEngine) {
    TestUtils::writeFile("veil_test_config.json", R"({
        "autoDetect": false,
        "sensitiveFields": [{"name": "senha"}, {"name": "conta", "visibleCharsStart": 1, "visibleCharsEnd": 1}]
    })");

    veil::MaskingEngine engine;
    engine.configure(veil::loadConfigFile("veil_test_config.json"));
    EXPECT_EQ(engine.sanitize("senha=abc conta=12345"), "senha=*** conta=1***5");
}

TEST_F(JsonConfigTest, MissingFileIsRuntimeError) {
    EXPECT_THROW(veil::loadConfigFile("veil_no_such_config.json"), std::runtime_error);
}

TEST_F(JsonConfigTest, MalformedFileIsInvalidArgument) {
    TestUtils::writeFile("veil_bad_config.json", "{ not json");
    EXPECT_THROW(veil::loadConfigFile("veil_bad_config.json"), std::invalid_argument);
}
