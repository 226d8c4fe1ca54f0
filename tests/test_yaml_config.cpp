#include <gtest/gtest.h>
#include "utils/yaml_config.hpp"
#include <string>

using namespace aerobuild;

TEST(YamlConfigTest, ParsesNumbersAndText) {
    auto doc = parseYamlConfig("name: F4Phantom\nmass: 17642.0\nc_D_alpha_q: -11.98\nixx: 33898\n");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["name"].get<std::string>(), "F4Phantom");
    EXPECT_TRUE((*doc)["mass"].is_number());
    EXPECT_DOUBLE_EQ((*doc)["mass"].get<double>(), 17642.0);
    EXPECT_DOUBLE_EQ((*doc)["c_D_alpha_q"].get<double>(), -11.98);
    EXPECT_DOUBLE_EQ((*doc)["ixx"].get<double>(), 33898.0);
}

TEST(YamlConfigTest, AcceptsDocumentMarkersAndComments) {
    const std::string text =
        "%YAML 1.2\n"
        "---\n"
        "# header comment\n"
        "\n"
        "ixz: 2952.0  # trailing comment\n"
        "mac: 4.889\n"
        "...\n";
    auto doc = parseYamlConfig(text);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->size(), 2u);
    EXPECT_DOUBLE_EQ((*doc)["ixz"].get<double>(), 2952.0);
    EXPECT_DOUBLE_EQ((*doc)["mac"].get<double>(), 4.889);
}

TEST(YamlConfigTest, AcceptsFlowMappingAndCrlf) {
    auto flow = parseYamlConfig("{wing_area: 49.239, wing_span: 11.787}");
    ASSERT_TRUE(flow.has_value());
    EXPECT_DOUBLE_EQ((*flow)["wing_span"].get<double>(), 11.787);

    auto crlf = parseYamlConfig("wing_area: 49.239\r\nwing_span: 11.787\r\n");
    ASSERT_TRUE(crlf.has_value());
    EXPECT_DOUBLE_EQ((*crlf)["wing_area"].get<double>(), 49.239);
}

TEST(YamlConfigTest, QuotedScalarsStayText) {
    auto doc = parseYamlConfig("name: \"123\"\nlabel: 'a # not a comment'\n");
    ASSERT_TRUE(doc.has_value());
    EXPECT_TRUE((*doc)["name"].is_string());
    EXPECT_EQ((*doc)["name"].get<std::string>(), "123");
    EXPECT_EQ((*doc)["label"].get<std::string>(), "a # not a comment");
}

TEST(YamlConfigTest, ScalarKinds) {
    auto doc = parseYamlConfig("mass: heavy\nixx: 12kg\nflag: true\nempty:\n");
    ASSERT_TRUE(doc.has_value());
    EXPECT_TRUE((*doc)["mass"].is_string());
    EXPECT_TRUE((*doc)["ixx"].is_string());
    EXPECT_TRUE((*doc)["flag"].is_boolean());
    EXPECT_TRUE((*doc)["empty"].is_null());
}

TEST(YamlConfigTest, EqualsSeparatorIsNotAMapping) {
    std::string error;
    EXPECT_FALSE(parseYamlConfig("wing_area = 49.239\n", &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST(YamlConfigTest, NonMappingRootIsRejected) {
    std::string error;
    EXPECT_FALSE(parseYamlConfig("- 1\n- 2\n", &error).has_value());
    EXPECT_NE(error.find("mapping"), std::string::npos) << error;
    EXPECT_FALSE(parseYamlConfig("", &error).has_value());
}

TEST(YamlConfigTest, NestedValuesAreRejected) {
    std::string error;
    EXPECT_FALSE(parseYamlConfig("name: X\nmass:\n  value: 3\n", &error).has_value());
    EXPECT_NE(error.find("mass"), std::string::npos) << error;
}

TEST(YamlConfigTest, DuplicateKeyIsRejected) {
    std::string error;
    EXPECT_FALSE(parseYamlConfig("mass: 1\nixx: 2\nmass: 3\n", &error).has_value());
    EXPECT_NE(error.find("line 3"), std::string::npos) << error;
    EXPECT_NE(error.find("mass"), std::string::npos) << error;
}

TEST(YamlConfigTest, SyntaxErrorReportsLine) {
    std::string error;
    EXPECT_FALSE(parseYamlConfig("name: X\nmass: [1, 2\n", &error).has_value());
    EXPECT_NE(error.find("line"), std::string::npos) << error;
}
