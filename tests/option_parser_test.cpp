#include <gtest/gtest.h>
#include "curl/OptionParser.hpp"

using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(option_parser, string_values_become_single_element_sequences) {
    string error;
    auto options = OptionParser::parse(R"({"-X":"POST","--location":"https://example.com"})", &error);

    ASSERT_TRUE(options.has_value()) << error;
    EXPECT_EQ(options->size(), 2u);
    EXPECT_EQ(options->at("-X"), (vector<string>{"POST"}));
    EXPECT_EQ(options->at("--location"), (vector<string>{"https://example.com"}));
}

// NOLINTNEXTLINE
TEST(option_parser, arrays_keep_order) {
    auto options = OptionParser::parse(R"({"-H":["Header1: value1","Header2: value2"]})");

    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->at("-H"), (vector<string>{"Header1: value1", "Header2: value2"}));
}

// NOLINTNEXTLINE
TEST(option_parser, unknown_keys_are_left_for_the_sanitizer) {
    auto options = OptionParser::parse(R"({"--dangerous":"value","-k":""})");

    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->count("--dangerous"), 1u);
    EXPECT_EQ(options->at("-k"), (vector<string>{""}));
}

// NOLINTNEXTLINE
TEST(option_parser, empty_object_is_valid) {
    auto options = OptionParser::parse("{}");
    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->empty());
}

// NOLINTNEXTLINE
TEST(option_parser, malformed_json_reports_error) {
    string error;
    EXPECT_FALSE(OptionParser::parse("{invalid json}", &error).has_value());
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(OptionParser::parse("", &error).has_value());
    EXPECT_FALSE(error.empty());
}

// NOLINTNEXTLINE
TEST(option_parser, non_object_root_is_rejected) {
    string error;
    EXPECT_FALSE(OptionParser::parse(R"(["-k"])", &error).has_value());
    EXPECT_NE(error.find("JSON object"), string::npos);
}

// NOLINTNEXTLINE
TEST(option_parser, invalid_value_types_are_rejected) {
    for (const char* body : {R"({"-k":true})", R"({"-X":1})", R"({"-H":[]})",
                             R"({"-H":["ok",2]})", R"({"-d":null})", R"({"-d":{"a":"b"}})"}) {
        string error;
        EXPECT_FALSE(OptionParser::parse(body, &error).has_value()) << body;
        EXPECT_FALSE(error.empty()) << body;
    }
}

// NOLINTNEXTLINE
TEST(option_parser, error_names_offending_key) {
    string error;
    EXPECT_FALSE(OptionParser::parse(R"({"-X":"GET","-k":false})", &error).has_value());
    EXPECT_NE(error.find("'-k'"), string::npos);
}
