#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "test_helpers.h"
#include "fable_json_export.h"
#include <string>

using json = nlohmann::json;

// Helper: parse script string and return JSON
static json exportToJson(const std::string& script) {
    Fable::Parser parser;
    EXPECT_TRUE(parser.parseString(script, "story.txt"));
    return Fable::JsonExport::toJson(parser.getDocument());
}

// ============================================================
// Basic structure tests
// ============================================================

TEST(JsonExportTest, BasicStructure) {
    auto j = exportToJson(
        ":- start\n"
        "Hello world\n"
    );

    EXPECT_EQ(j["format"], "fable-json");
    EXPECT_EQ(j["format_version"], 1);
    EXPECT_EQ(j["document"], "story.txt");
    EXPECT_EQ(j["start_block"], "start");
    ASSERT_TRUE(j["blocks"].is_array());
    EXPECT_EQ(j["blocks"].size(), 1u);
}

TEST(JsonExportTest, BlockFields) {
    auto j = exportToJson(
        ":- start\n"
        "Hello\n"
        "=- lit = true\n"
        "+- score + 3\n"
        "*- Go -> go walk -> next\n"
        ":- next\n"
    );

    auto& block = j["blocks"][0];
    EXPECT_EQ(block["name"], "start");
    EXPECT_EQ(block["text"][0]["raw"], "Hello");
    EXPECT_EQ(block["text"][0]["node"]["type"], "Plain");
    EXPECT_EQ(block["flags"]["lit"], true);
    EXPECT_EQ(block["counters"]["score"], 3);

    auto& choice = block["choices"][0];
    EXPECT_EQ(choice["label"], "Go");
    EXPECT_EQ(choice["keywords"], "go walk");
    EXPECT_EQ(choice["target"], "next");
    EXPECT_EQ(choice["target_is_document"], false);
    EXPECT_FALSE(choice.contains("conditional"));
}

TEST(JsonExportTest, DocumentTargetFlagged) {
    auto j = exportToJson(":- start\n-> chapter2.txt\n");
    EXPECT_EQ(j["blocks"][0]["choices"][0]["target_is_document"], true);
}

// ============================================================
// Conditional text
// ============================================================

TEST(JsonExportTest, FlagConditionalTree) {
    auto j = exportToJson(
        ":- start\n"
        "?- lamp => -y Light => Dark\n"
    );

    auto& node = j["blocks"][0]["text"][0]["node"];
    EXPECT_EQ(node["type"], "FlagConditional");
    EXPECT_EQ(node["flag"], "lamp");
    EXPECT_EQ(node["then"]["type"], "ColorHint");
    EXPECT_EQ(node["then"]["highlight"], "yellow");
    EXPECT_EQ(node["then"]["text"], "Light");
    EXPECT_EQ(node["else"]["type"], "Plain");
    EXPECT_EQ(node["else"]["text"], "Dark");
}

TEST(JsonExportTest, CounterConditionalTree) {
    auto j = exportToJson(
        ":- start\n"
        "#- score >= 50 => rich\n"
    );

    auto& node = j["blocks"][0]["text"][0]["node"];
    EXPECT_EQ(node["type"], "CounterConditional");
    EXPECT_EQ(node["counter"], "score");
    EXPECT_EQ(node["op"], ">=");
    EXPECT_EQ(node["value"], 50);
    EXPECT_TRUE(node["else"].is_null());
}

TEST(JsonExportTest, QuestionPrompt) {
    auto j = exportToJson(":- start\n  Which way?\n");
    auto& node = j["blocks"][0]["text"][0]["node"];
    EXPECT_EQ(node["highlight"], "cyan");
    EXPECT_EQ(node["question"], true);
}

TEST(JsonExportTest, ConditionalChoiceMarked) {
    auto j = exportToJson(
        ":- start\n"
        "*- ?- key => Unlock -> unlock -> door\n"
        ":- door\n"
    );
    EXPECT_EQ(j["blocks"][0]["choices"][0]["conditional"], true);
}

TEST(JsonExportTest, StringIsValidJson) {
    Fable::Parser parser;
    ASSERT_TRUE(parser.parseString(":- start\nsay \"hi\"\n"));
    std::string text = Fable::JsonExport::toJsonString(parser.getDocument());
    auto parsed = json::parse(text);
    EXPECT_EQ(parsed["blocks"][0]["text"][0]["raw"], "say \"hi\"");
}
