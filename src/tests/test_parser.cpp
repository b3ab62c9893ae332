#include <gtest/gtest.h>
#include "test_helpers.h"
#include "fable_parser.h"
#include <map>

using namespace Fable;
using namespace FableTest;

// --- 픽스처 파일 ---

TEST(ParserTest, FixtureDocument) {
    Parser parser;
    ASSERT_TRUE(parser.parse(resourcePath("test.txt"))) << parser.getError();

    const auto& blocks = parser.getDocument().blocks;
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].name, "start");
    EXPECT_EQ(blocks[1].name, "test_1");

    std::vector<std::string> expectedText = {
        "",
        "You picked test 1!",
        "?- impossible_condition => this should never be seen",
        "?- test_condition => ?- impossible_condition => this should never be seen either"
            " => this should always be seen",
        ""
    };
    EXPECT_EQ(blocks[1].text, expectedText);

    ASSERT_EQ(blocks[1].choices.size(), 1u);
    EXPECT_EQ(blocks[1].choices[0], (Choice{"", "", "test_5"}));

    std::map<std::string, bool> expectedFlags = {{"test_condition", false}};
    EXPECT_EQ(blocks[1].flagEffects, expectedFlags);
    EXPECT_TRUE(blocks[1].counterEffects.empty());
}

TEST(ParserTest, MissingFile) {
    Parser parser;
    EXPECT_FALSE(parser.parse("definitely_not_here.txt"));
    EXPECT_TRUE(parser.isFileNotFound());
    ASSERT_EQ(parser.getParseErrors().size(), 1u);
    EXPECT_EQ(parser.getParseErrors()[0].kind, ParseError::FILE_NOT_FOUND);
}

// --- 블록 ---

TEST(ParserTest, BlocksInOrder) {
    auto doc = parseScript(
        ":- first\n"
        "one\n"
        ":- second\n"
        "two\n"
        ":- third\n"
    );
    ASSERT_EQ(doc.blocks.size(), 3u);
    EXPECT_EQ(doc.blocks[0].name, "first");
    EXPECT_EQ(doc.blocks[1].name, "second");
    EXPECT_EQ(doc.blocks[2].name, "third");
    EXPECT_EQ(doc.blocks[0].text, std::vector<std::string>{"one"});
    EXPECT_TRUE(doc.blocks[2].text.empty());
}

TEST(ParserTest, DocumentName) {
    auto doc = parseScript(":- start\n", "chapter.txt");
    EXPECT_EQ(doc.name, "chapter.txt");
}

TEST(ParserTest, PreambleDroppedWithWarning) {
    Parser parser;
    ASSERT_TRUE(parser.parseString(
        "stray text\n"
        ":- start\n"
        "hello\n"
    ));
    const auto& blocks = parser.getDocument().blocks;
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].name, "start");
    EXPECT_TRUE(parser.hasWarnings());
}

TEST(ParserTest, NoBlockStartYieldsUnnamedBlock) {
    auto doc = parseScript("just text\n-> somewhere\n");
    ASSERT_EQ(doc.blocks.size(), 1u);
    EXPECT_EQ(doc.blocks[0].name, "");
    EXPECT_EQ(doc.blocks[0].text, std::vector<std::string>{"just text"});
}

TEST(ParserTest, DuplicateBlocksKept) {
    auto doc = parseScript(
        ":- room\n"
        "first\n"
        ":- room\n"
        "second\n"
    );
    ASSERT_EQ(doc.blocks.size(), 2u);
    const Block* found = doc.findBlock("room");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->text, std::vector<std::string>{"first"});
}

// --- 선택지 ---

TEST(ParserTest, ChoiceThreeParts) {
    auto doc = parseScript(
        ":- start\n"
        "*- Open the door -> open door -> hallway\n"
    );
    ASSERT_EQ(doc.blocks.size(), 1u);
    ASSERT_EQ(doc.blocks[0].choices.size(), 1u);
    const auto& choice = doc.blocks[0].choices[0];
    EXPECT_EQ(choice.label, "Open the door");
    EXPECT_EQ(choice.keywords, "open door");
    EXPECT_EQ(choice.target, "hallway");
}

TEST(ParserTest, JumpChoice) {
    auto doc = parseScript(":- start\n-> next.txt\n");
    ASSERT_EQ(doc.blocks[0].choices.size(), 1u);
    EXPECT_EQ(doc.blocks[0].choices[0], (Choice{"", "", "next.txt"}));
}

TEST(ParserTest, ChoiceOrderPreserved) {
    auto doc = parseScript(
        ":- start\n"
        "*- A -> a -> one\n"
        "-> two\n"
        "*- C -> c -> three\n"
    );
    ASSERT_EQ(doc.blocks[0].choices.size(), 3u);
    EXPECT_EQ(doc.blocks[0].choices[0].target, "one");
    EXPECT_EQ(doc.blocks[0].choices[1].target, "two");
    EXPECT_EQ(doc.blocks[0].choices[2].target, "three");
}

TEST(ParserTest, ConditionalChoiceLabel) {
    auto doc = parseScript(
        ":- start\n"
        "*- ?- has_key => Unlock the gate -> unlock -> gate\n"
    );
    ASSERT_EQ(doc.blocks[0].choices.size(), 1u);
    EXPECT_EQ(doc.blocks[0].choices[0].label, "?- has_key => Unlock the gate");
}

// --- 효과 ---

TEST(ParserTest, FlagAndCounterEffects) {
    auto doc = parseScript(
        ":- start\n"
        "=- door_open = true\n"
        "=- lamp_lit = false\n"
        "+- score + 10\n"
        "+- health + -3\n"
    );
    const auto& block = doc.blocks[0];
    EXPECT_EQ(block.flagEffects.at("door_open"), true);
    EXPECT_EQ(block.flagEffects.at("lamp_lit"), false);
    EXPECT_EQ(block.counterEffects.at("score"), 10);
    EXPECT_EQ(block.counterEffects.at("health"), -3);
    EXPECT_TRUE(block.text.empty());
}

TEST(ParserTest, DuplicateEffectLastWins) {
    Parser parser;
    ASSERT_TRUE(parser.parseString(
        ":- start\n"
        "=- door = true\n"
        "=- door = false\n"
        "+- gold + 1\n"
        "+- gold + 7\n"
    ));
    const auto& block = parser.getDocument().blocks[0];
    EXPECT_FALSE(block.flagEffects.at("door"));
    EXPECT_EQ(block.counterEffects.at("gold"), 7);
    EXPECT_EQ(parser.getWarnings().size(), 2u);
}

// --- 텍스트 ---

TEST(ParserTest, TextKeptVerbatim) {
    auto doc = parseScript(
        ":- start\n"
        "-y A yellow line\n"
        "  What now?\n"
        "\n"
        "#- score >= 50 => rich => poor\n"
    );
    std::vector<std::string> expected = {
        "-y A yellow line", "  What now?", "", "#- score >= 50 => rich => poor"
    };
    EXPECT_EQ(doc.blocks[0].text, expected);
}

TEST(ParserTest, CrLfAndBom) {
    auto doc = parseScript("\xEF\xBB\xBF:- start\r\nHello\r\n");
    ASSERT_EQ(doc.blocks.size(), 1u);
    EXPECT_EQ(doc.blocks[0].name, "start");
    EXPECT_EQ(doc.blocks[0].text, std::vector<std::string>{"Hello"});
}

// --- 에러 ---

TEST(ParserTest, ChoiceWithTwoPartsIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString(
        ":- start\n"
        "*- Only label -> target\n"
    ));
    ASSERT_EQ(parser.getParseErrors().size(), 1u);
    EXPECT_EQ(parser.getParseErrors()[0].kind, ParseError::MALFORMED_DIRECTIVE);
    EXPECT_EQ(parser.getParseErrors()[0].line, 2);
}

TEST(ParserTest, BadFlagValueIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString(":- start\n=- door = maybe\n"));
    EXPECT_EQ(parser.getParseErrors()[0].line, 2);
}

TEST(ParserTest, BadCounterDeltaIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString(":- start\n+- gold + lots\n"));
    EXPECT_EQ(parser.getParseErrors()[0].line, 2);
}

TEST(ParserTest, BadComparisonOperatorIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString(":- start\n#- score ~ 5 => text\n"));
    EXPECT_EQ(parser.getParseErrors()[0].line, 2);
}

TEST(ParserTest, CounterOperandOutOfRangeIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString(":- start\n#- score >= 3000000000 => rich\n"));
    ASSERT_EQ(parser.getParseErrors().size(), 1u);
    EXPECT_EQ(parser.getParseErrors()[0].kind, ParseError::MALFORMED_DIRECTIVE);
    EXPECT_EQ(parser.getParseErrors()[0].line, 2);
    EXPECT_NE(parser.getError().find("out of range"), std::string::npos);
}

TEST(ParserTest, ErrorsCollectedWithFileAndLine) {
    Parser parser;
    EXPECT_FALSE(parser.parseString(
        ":- start\n"
        "=- a = yes\n"
        "fine text\n"
        "+- b + x\n",
        "broken.txt"
    ));
    const auto& errors = parser.getErrors();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].rfind("broken.txt:2:", 0), 0u);
    EXPECT_EQ(errors[1].rfind("broken.txt:4:", 0), 0u);
    EXPECT_EQ(parser.getError(), errors[0]);
}

TEST(ParserTest, NestingDepthLimit) {
    std::string line;
    for (int i = 0; i < 5; ++i) line += "?- f => ";
    line += "deep";

    Parser shallow(3);
    EXPECT_FALSE(shallow.parseString(":- start\n" + line + "\n"));

    Parser deep(8);
    EXPECT_TRUE(deep.parseString(":- start\n" + line + "\n"));
}

TEST(ParserTest, ReparseResetsState) {
    Parser parser;
    EXPECT_FALSE(parser.parseString(":- start\n=- a = nope\n"));
    EXPECT_TRUE(parser.parseString(":- start\nok\n"));
    EXPECT_FALSE(parser.hasErrors());
    EXPECT_EQ(parser.getDocument().blocks.size(), 1u);
}
