#include <gtest/gtest.h>
#include "algoharness/script/tokenizer.h"

using namespace algoharness::script;

namespace {

std::vector<std::string> texts(const std::vector<Token>& tokens) {
    std::vector<std::string> result;
    for (const auto& token : tokens) {
        result.push_back(token.text);
    }
    return result;
}

} // namespace

TEST(TokenizerTest, SplitsWordsNumbersAndPunctuators) {
    auto tokens = tokenize("let x = a >>> 2 ?? b?.c;");
    EXPECT_EQ(texts(tokens), (std::vector<std::string>{"let", "x", "=", "a", ">>>", "2", "??", "b", "?.", "c", ";"}));
    EXPECT_EQ(tokens[0].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[5].kind, TokenKind::Number);
    EXPECT_EQ(tokens[4].kind, TokenKind::Punctuator);
}

TEST(TokenizerTest, DropsCommentsAndTracksLines) {
    auto tokens = tokenize("a // one\n/* two\nthree */ b\n  c");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].text, "b");
    EXPECT_EQ(tokens[1].line, 3u);
    EXPECT_TRUE(tokens[1].newlineBefore);
    EXPECT_EQ(tokens[2].line, 4u);
    EXPECT_EQ(tokens[2].offset, 29u);
}

TEST(TokenizerTest, StringsKeepEscapedQuotes) {
    auto tokens = tokenize(R"(f("a\"b", 'c\'d'))");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[2].kind, TokenKind::String);
    EXPECT_EQ(tokens[2].text, R"("a\"b")");
    EXPECT_EQ(tokens[4].text, R"('c\'d')");
}

TEST(TokenizerTest, SlashIsRegexOnlyWhereAnOperandStarts) {
    auto division = tokenize("x = a / b / c");
    EXPECT_EQ(texts(division), (std::vector<std::string>{"x", "=", "a", "/", "b", "/", "c"}));

    auto regex = tokenize("return /[/]x/g.test(s)");
    ASSERT_GE(regex.size(), 2u);
    EXPECT_EQ(regex[1].kind, TokenKind::Regex);
    EXPECT_EQ(regex[1].text, "/[/]x/g");

    auto afterParen = tokenize("(n) / 2");
    EXPECT_EQ(afterParen[3].text, "/");
}

TEST(TokenizerTest, TemplateSubstitutionsAreTokenized) {
    auto tokens = tokenize("`a${ {k: 1}.k + `b${c}` }d`");
    EXPECT_EQ(texts(tokens), (std::vector<std::string>{
        "`a${", "{", "k", ":", "1", "}", ".", "k", "+", "`b${", "c", "}`", "}d`"}));
    EXPECT_EQ(tokens[0].kind, TokenKind::Template);
    EXPECT_EQ(tokens[11].kind, TokenKind::Template);
    EXPECT_EQ(tokens[12].kind, TokenKind::Template);
}

TEST(TokenizerTest, NumbersWithExponentsAndHex) {
    auto tokens = tokenize("1e-5 + 0xff - .5");
    EXPECT_EQ(texts(tokens), (std::vector<std::string>{"1e-5", "+", "0xff", "-", ".5"}));
}

TEST(TokenizerTest, UnterminatedLiteralsRunToTheEnd) {
    auto tokens = tokenize("a = 'open");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].text, "'open");
}

TEST(TokenizerTest, MatchesBrackets) {
    auto tokens = tokenize("f(a[1], {b: (c)})");
    auto match = matchBrackets(tokens);
    EXPECT_EQ(match[1], tokens.size() - 1);
    EXPECT_EQ(tokens[match[3]].text, "]");
    EXPECT_EQ(tokens[match[7]].text, "}");
    EXPECT_EQ(match[0], std::string::npos);

    auto unbalanced = matchBrackets(tokenize("( [ )"));
    EXPECT_EQ(unbalanced[0], 2u);
    EXPECT_EQ(unbalanced[1], std::string::npos);
}

TEST(TokenizerTest, LongInputsStayLinear) {
    const std::string code = "let s = '" + std::string(500000, ' ') + "';";
    auto tokens = tokenize(code);
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[3].text.size(), 500002u);
}
