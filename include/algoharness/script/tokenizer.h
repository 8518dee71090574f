#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace algoharness {
namespace script {

enum class TokenKind : uint8_t {
    Identifier,   // names and keywords
    Number,
    String,
    Template,     // template literal text up to `${` or the closing backtick
    Regex,
    Punctuator
};

struct Token {
    TokenKind kind = TokenKind::Punctuator;
    std::string text;
    std::size_t offset = 0;       // byte offset in the source
    std::size_t line = 1;         // 1-based
    bool newlineBefore = false;   // a line break separates it from the previous token
    bool spaceBefore = false;     // whitespace or a comment separates it from the previous token

    std::size_t end() const { return offset + text.size(); }
    bool is(TokenKind k, const char* value) const { return kind == k && text == value; }
    bool isPunctuator(const char* value) const { return is(TokenKind::Punctuator, value); }
    bool isWord(const char* value) const { return is(TokenKind::Identifier, value); }
};

/**
 * @brief Splits JavaScript or TypeScript source into tokens in one pass.
 *
 * Whitespace and comments are dropped. A `/` starts a regular expression
 * literal unless the previous token ends an operand. Unterminated literals
 * run to the end of the source; the engine reports them when compiling.
 */
std::vector<Token> tokenize(const std::string& source);

/**
 * @brief For each `(`, `[` and `{` the index of its closing token.
 *
 * Closing tokens and everything else map to std::string::npos, as do
 * unbalanced openers.
 */
std::vector<std::size_t> matchBrackets(const std::vector<Token>& tokens);

/// False for keywords after which an expression starts (`return`, `typeof`, ...).
bool endsOperand(const Token& token);

} // namespace script
} // namespace algoharness
