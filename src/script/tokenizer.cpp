#include "algoharness/script/tokenizer.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

namespace algoharness {
namespace script {

namespace {

// Longest first, so the first prefix that matches wins.
constexpr std::array<const char*, 46> kPunctuators = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=", "?\?=",
    "=>", "==", "!=", "<=", ">=", "&&", "||", "??", "?.", "++", "--", "+=", "-=",
    "*=", "/=", "%=", "&=", "|=", "^=", "**", "<<", ">>",
    "{", "}", "(", ")", "[", "]", ";", ",", "<", ">", "+", "-", "*",
};

bool isIdentifierStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

bool isIdentifierPart(unsigned char c) {
    return isIdentifierStart(c) || std::isdigit(c);
}

class Tokenizer {
public:
    explicit Tokenizer(const std::string& source) : source_(source) {}

    std::vector<Token> run() {
        while (true) {
            skipTrivia();
            if (pos_ >= source_.size()) {
                break;
            }
            const char c = source_[pos_];
            if (c == '`') {
                scanTemplate(pos_, pos_ + 1);
            } else if (c == '}' && !templateDepths_.empty() && templateDepths_.back() == braceDepth_) {
                templateDepths_.pop_back();
                scanTemplate(pos_, pos_ + 1);
            } else if (c == '"' || c == '\'') {
                scanString(c);
            } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                       (c == '.' && pos_ + 1 < source_.size() &&
                        std::isdigit(static_cast<unsigned char>(source_[pos_ + 1])))) {
                scanNumber();
            } else if (isIdentifierStart(static_cast<unsigned char>(c)) ||
                       (c == '#' && pos_ + 1 < source_.size() &&
                        isIdentifierStart(static_cast<unsigned char>(source_[pos_ + 1])))) {
                scanIdentifier();
            } else if (c == '/' && regexAllowed()) {
                scanRegex();
            } else {
                scanPunctuator();
            }
        }
        return std::move(tokens_);
    }

private:
    void skipTrivia() {
        while (pos_ < source_.size()) {
            const char c = source_[pos_];
            if (c == '\n') {
                newline_ = true;
                space_ = true;
                ++line_;
                ++pos_;
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                space_ = true;
                ++pos_;
            } else if (c == '/' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '/') {
                while (pos_ < source_.size() && source_[pos_] != '\n') {
                    ++pos_;
                }
                space_ = true;
            } else if (c == '/' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '*') {
                const std::size_t close = source_.find("*/", pos_ + 2);
                const std::size_t stop = close == std::string::npos ? source_.size() : close + 2;
                countLines(pos_, stop);
                pos_ = stop;
                space_ = true;
            } else {
                return;
            }
        }
    }

    void countLines(std::size_t from, std::size_t to) {
        for (std::size_t i = from; i < to; ++i) {
            if (source_[i] == '\n') {
                ++line_;
                newline_ = true;
            }
        }
    }

    void emit(TokenKind kind, std::size_t start, std::size_t stop, std::size_t line) {
        Token token;
        token.kind = kind;
        token.text = source_.substr(start, stop - start);
        token.offset = start;
        token.line = line;
        token.newlineBefore = newline_;
        token.spaceBefore = space_;
        tokens_.push_back(std::move(token));
        newline_ = false;
        space_ = false;
        pos_ = stop;
    }

    // `textStart` is the opening backtick or the `}` that resumes the literal
    void scanTemplate(std::size_t textStart, std::size_t from) {
        const std::size_t line = line_;
        const bool newlineBefore = newline_;
        std::size_t i = from;
        while (i < source_.size()) {
            if (source_[i] == '\\') {
                i += 2;
            } else if (source_[i] == '`') {
                ++i;
                break;
            } else if (source_[i] == '$' && i + 1 < source_.size() && source_[i + 1] == '{') {
                i += 2;
                templateDepths_.push_back(braceDepth_);
                break;
            } else {
                ++i;
            }
        }
        i = std::min(i, source_.size());
        emit(TokenKind::Template, textStart, i, line);
        tokens_.back().newlineBefore = newlineBefore;
        countLines(textStart, i);
        newline_ = false;
    }

    void scanString(char quote) {
        std::size_t i = pos_ + 1;
        while (i < source_.size() && source_[i] != quote && source_[i] != '\n') {
            i += source_[i] == '\\' ? 2 : 1;
        }
        if (i < source_.size() && source_[i] == quote) {
            ++i;
        }
        i = std::min(i, source_.size());
        emit(TokenKind::String, pos_, i, line_);
    }

    void scanNumber() {
        std::size_t i = pos_;
        const bool hex = source_.compare(pos_, 2, "0x") == 0 || source_.compare(pos_, 2, "0X") == 0;
        while (i < source_.size()) {
            const char c = source_[i];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
                ++i;
            } else if ((c == '+' || c == '-') && !hex && (source_[i - 1] == 'e' || source_[i - 1] == 'E')) {
                ++i;
            } else {
                break;
            }
        }
        emit(TokenKind::Number, pos_, i, line_);
    }

    void scanIdentifier() {
        std::size_t i = pos_ + 1;
        while (i < source_.size() && isIdentifierPart(static_cast<unsigned char>(source_[i]))) {
            ++i;
        }
        emit(TokenKind::Identifier, pos_, i, line_);
    }

    bool regexAllowed() const {
        if (pos_ + 1 < source_.size() && (source_[pos_ + 1] == '/' || source_[pos_ + 1] == '*')) {
            return false;
        }
        return tokens_.empty() || !endsOperand(tokens_.back());
    }

    void scanRegex() {
        std::size_t i = pos_ + 1;
        bool inClass = false;
        while (i < source_.size() && source_[i] != '\n') {
            const char c = source_[i];
            if (c == '\\') {
                i += 2;
                continue;
            }
            if (c == '[') {
                inClass = true;
            } else if (c == ']') {
                inClass = false;
            } else if (c == '/' && !inClass) {
                ++i;
                break;
            }
            ++i;
        }
        while (i < source_.size() && isIdentifierPart(static_cast<unsigned char>(source_[i]))) {
            ++i;
        }
        emit(TokenKind::Regex, pos_, std::min(i, source_.size()), line_);
    }

    void scanPunctuator() {
        for (const char* candidate : kPunctuators) {
            const std::size_t length = std::strlen(candidate);
            if (source_.compare(pos_, length, candidate) == 0) {
                if (length == 1 && candidate[0] == '{') {
                    ++braceDepth_;
                } else if (length == 1 && candidate[0] == '}') {
                    --braceDepth_;
                }
                emit(TokenKind::Punctuator, pos_, pos_ + length, line_);
                return;
            }
        }
        // Anything else, including stray bytes, becomes a one-character token
        emit(TokenKind::Punctuator, pos_, pos_ + 1, line_);
    }

    const std::string& source_;
    std::vector<Token> tokens_;
    std::vector<int> templateDepths_;  // brace depth at each open `${`
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    int braceDepth_ = 0;
    bool newline_ = false;
    bool space_ = false;
};

} // namespace

bool endsOperand(const Token& token) {
    switch (token.kind) {
        case TokenKind::Number:
        case TokenKind::String:
        case TokenKind::Regex:
            return true;
        case TokenKind::Template:
            return token.text.back() == '`' && token.text.size() > 1;
        case TokenKind::Identifier: {
            static const char* const kExpressionKeywords[] = {
                "return", "typeof", "instanceof", "in", "of", "new", "delete", "void",
                "throw", "case", "do", "else", "yield", "await",
            };
            for (const char* keyword : kExpressionKeywords) {
                if (token.text == keyword) {
                    return false;
                }
            }
            return true;
        }
        case TokenKind::Punctuator:
            return token.text == ")" || token.text == "]" || token.text == "}";
    }
    return false;
}

std::vector<Token> tokenize(const std::string& source) {
    return Tokenizer(source).run();
}

std::vector<std::size_t> matchBrackets(const std::vector<Token>& tokens) {
    std::vector<std::size_t> match(tokens.size(), std::string::npos);
    std::vector<std::size_t> open;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        if (token.kind != TokenKind::Punctuator || token.text.size() != 1) {
            continue;
        }
        const char c = token.text[0];
        if (c == '(' || c == '[' || c == '{') {
            open.push_back(i);
        } else if (c == ')' || c == ']' || c == '}') {
            const char opener = c == ')' ? '(' : (c == ']' ? '[' : '{');
            if (!open.empty() && tokens[open.back()].text[0] == opener) {
                match[open.back()] = i;
                open.pop_back();
            } else {
                // unbalanced closer: drop openers until one matches
                while (!open.empty() && tokens[open.back()].text[0] != opener) {
                    open.pop_back();
                }
                if (!open.empty()) {
                    match[open.back()] = i;
                    open.pop_back();
                }
            }
        }
    }
    return match;
}

} // namespace script
} // namespace algoharness
