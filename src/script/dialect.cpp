#include "algoharness/script/dialect.h"
#include "algoharness/script/tokenizer.h"
#include <algorithm>
#include <initializer_list>
#include <vector>

namespace algoharness {
namespace script {

namespace {

constexpr std::size_t npos = std::string::npos;

// Generic argument lists longer than this are taken to be comparisons
constexpr std::size_t kMaxAngleTokens = 256;

bool isOneOf(const std::string& text, std::initializer_list<const char*> words) {
    for (const char* word : words) {
        if (text == word) {
            return true;
        }
    }
    return false;
}

enum class Role {
    Block,        // any other bracket pair, and the top level
    Parameters,   // a function's parameter list
    ClassBody
};

struct Frame {
    Role role = Role::Block;
    std::size_t close = npos;
    bool declaring = false;     // inside a let/const/var declaration list
    bool initializer = false;   // after `=` of the current declarator or field
};

class TypeStripper {
public:
    explicit TypeStripper(const std::string& source)
        : output_(source)
        , tokens_(tokenize(source))
        , match_(matchBrackets(tokens_))
        , removed_(tokens_.size(), false) {}

    std::string run() {
        frames_.push_back(Frame());
        for (pos_ = 0; pos_ < tokens_.size(); ++pos_) {
            if (removed_[pos_]) {
                continue;
            }
            if (keep()) {
                prev_ = pos_;
            }
        }
        return std::move(output_);
    }

private:
    bool punctuatorAt(std::size_t i, const char* text) const {
        return i < tokens_.size() && tokens_[i].isPunctuator(text);
    }

    bool wordAt(std::size_t i, const char* text) const {
        return i < tokens_.size() && tokens_[i].isWord(text);
    }

    bool identifierAt(std::size_t i) const {
        return i < tokens_.size() && tokens_[i].kind == TokenKind::Identifier;
    }

    const Token* previous() const {
        return prev_ == npos ? nullptr : &tokens_[prev_];
    }

    // Blanks tokens [from, to) and whatever lies between them
    void blank(std::size_t from, std::size_t to) {
        to = std::min(to, tokens_.size());
        if (from >= to) {
            return;
        }
        for (std::size_t k = tokens_[from].offset; k < tokens_[to - 1].end(); ++k) {
            if (output_[k] != '\n') {
                output_[k] = ' ';
            }
        }
        for (std::size_t k = from; k < to; ++k) {
            removed_[k] = true;
        }
    }

    // Processes tokens_[pos_]; false when it was removed
    bool keep() {
        const Token& token = tokens_[pos_];
        const Token* prev = previous();

        if (token.kind == TokenKind::Punctuator &&
            (token.text == ")" || token.text == "]" || token.text == "}")) {
            closeFrame();
            return true;
        }
        if (token.isPunctuator("(") || token.isPunctuator("[") || token.isPunctuator("{")) {
            openFrame(token);
            return true;
        }

        Frame& frame = frames_.back();
        if (token.newlineBefore && token.kind == TokenKind::Identifier && prev && endsOperand(*prev) &&
            frame.role != Role::Parameters) {
            // a new statement or class member starts on this line
            frame.declaring = false;
            frame.initializer = false;
        }

        if (token.kind == TokenKind::Identifier) {
            return keepWord(token, prev, frame);
        }
        if (token.isPunctuator("<")) {
            return keepAngle(token, prev);
        }
        if (token.isPunctuator("!") && !token.spaceBefore && prev &&
            ((prev->kind == TokenKind::Identifier && endsOperand(*prev)) ||
             prev->isPunctuator(")") || prev->isPunctuator("]")) &&
            endsNonNullAssertion(pos_ + 1)) {
            blank(pos_, pos_ + 1);
            return false;
        }
        if (token.isPunctuator("?") && !frame.initializer && prev && prev->kind == TokenKind::Identifier &&
            marksOptional(frame)) {
            blank(pos_, pos_ + 1);
            return false;
        }
        if (token.isPunctuator(":") && !frame.initializer &&
            (frame.role != Role::Block || frame.declaring) && prev &&
            (prev->kind == TokenKind::Identifier || prev->isPunctuator("]") || prev->isPunctuator("}"))) {
            blank(pos_, skipType(pos_ + 1));
            return false;
        }

        if (token.isPunctuator("=")) {
            if (frame.declaring || frame.role != Role::Block) {
                frame.initializer = true;
            }
        } else if (token.isPunctuator(",")) {
            frame.initializer = false;
        } else if (token.isPunctuator(";")) {
            frame.initializer = false;
            frame.declaring = false;
        }
        return true;
    }

    void openFrame(const Token& token) {
        Frame next;
        next.close = match_[pos_];
        if (token.text == "(") {
            if (opensParameters(pos_)) {
                next.role = Role::Parameters;
            }
            functionPending_ = false;
        } else if (token.text == "{" && classHeader_) {
            next.role = Role::ClassBody;
            classHeader_ = false;
        }
        frames_.push_back(next);
    }

    void closeFrame() {
        if (frames_.size() < 2 || frames_.back().close != pos_) {
            return;
        }
        const Role role = frames_.back().role;
        frames_.pop_back();
        if (role == Role::Parameters && punctuatorAt(pos_ + 1, ":")) {
            // return type
            blank(pos_ + 1, skipType(pos_ + 2));
        }
    }

    bool keepWord(const Token& token, const Token* prev, Frame& frame) {
        const bool member = prev && (prev->isPunctuator(".") || prev->isPunctuator("?."));
        if (member) {
            return true;
        }
        if (atStatementStart() && stripDeclaration(token)) {
            return false;
        }
        if (token.text == "function") {
            functionPending_ = true;
        } else if (token.text == "class") {
            classHeader_ = true;
        } else if (classHeader_ && token.text == "implements") {
            std::size_t j = pos_ + 1;
            while (j < tokens_.size() && !tokens_[j].isPunctuator("{")) {
                ++j;
            }
            blank(pos_, j);
            return false;
        } else if ((token.text == "as" || token.text == "satisfies") && prev && endsOperand(*prev) &&
                   !token.newlineBefore && startsType(pos_ + 1)) {
            blank(pos_, skipType(pos_ + 1));
            return false;
        } else if ((frame.role == Role::ClassBody || frame.role == Role::Parameters) &&
                   isOneOf(token.text, {"public", "private", "protected", "readonly", "declare",
                                        "override", "abstract"}) &&
                   modifierApplies(token, prev)) {
            blank(pos_, pos_ + 1);
            return false;
        } else if (isOneOf(token.text, {"let", "const", "var"})) {
            frame.declaring = true;
            frame.initializer = false;
        }
        return true;
    }

    bool keepAngle(const Token& token, const Token* prev) {
        if (!prev) {
            return true;
        }
        if (classHeader_ && prev->kind == TokenKind::Identifier) {
            const std::size_t end = angleEnd(pos_);
            if (end != npos) {
                blank(pos_, end);
                return false;
            }
            return true;
        }
        const bool afterName = prev->kind == TokenKind::Identifier && endsOperand(*prev) &&
                               (!token.spaceBefore || functionPending_);
        const bool beforeArrow = prev->isPunctuator("=") || prev->isPunctuator("(") ||
                                 prev->isPunctuator(",") || prev->isPunctuator(":");
        if (!afterName && !beforeArrow) {
            return true;
        }
        const std::size_t end = angleEnd(pos_);
        if (end == npos || !punctuatorAt(end, "(")) {
            return true;
        }
        if (beforeArrow && !opensParameters(end)) {
            return true;
        }
        blank(pos_, end);
        return false;
    }

    bool atStatementStart() const {
        const Token* prev = previous();
        return !prev || prev->isPunctuator(";") || prev->isPunctuator("{") || prev->isPunctuator("}") ||
               tokens_[pos_].newlineBefore;
    }

    // Declarations with no runtime meaning: interface, type, declare, abstract
    bool stripDeclaration(const Token& token) {
        if (token.text == "interface" && identifierAt(pos_ + 1)) {
            std::size_t j = pos_ + 2;
            while (j < tokens_.size() && !tokens_[j].isPunctuator("{")) {
                if (tokens_[j].isPunctuator(";") || tokens_[j].isPunctuator("}")) {
                    return false;
                }
                ++j;
            }
            if (j >= tokens_.size() || match_[j] == npos) {
                return false;
            }
            blank(pos_, match_[j] + 1);
            return true;
        }
        if (token.text == "type" && identifierAt(pos_ + 1) &&
            (punctuatorAt(pos_ + 2, "=") || punctuatorAt(pos_ + 2, "<"))) {
            std::size_t j = pos_ + 2;
            if (punctuatorAt(j, "<")) {
                j = angleEnd(j);
                if (j == npos) {
                    return false;
                }
            }
            if (!punctuatorAt(j, "=")) {
                return false;
            }
            std::size_t end = skipType(j + 1);
            if (punctuatorAt(end, ";")) {
                ++end;
            }
            blank(pos_, end);
            return true;
        }
        if (token.text == "declare" && identifierAt(pos_ + 1)) {
            blank(pos_, statementEnd(pos_));
            return true;
        }
        if (token.text == "abstract" && wordAt(pos_ + 1, "class")) {
            blank(pos_, pos_ + 1);
            return true;
        }
        return false;
    }

    std::size_t statementEnd(std::size_t from) const {
        for (std::size_t j = from + 1; j < tokens_.size(); ++j) {
            const Token& token = tokens_[j];
            if (token.newlineBefore) {
                return j;
            }
            if (token.isPunctuator(";")) {
                return j + 1;
            }
            if (match_[j] != npos) {
                j = match_[j];
            }
        }
        return tokens_.size();
    }

    bool modifierApplies(const Token& token, const Token* prev) const {
        if (!identifierAt(pos_ + 1) && !punctuatorAt(pos_ + 1, "[")) {
            return false;
        }
        return !prev || token.newlineBefore || prev->isPunctuator("{") || prev->isPunctuator(";") ||
               prev->isPunctuator(",") || prev->isPunctuator("(") || prev->isPunctuator("}") ||
               prev->isWord("static");
    }

    bool marksOptional(const Frame& frame) const {
        if (punctuatorAt(pos_ + 1, ":")) {
            return frame.role != Role::Block;
        }
        if (frame.role == Role::Parameters) {
            return punctuatorAt(pos_ + 1, ",") || punctuatorAt(pos_ + 1, ")") || punctuatorAt(pos_ + 1, "=");
        }
        if (frame.role == Role::ClassBody) {
            return punctuatorAt(pos_ + 1, ";") || punctuatorAt(pos_ + 1, "=");
        }
        return false;
    }

    bool endsNonNullAssertion(std::size_t next) const {
        if (next >= tokens_.size() || tokens_[next].newlineBefore) {
            return true;
        }
        const Token& token = tokens_[next];
        return token.kind == TokenKind::Punctuator &&
               isOneOf(token.text, {".", "?.", "[", "(", ")", "]", ",", ";", ":", "}", "="});
    }

    bool isMethodName(const Token* token) const {
        return token && token->kind == TokenKind::Identifier && endsOperand(*token) &&
               !isOneOf(token->text, {"if", "for", "while", "switch", "with", "catch", "function"});
    }

    // Whether the `(` at `open` starts a parameter list
    bool opensParameters(std::size_t open) const {
        const Token* prev = previous();
        if (functionPending_ || (prev && prev->isWord("catch"))) {
            return true;
        }
        const std::size_t close = match_[open];
        if (close == npos) {
            return false;
        }
        if (punctuatorAt(close + 1, "=>")) {
            return true;
        }
        // `(` at pos_ has the previous kept token as its callee or method name
        const bool method = open == pos_ && isMethodName(prev);
        if (punctuatorAt(close + 1, "{")) {
            return method;
        }
        if (punctuatorAt(close + 1, ":")) {
            const std::size_t end = skipType(close + 2);
            return punctuatorAt(end, "=>") || (method && punctuatorAt(end, "{"));
        }
        return false;
    }

    bool startsType(std::size_t i) const {
        if (i >= tokens_.size()) {
            return false;
        }
        const Token& token = tokens_[i];
        return token.kind == TokenKind::Identifier || token.kind == TokenKind::String ||
               token.kind == TokenKind::Number || token.isPunctuator("{") || token.isPunctuator("[") ||
               token.isPunctuator("(") || token.isPunctuator("<");
    }

    // Index just past the `>` closing the `<` at `open`, or npos when the
    // tokens cannot be a type argument list
    std::size_t angleEnd(std::size_t open) const {
        int depth = 0;
        const std::size_t limit = std::min(tokens_.size(), open + kMaxAngleTokens);
        for (std::size_t k = open; k < limit; ++k) {
            const Token& token = tokens_[k];
            if (token.kind == TokenKind::Template || token.kind == TokenKind::Regex) {
                return npos;
            }
            if (token.kind != TokenKind::Punctuator) {
                continue;
            }
            if (token.text == "<") {
                ++depth;
            } else if (token.text == ">") {
                --depth;
            } else if (token.text == ">>") {
                depth -= 2;
            } else if (token.text == ">>>") {
                depth -= 3;
            } else if (token.text == "(" || token.text == "[" || token.text == "{") {
                if (match_[k] == npos) {
                    return npos;
                }
                k = match_[k];
                continue;
            } else if (!isOneOf(token.text, {",", ".", "|", "&", "?", ":", "=>", "=", "...", "-"})) {
                return npos;
            }
            if (depth <= 0) {
                return depth == 0 ? k + 1 : npos;
            }
        }
        return npos;
    }

    // Index of the first token after the type starting at `from`
    std::size_t skipType(std::size_t from) const {
        std::size_t j = from;
        bool expectOperand = true;
        bool afterGroup = false;
        int conditionals = 0;
        while (j < tokens_.size()) {
            const Token& token = tokens_[j];
            if (expectOperand) {
                if (token.isPunctuator("(") || token.isPunctuator("[") || token.isPunctuator("{")) {
                    if (match_[j] == npos) {
                        return tokens_.size();
                    }
                    afterGroup = token.text == "(";
                    j = match_[j] + 1;
                    expectOperand = false;
                } else if (token.isPunctuator("<")) {
                    // type parameters of a function type
                    j = angleEnd(j);
                    if (j == npos) {
                        return tokens_.size();
                    }
                } else if (token.isPunctuator("|") || token.isPunctuator("&")) {
                    ++j;
                } else if (token.isPunctuator("-") && j + 1 < tokens_.size() &&
                           tokens_[j + 1].kind == TokenKind::Number) {
                    j += 2;
                    expectOperand = false;
                    afterGroup = false;
                } else if (token.kind == TokenKind::Identifier &&
                           isOneOf(token.text, {"keyof", "typeof", "readonly", "unique", "infer", "new", "asserts"})) {
                    ++j;
                } else if (token.kind == TokenKind::Identifier || token.kind == TokenKind::String ||
                           token.kind == TokenKind::Number ||
                           (token.kind == TokenKind::Template && token.text.back() == '`')) {
                    ++j;
                    expectOperand = false;
                    afterGroup = false;
                } else {
                    break;
                }
                continue;
            }
            if (token.isPunctuator("|") || token.isPunctuator("&")) {
                ++j;
                expectOperand = true;
                continue;
            }
            if (token.newlineBefore) {
                break;
            }
            if (token.isPunctuator(".")) {
                ++j;
                expectOperand = true;
            } else if (token.isPunctuator("[")) {
                if (match_[j] == npos) {
                    return tokens_.size();
                }
                j = match_[j] + 1;
            } else if (token.isPunctuator("<")) {
                const std::size_t end = angleEnd(j);
                if (end == npos) {
                    break;
                }
                j = end;
            } else if (token.isPunctuator("=>") && afterGroup) {
                ++j;
                expectOperand = true;
                afterGroup = false;
            } else if (token.isWord("is") || token.isWord("extends")) {
                if (token.text == "extends") {
                    ++conditionals;
                }
                ++j;
                expectOperand = true;
            } else if (conditionals > 0 && token.isPunctuator("?")) {
                ++j;
                expectOperand = true;
            } else if (conditionals > 0 && token.isPunctuator(":")) {
                --conditionals;
                ++j;
                expectOperand = true;
            } else {
                break;
            }
        }
        return j;
    }

    std::string output_;
    std::vector<Token> tokens_;
    std::vector<std::size_t> match_;
    std::vector<bool> removed_;
    std::vector<Frame> frames_;
    std::size_t pos_ = 0;
    std::size_t prev_ = npos;     // last token kept
    bool functionPending_ = false;
    bool classHeader_ = false;
};

} // namespace

std::string stripTypes(const std::string& source) {
    return TypeStripper(source).run();
}

std::string toJavaScript(const std::string& source, Dialect dialect) {
    return dialect == Dialect::TypeScript ? stripTypes(source) : source;
}

} // namespace script
} // namespace algoharness
