#include "algoharness/core/native_test_runner.h"
#include "algoharness/core/result_comparator.h"
#include "algoharness/script/js_engine.h"
#include "algoharness/script/script_error.h"
#include "algoharness/script/tokenizer.h"
#include "algoharness/utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <future>
#include <initializer_list>
#include <thread>

namespace algoharness {
namespace core {

namespace {

using script::Token;
using script::TokenKind;

// What must follow the word for a pattern to match
enum class Follow {
    Call,       // optional whitespace, then `(`
    Member,     // optional whitespace, then `.`
    Space,      // at least one whitespace character
    Boundary    // any non-word character or the end
};

struct UnsafePattern {
    const char* label;
    const char* word;
    Follow follow;
};

// Screened against the raw text before compiling. Not a security boundary.
constexpr UnsafePattern kUnsafePatterns[] = {
    {"eval(", "eval", Follow::Call},
    {"Function(", "Function", Follow::Call},
    {"window.", "window", Follow::Member},
    {"document.", "document", Follow::Member},
    {"global.", "global", Follow::Member},
    {"globalThis", "globalThis", Follow::Boundary},
    {"process.", "process", Follow::Member},
    {"require(", "require", Follow::Call},
    {"import ", "import", Follow::Space},
    {"export ", "export", Follow::Space},
};

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Word-bounded search; each whitespace run is scanned at most once
bool containsPattern(const std::string& code, const UnsafePattern& pattern) {
    const std::size_t length = std::strlen(pattern.word);
    for (std::size_t at = code.find(pattern.word); at != std::string::npos;
         at = code.find(pattern.word, at + 1)) {
        if (at > 0 && isWordChar(code[at - 1])) {
            continue;
        }
        std::size_t next = at + length;
        switch (pattern.follow) {
            case Follow::Boundary:
                if (next == code.size() || !isWordChar(code[next])) {
                    return true;
                }
                break;
            case Follow::Space:
                if (next < code.size() && isSpace(code[next])) {
                    return true;
                }
                break;
            case Follow::Call:
            case Follow::Member:
                while (next < code.size() && isSpace(code[next])) {
                    ++next;
                }
                if (next < code.size() && code[next] == (pattern.follow == Follow::Call ? '(' : '.')) {
                    return true;
                }
                break;
        }
    }
    return false;
}

class NativeContext : public ExecutionContext {
public:
    NativeContext(std::string javaScript, CallableInfo callable)
        : javaScript(std::move(javaScript))
        , callable(std::move(callable)) {}

    std::string javaScript;
    CallableInfo callable;
};

// What the worker thread hands back for one phase.
struct PhaseOutcome {
    Value value;
    std::optional<std::string> error;
};

// Joins the worker on every path out of executeTestCase.
class WorkerJoin {
public:
    explicit WorkerJoin(std::thread& worker) : worker_(worker) {}
    ~WorkerJoin() {
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    WorkerJoin(const WorkerJoin&) = delete;
    WorkerJoin& operator=(const WorkerJoin&) = delete;

private:
    std::thread& worker_;
};

class CallableLocator {
public:
    explicit CallableLocator(const std::string& source)
        : tokens_(script::tokenize(source))
        , match_(script::matchBrackets(tokens_))
        , topLevel_(tokens_.size(), false) {
        int depth = 0;
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            const Token& token = tokens_[i];
            if (isAny(token, {")", "]", "}"})) {
                depth = std::max(0, depth - 1);
            }
            topLevel_[i] = depth == 0;
            if (isAny(token, {"(", "[", "{"})) {
                ++depth;
            }
        }
    }

    std::optional<CallableInfo> locate() const {
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            if (!topLevel_[i] || !wordAt(i, "function") || afterDot(i)) {
                continue;
            }
            std::size_t j = punctuatorAt(i + 1, "*") ? i + 2 : i + 1;
            if (identifierAt(j) && punctuatorAt(j + 1, "(")) {
                return CallableInfo{tokens_[j].text, parameters(j + 1)};
            }
        }

        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            if (topLevel_[i] && declares(i) && identifierAt(i + 1) && punctuatorAt(i + 2, "=")) {
                if (auto names = functionValue(i + 3)) {
                    return CallableInfo{tokens_[i + 1].text, std::move(*names)};
                }
            }
        }

        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            if (topLevel_[i] && identifierAt(i) && punctuatorAt(i + 1, "=") && !afterDot(i) &&
                !(i > 0 && declares(i - 1))) {
                if (auto names = arrowValue(i + 2)) {
                    return CallableInfo{tokens_[i].text, std::move(*names)};
                }
            }
        }

        // e.g. `const solve = memoize(...)`; callability is checked at call time
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            if (topLevel_[i] && declares(i) && identifierAt(i + 1)) {
                return CallableInfo{tokens_[i + 1].text, {}};
            }
        }
        return std::nullopt;
    }

private:
    static bool isAny(const Token& token, std::initializer_list<const char*> texts) {
        for (const char* text : texts) {
            if (token.isPunctuator(text)) {
                return true;
            }
        }
        return false;
    }

    bool punctuatorAt(std::size_t i, const char* text) const {
        return i < tokens_.size() && tokens_[i].isPunctuator(text);
    }

    bool wordAt(std::size_t i, const char* text) const {
        return i < tokens_.size() && tokens_[i].isWord(text);
    }

    bool identifierAt(std::size_t i) const {
        return i < tokens_.size() && tokens_[i].kind == TokenKind::Identifier;
    }

    bool afterDot(std::size_t i) const {
        return i > 0 && (tokens_[i - 1].isPunctuator(".") || tokens_[i - 1].isPunctuator("?."));
    }

    bool declares(std::size_t i) const {
        return wordAt(i, "const") || wordAt(i, "let") || wordAt(i, "var");
    }

    std::optional<std::vector<std::string>> functionValue(std::size_t k) const {
        if (wordAt(k, "async") && wordAt(k + 1, "function")) {
            ++k;
        }
        if (!wordAt(k, "function")) {
            return arrowValue(k);
        }
        ++k;
        if (punctuatorAt(k, "*")) {
            ++k;
        }
        if (identifierAt(k)) {
            ++k;
        }
        if (!punctuatorAt(k, "(")) {
            return std::nullopt;
        }
        return parameters(k);
    }

    std::optional<std::vector<std::string>> arrowValue(std::size_t k) const {
        if (wordAt(k, "async") && (punctuatorAt(k + 1, "(") || identifierAt(k + 1))) {
            ++k;
        }
        if (punctuatorAt(k, "(") && match_[k] != std::string::npos && punctuatorAt(match_[k] + 1, "=>")) {
            return parameters(k);
        }
        if (identifierAt(k) && punctuatorAt(k + 1, "=>")) {
            return std::vector<std::string>{tokens_[k].text};
        }
        return std::nullopt;
    }

    // Names in the list opened at `open`; "" for a destructured parameter
    std::vector<std::string> parameters(std::size_t open) const {
        std::vector<std::string> names;
        const std::size_t close = match_[open];
        if (close == std::string::npos) {
            return names;
        }
        bool expectName = true;
        for (std::size_t k = open + 1; k < close; ++k) {
            const Token& token = tokens_[k];
            if (isAny(token, {"(", "[", "{"})) {
                if (expectName) {
                    names.emplace_back();
                    expectName = false;
                }
                if (match_[k] == std::string::npos) {
                    break;
                }
                k = match_[k];
            } else if (token.isPunctuator(",")) {
                expectName = true;
            } else if (expectName && token.kind == TokenKind::Identifier) {
                names.push_back(token.text);
                expectName = false;
            }
        }
        return names;
    }

    std::vector<Token> tokens_;
    std::vector<std::size_t> match_;
    std::vector<bool> topLevel_;
};

} // namespace

std::optional<CallableInfo> locateCallable(const std::string& javaScript) {
    return CallableLocator(javaScript).locate();
}

std::vector<Value> mapArguments(const Value& input, const std::vector<std::string>& parameterNames) {
    std::vector<Value> arguments;
    if (!input.is_object()) {
        if (!input.is_null()) {
            arguments.push_back(input);
        }
        return arguments;
    }

    const bool byName = !parameterNames.empty() &&
        std::all_of(parameterNames.begin(), parameterNames.end(), [&input](const std::string& name) {
            return !name.empty() && input.contains(name);
        });
    if (byName) {
        for (const auto& name : parameterNames) {
            arguments.push_back(input.at(name));
        }
        return arguments;
    }
    for (const auto& item : input.items()) {
        arguments.push_back(item.value());
    }
    return arguments;
}

NativeTestRunner::NativeTestRunner(script::Dialect dialect, RunnerConfig config)
    : TestRunner(std::move(config))
    , dialect_(dialect) {
}

std::string NativeTestRunner::getLanguageName() const {
    return dialect_ == script::Dialect::TypeScript ? "TypeScript" : "JavaScript";
}

ValidationResult NativeTestRunner::validateCode(const std::string& code) {
    ValidationResult submission = checkSubmission(code);
    if (!submission.valid) {
        return submission;
    }

    for (const auto& pattern : kUnsafePatterns) {
        if (containsPattern(code, pattern)) {
            return ValidationResult::failure(std::string("Potentially unsafe code detected: ") +
                                             pattern.label);
        }
    }

    try {
        script::JsEngine engine(engineLimits());
        engine.compile(script::toJavaScript(code, dialect_));
    } catch (const script::ScriptError& e) {
        return ValidationResult::failure(e.what());
    }
    return ValidationResult::ok();
}

std::unique_ptr<ExecutionContext> NativeTestRunner::prepareContext(const std::string& code) {
    std::string javaScript = script::toJavaScript(code, dialect_);
    auto callable = locateCallable(javaScript);
    if (!callable) {
        throw PreparationError(
            "Could not detect function name. Please define your function with a clear name.");
    }

    AHLOG_DEBUG(getLanguageName() << " submission calls '" << callable->name << "' with "
                << callable->parameterNames.size() << " declared parameter(s)");
    return std::make_unique<NativeContext>(std::move(javaScript), std::move(*callable));
}

script::EngineLimits NativeTestRunner::engineLimits() const {
    script::EngineLimits limits;
    limits.maxStackBytes = config_.maxStackBytes;
    limits.memoryLimitBytes = config_.memoryLimitBytes;
    return limits;
}

TestResult NativeTestRunner::executeTestCase(ExecutionContext& context, const TestCase& testCase) {
    auto& native = static_cast<NativeContext&>(context);
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() { return Milliseconds(std::chrono::steady_clock::now() - start); };

    const std::vector<Value> arguments = mapArguments(testCase.input, native.callable.parameterNames);

    const script::EngineLimits limits = engineLimits();
    std::atomic<bool> stop{false};
    std::promise<PhaseOutcome> setupPromise;
    std::promise<PhaseOutcome> callPromise;
    std::future<PhaseOutcome> setupDone = setupPromise.get_future();
    std::future<PhaseOutcome> callDone = callPromise.get_future();

    std::thread worker([&]() {
        bool setupFinished = false;
        auto fail = [&](std::string message) {
            (setupFinished ? callPromise : setupPromise).set_value(PhaseOutcome{Value(), std::move(message)});
        };
        try {
            // The engine is created and destroyed on this thread
            script::JsEngine engine(limits, &stop);
            engine.evaluate(native.javaScript);
            setupFinished = true;
            setupPromise.set_value(PhaseOutcome{});

            Value returned = engine.call(native.callable.name, arguments);
            callPromise.set_value(PhaseOutcome{std::move(returned), std::nullopt});
        } catch (const script::Interrupted& e) {
            fail(e.what());
        } catch (const std::exception& e) {
            fail(e.what());
        }
    });
    WorkerJoin join(worker);

    auto timedOut = [&](std::chrono::milliseconds limit) {
        stop = true;
        AHLOG_INFO(getLanguageName() << " case '" << testCase.description << "' timed out after "
                   << limit.count() << "ms");
        return makeFailedResult(testCase, "Execution timed out after " + std::to_string(limit.count()) + "ms",
                                elapsed());
    };

    if (setupDone.wait_for(config_.timeout) != std::future_status::ready) {
        return timedOut(config_.timeout);
    }
    PhaseOutcome setup = setupDone.get();
    if (setup.error) {
        return makeFailedResult(testCase, *setup.error, elapsed());
    }

    if (callDone.wait_for(config_.maxExecutionTime) != std::future_status::ready) {
        return timedOut(config_.maxExecutionTime);
    }
    PhaseOutcome call = callDone.get();
    if (call.error) {
        return makeFailedResult(testCase, *call.error, elapsed());
    }

    TestResult result;
    result.passed = compareResults(testCase.expected, call.value);
    result.expected = testCase.expected;
    result.actual = std::move(call.value);
    result.description = testCase.description;
    result.executionTime = elapsed();
    return result;
}

void NativeTestRunner::cleanupContext(ExecutionContext&) {
    // Engines live and die with their worker thread
}

} // namespace core
} // namespace algoharness
