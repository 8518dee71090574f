#include "algoharness/script/js_engine.h"
#include "algoharness/utils/logging.hpp"
#include <quickjs.h>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace algoharness {
namespace script {

namespace {

constexpr const char* kStackOverflow = "RangeError: Maximum call stack size exceeded";
constexpr int kFulfilled = 1;
constexpr int kRejected = 2;

// Owns one reference to a value.
class ScopedValue {
public:
    ScopedValue(JSContext* context, JSValue value) : context_(context), value_(value) {}
    ~ScopedValue() { JS_FreeValue(context_, value_); }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

    JSValue get() const { return value_; }
    bool isException() const { return JS_IsException(value_); }

private:
    JSContext* context_;
    JSValue value_;
};

// Owns the argument values of one call.
class ValueList {
public:
    explicit ValueList(JSContext* context) : context_(context) {}
    ~ValueList() {
        for (JSValue value : values_) {
            JS_FreeValue(context_, value);
        }
    }

    ValueList(const ValueList&) = delete;
    ValueList& operator=(const ValueList&) = delete;

    void push(JSValue value) { values_.push_back(value); }
    JSValue* data() { return values_.data(); }
    int size() const { return static_cast<int>(values_.size()); }

private:
    JSContext* context_;
    std::vector<JSValue> values_;
};

int interruptHandler(JSRuntime*, void* opaque) {
    return static_cast<const std::atomic<bool>*>(opaque)->load() ? 1 : 0;
}

std::string toText(JSContext* context, JSValueConst value) {
    std::size_t length = 0;
    const char* text = JS_ToCStringLen(context, &length, value);
    if (!text) {
        // toString() itself threw
        JS_FreeValue(context, JS_GetException(context));
        return "Error: thrown value has no string form";
    }
    std::string result(text, length);
    JS_FreeCString(context, text);
    return result;
}

[[noreturn]] void throwException(JSContext* context, const std::atomic<bool>* stopFlag) {
    ScopedValue exception(context, JS_GetException(context));
    if (stopFlag && stopFlag->load()) {
        throw Interrupted();
    }
    std::string message = toText(context, exception.get());
    if (message == "InternalError: stack overflow") {
        message = kStackOverflow;
    }
    throw ScriptError(message);
}

// "    at submission.js:3:14" gives line 3, column 14
void parseLocation(const std::string& stack, std::size_t& line, std::size_t& column) {
    const std::string marker = std::string(JsEngine::kSourceName) + ":";
    const std::size_t at = stack.find(marker);
    if (at == std::string::npos) {
        return;
    }
    const char* cursor = stack.c_str() + at + marker.size();
    char* end = nullptr;
    line = std::strtoul(cursor, &end, 10);
    if (end && *end == ':') {
        column = std::strtoul(end + 1, nullptr, 10);
    }
}

JSValue consoleWrite(JSContext* context, JSValueConst, int argc, JSValueConst* argv) {
    std::string line;
    for (int i = 0; i < argc; ++i) {
        std::size_t length = 0;
        const char* text = JS_ToCStringLen(context, &length, argv[i]);
        if (!text) {
            return JS_EXCEPTION;
        }
        if (i > 0) {
            line += ' ';
        }
        line.append(text, length);
        JS_FreeCString(context, text);
    }
    AHLOG_DEBUG("console: " << line);
    return JS_UNDEFINED;
}

// JSON.stringify replacer keeping non-finite numbers as strings
JSValue replaceNonFinite(JSContext* context, JSValueConst, int argc, JSValueConst* argv) {
    if (argc < 2) {
        return JS_UNDEFINED;
    }
    if (JS_IsNumber(argv[1])) {
        double number = 0;
        if (JS_ToFloat64(context, &number, argv[1]) == 0 && !std::isfinite(number)) {
            return JS_NewString(context, std::isnan(number) ? "NaN" : (number > 0 ? "Infinity" : "-Infinity"));
        }
    }
    return JS_DupValue(context, argv[1]);
}

// Promise reaction storing the outcome on the box object in data[0]
JSValue recordSettlement(JSContext* context, JSValueConst, int argc, JSValueConst* argv,
                         int magic, JSValue* data) {
    const JSValue value = argc > 0 ? JS_DupValue(context, argv[0]) : JS_UNDEFINED;
    if (JS_SetPropertyStr(context, data[0], "value", value) < 0 ||
        JS_SetPropertyStr(context, data[0], "state", JS_NewInt32(context, magic)) < 0) {
        return JS_EXCEPTION;
    }
    return JS_UNDEFINED;
}

nlohmann::ordered_json toJson(JSContext* context, JSValueConst value, const std::atomic<bool>* stopFlag) {
    ScopedValue replacer(context, JS_NewCFunction(context, replaceNonFinite, "replacer", 2));
    if (replacer.isException()) {
        throwException(context, stopFlag);
    }
    ScopedValue text(context, JS_JSONStringify(context, value, replacer.get(), JS_UNDEFINED));
    if (text.isException()) {
        throwException(context, stopFlag);
    }
    if (JS_IsUndefined(text.get())) {
        // undefined, functions and symbols
        return nullptr;
    }
    try {
        return nlohmann::ordered_json::parse(toText(context, text.get()));
    } catch (const nlohmann::ordered_json::parse_error&) {
        throw ScriptError("TypeError: result has no JSON form");
    }
}

} // namespace

JsEngine::JsEngine(EngineLimits limits, const std::atomic<bool>* stopFlag)
    : stopFlag_(stopFlag) {
    runtime_ = JS_NewRuntime();
    if (!runtime_) {
        throw std::runtime_error("Failed to create script runtime");
    }
    JS_SetMemoryLimit(runtime_, limits.memoryLimitBytes);
    JS_SetMaxStackSize(runtime_, limits.maxStackBytes);
    if (stopFlag_) {
        JS_SetInterruptHandler(runtime_, interruptHandler, const_cast<std::atomic<bool>*>(stopFlag_));
    }

    context_ = JS_NewContext(runtime_);
    if (!context_) {
        JS_FreeRuntime(runtime_);
        throw std::runtime_error("Failed to create script context");
    }
    try {
        installConsole();
    } catch (const std::exception&) {
        JS_FreeContext(context_);
        JS_FreeRuntime(runtime_);
        throw;
    }
}

JsEngine::~JsEngine() {
    JS_FreeContext(context_);
    JS_FreeRuntime(runtime_);
}

void JsEngine::installConsole() {
    ScopedValue global(context_, JS_GetGlobalObject(context_));
    JSValue console = JS_NewObject(context_);
    if (JS_IsException(console)) {
        throwPendingException();
    }
    for (const char* name : {"log", "info", "warn", "error", "debug"}) {
        // JS_SetPropertyStr takes ownership of the function, also on failure
        if (JS_SetPropertyStr(context_, console, name, JS_NewCFunction(context_, consoleWrite, name, 1)) < 0) {
            JS_FreeValue(context_, console);
            throwPendingException();
        }
    }
    if (JS_SetPropertyStr(context_, global.get(), "console", console) < 0) {
        throwPendingException();
    }
}

void JsEngine::throwPendingException() {
    throwException(context_, stopFlag_);
}

void JsEngine::runPendingJobs() {
    while (true) {
        if (stopFlag_ && stopFlag_->load()) {
            throw Interrupted();
        }
        JSContext* jobContext = nullptr;
        const int status = JS_ExecutePendingJob(runtime_, &jobContext);
        if (status == 0) {
            return;
        }
        if (status < 0) {
            throwPendingException();
        }
    }
}

void JsEngine::compile(const std::string& source) {
    ScopedValue compiled(context_, JS_Eval(context_, source.c_str(), source.size(), kSourceName,
                                           JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_COMPILE_ONLY));
    if (!compiled.isException()) {
        return;
    }

    ScopedValue exception(context_, JS_GetException(context_));
    std::string message = toText(context_, exception.get());
    if (message == "InternalError: stack overflow") {
        message = kStackOverflow;
    }
    if (message.compare(0, 11, "SyntaxError") != 0) {
        throw ScriptError(message);
    }

    std::size_t line = 0;
    std::size_t column = 0;
    if (JS_IsObject(exception.get())) {
        ScopedValue stack(context_, JS_GetPropertyStr(context_, exception.get(), "stack"));
        if (stack.isException()) {
            JS_FreeValue(context_, JS_GetException(context_));
        } else if (JS_IsString(stack.get())) {
            parseLocation(toText(context_, stack.get()), line, column);
        }
    }
    throw SyntaxError(message, line, column);
}

void JsEngine::evaluate(const std::string& source) {
    ScopedValue result(context_, JS_Eval(context_, source.c_str(), source.size(), kSourceName,
                                         JS_EVAL_TYPE_GLOBAL));
    if (result.isException()) {
        throwPendingException();
    }
    runPendingJobs();
}

nlohmann::ordered_json JsEngine::call(const std::string& name,
                                      const std::vector<nlohmann::ordered_json>& arguments) {
    // Evaluating the name resolves lexical globals, which are not properties of globalThis
    ScopedValue callee(context_, JS_Eval(context_, name.c_str(), name.size(), "<lookup>",
                                         JS_EVAL_TYPE_GLOBAL));
    if (callee.isException()) {
        throwPendingException();
    }
    if (!JS_IsFunction(context_, callee.get())) {
        throw ScriptError("TypeError: " + name + " is not a function");
    }

    ValueList args(context_);
    for (const auto& argument : arguments) {
        const std::string text = argument.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        JSValue value = JS_ParseJSON(context_, text.c_str(), text.size(), "<input>");
        if (JS_IsException(value)) {
            throwPendingException();
        }
        args.push(value);
    }

    ScopedValue returned(context_, JS_Call(context_, callee.get(), JS_UNDEFINED, args.size(), args.data()));
    if (returned.isException()) {
        throwPendingException();
    }

    ScopedValue then(context_, JS_IsObject(returned.get())
                                   ? JS_GetPropertyStr(context_, returned.get(), "then")
                                   : JS_UNDEFINED);
    if (then.isException()) {
        throwPendingException();
    }
    if (!JS_IsFunction(context_, then.get())) {
        return toJson(context_, returned.get(), stopFlag_);
    }

    ScopedValue box(context_, JS_NewObject(context_));
    if (box.isException()) {
        throwPendingException();
    }
    JSValue boxData = box.get();
    ScopedValue onFulfilled(context_, JS_NewCFunctionData(context_, recordSettlement, 1, kFulfilled, 1, &boxData));
    ScopedValue onRejected(context_, JS_NewCFunctionData(context_, recordSettlement, 1, kRejected, 1, &boxData));
    if (onFulfilled.isException() || onRejected.isException()) {
        throwPendingException();
    }
    JSValue reactions[] = {onFulfilled.get(), onRejected.get()};
    ScopedValue chained(context_, JS_Call(context_, then.get(), returned.get(), 2, reactions));
    if (chained.isException()) {
        throwPendingException();
    }
    runPendingJobs();

    ScopedValue state(context_, JS_GetPropertyStr(context_, box.get(), "state"));
    ScopedValue settled(context_, JS_GetPropertyStr(context_, box.get(), "value"));
    int32_t outcome = 0;
    if (state.isException() || settled.isException() || JS_ToInt32(context_, &outcome, state.get()) < 0) {
        throwPendingException();
    }
    if (outcome == kFulfilled) {
        return toJson(context_, settled.get(), stopFlag_);
    }
    if (outcome == kRejected) {
        throw ScriptError(toText(context_, settled.get()));
    }
    throw ScriptError("Error: returned promise never settled");
}

} // namespace script
} // namespace algoharness
