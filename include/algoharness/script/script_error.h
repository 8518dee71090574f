#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace algoharness {
namespace script {

/**
 * @brief An exception thrown by script code, rendered as the engine prints
 * it (`TypeError: x is not a function`).
 */
class ScriptError : public std::runtime_error {
public:
    explicit ScriptError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Source text could not be compiled.
 *
 * A line or column of 0 means the engine did not report one.
 */
class SyntaxError : public ScriptError {
public:
    SyntaxError(const std::string& message, std::size_t line, std::size_t column)
        : ScriptError(render(message, line, column))
        , line_(line)
        , column_(column) {}

    std::size_t line() const { return line_; }
    std::size_t column() const { return column_; }

private:
    static std::string render(const std::string& message, std::size_t line, std::size_t column) {
        if (line == 0) {
            return message;
        }
        std::string text = message + " (line " + std::to_string(line);
        if (column != 0) {
            text += ", column " + std::to_string(column);
        }
        return text + ")";
    }

    std::size_t line_;
    std::size_t column_;
};

/**
 * @brief Evaluation was stopped from outside through the stop flag.
 * Script code cannot catch it.
 */
class Interrupted : public std::runtime_error {
public:
    Interrupted() : std::runtime_error("Execution interrupted") {}
};

} // namespace script
} // namespace algoharness
