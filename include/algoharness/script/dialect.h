#pragma once

#include <string>

namespace algoharness {
namespace script {

enum class Dialect {
    JavaScript,
    TypeScript
};

/**
 * @brief Removes TypeScript type syntax, leaving plain JavaScript.
 *
 * Handles interface and type alias declarations, annotations on variables,
 * parameters, class fields and return types, optional markers, access
 * modifiers, generic parameters and arguments, `implements` clauses,
 * `as` and `satisfies` casts and non-null assertions. Removed text is
 * replaced by spaces with line breaks kept, so line and column numbers
 * reported by the engine still point into the submitted source. Enums,
 * namespaces and decorators are left alone and fail to compile.
 */
std::string stripTypes(const std::string& source);

/// The source unchanged for JavaScript, stripped of types for TypeScript.
std::string toJavaScript(const std::string& source, Dialect dialect);

} // namespace script
} // namespace algoharness
