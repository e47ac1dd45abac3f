/**
 * @file Shorthand.hpp
 * @brief Shorthand definition tokenizer and placeholder key naming
 *
 * A route predicate or filter can be declared in one line:
 *
 *     Cookie=MyCookie,MyValue
 *
 * The text before the first '=' is the definition name; the remainder is
 * a comma-separated argument list. Arguments carry no names of their own,
 * so each one is stored under a generated placeholder key ("_genkey_0",
 * "_genkey_1", ...). The normalizer later swaps those placeholders for
 * the target type's field hints.
 */

#ifndef SHORTCUT_SHORTHAND_HPP
#define SHORTCUT_SHORTHAND_HPP

#include "shortcut/Value.hpp"
#include <string>

namespace shortcut {

/// Prefix marking a synthetic placeholder key.
extern const std::string GENERATED_NAME_PREFIX;

/**
 * @brief Build the placeholder key for the argument at position i
 * @return "_genkey_<i>"
 */
std::string generate_name(size_t i);

/**
 * @brief Check whether a key is a synthetic placeholder
 */
bool is_generated_name(const std::string& key);

/**
 * @brief A parsed "Name=arg1,arg2" declaration
 */
struct ShorthandDefinition {
    std::string name;
    ArgMap args;
};

/**
 * @brief Tokenize an argument list into placeholder-keyed entries
 *
 * Splits on ',', trims each token and drops empty tokens. The i-th
 * surviving token is stored under generate_name(i).
 *
 * Examples:
 * ```cpp
 * parse_shorthand_args("GET, POST")   // {_genkey_0: "GET", _genkey_1: "POST"}
 * parse_shorthand_args("a,,b")        // {_genkey_0: "a", _genkey_1: "b"}
 * parse_shorthand_args("")            // {}
 * ```
 */
ArgMap parse_shorthand_args(const std::string& text);

/**
 * @brief Parse a full shorthand declaration
 *
 * @param text Declaration of the form "Name=arg1,arg2,..."
 * @return Definition name and its placeholder-keyed arguments
 * @throws ConfigurationError if text has no '=' or the name is empty
 */
ShorthandDefinition parse_shorthand(const std::string& text);

} // namespace shortcut

#endif // SHORTCUT_SHORTHAND_HPP
