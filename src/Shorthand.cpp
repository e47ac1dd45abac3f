/**
 * @file Shorthand.cpp
 * @brief Implementation of shorthand tokenizing
 */

#include "shortcut/Shorthand.hpp"
#include "shortcut/Errors.hpp"
#include "shortcut/Util.hpp"

namespace shortcut {

const std::string GENERATED_NAME_PREFIX = "_genkey_";

std::string generate_name(size_t i) {
    return GENERATED_NAME_PREFIX + std::to_string(i);
}

bool is_generated_name(const std::string& key) {
    return starts_with(key, GENERATED_NAME_PREFIX);
}

ArgMap parse_shorthand_args(const std::string& text) {
    ArgMap args;
    auto tokens = split(text, ',');
    for (size_t i = 0; i < tokens.size(); ++i) {
        args[generate_name(i)] = tokens[i];
    }
    return args;
}

ShorthandDefinition parse_shorthand(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw ConfigurationError("Unable to parse shortcut definition text '" + text +
                                 "', must be of the form name=value");
    }

    ShorthandDefinition def;
    def.name = text.substr(0, eq);
    def.args = parse_shorthand_args(text.substr(eq + 1));
    return def;
}

} // namespace shortcut
