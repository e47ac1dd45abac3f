/**
 * @file Normalizer.hpp
 * @brief Shorthand argument normalization
 *
 * Turns the ordered raw arguments of a shorthand declaration into the
 * field-name -> value map a predicate/filter factory binds from.
 *
 * Normalization modes (first field hint = hints[0], etc.):
 * - DEFAULT: one output entry per argument; placeholder keys take the
 *   positional hint name; later duplicates overwrite earlier ones.
 * - GATHER_LIST: exactly one hint; every value goes into one list.
 * - GATHER_LIST_TAIL_FLAG: exactly two hints; like GATHER_LIST, except a
 *   trailing "true"/"false" (any case) is split off into hints[1].
 *
 * Example:
 * ```cpp
 * TemplateExpressionResolver resolver;
 * ServiceRegistry registry;
 * ArgMap args{{"_genkey_0", "Cookie"}, {"_genkey_1", "SESSIONID"}};
 * auto cfg = normalize(args, {"name", "value"}, NormalizationMode::Default,
 *                      resolver, registry);
 * // cfg == {"name": "Cookie", "value": "SESSIONID"}
 * ```
 */

#ifndef SHORTCUT_NORMALIZER_HPP
#define SHORTCUT_NORMALIZER_HPP

#include "shortcut/Expression.hpp"
#include "shortcut/Registry.hpp"
#include "shortcut/Value.hpp"
#include <string>
#include <vector>

namespace shortcut {

enum class NormalizationMode {
    Default,
    GatherList,
    GatherListTailFlag
};

/**
 * @brief Canonical name of a mode ("DEFAULT", "GATHER_LIST", ...)
 */
std::string mode_name(NormalizationMode mode);

/**
 * @brief Parse a mode name (case-insensitive)
 * @throws ConfigurationError for unknown names
 */
NormalizationMode parse_mode(const std::string& name);

/**
 * @brief Declares the field order and mode of a target config type
 *
 * Defaults describe a type with no positional names that normalizes in
 * DEFAULT mode and binds without a prefix. The prefix does not change
 * normalize(); it is carried for whoever binds the result.
 */
class FieldHintProvider {
public:
    virtual ~FieldHintProvider() = default;

    /// Field names, in the order unnamed shorthand arguments map to them.
    virtual std::vector<std::string> shortcut_field_order() const { return {}; }

    virtual NormalizationMode shortcut_type() const { return NormalizationMode::Default; }

    /// Property prefix the normalized fields are bound under; empty binds at the root.
    virtual std::string shortcut_field_prefix() const { return ""; }
};

/**
 * @brief Compute the field name for the argument at position index
 *
 * A placeholder key is replaced by hints[index] when hints is non-empty
 * and index is within both args and hints. Any other key is returned
 * unchanged.
 */
std::string normalize_key(const std::string& key, size_t index,
                          const std::vector<std::string>& hints, const ArgMap& args);

/**
 * @brief Resolve one raw argument value
 *
 * - Absent value -> null
 * - Template expression (see is_template_expression) -> resolver result
 * - Anything else -> the original string, untrimmed
 *
 * @throws ExpressionEvaluationError propagated from the resolver
 */
Value resolve_value(const RawValue& raw, const ExpressionResolver& resolver,
                    const ServiceRegistry& registry);

/**
 * @brief Normalize raw shorthand arguments
 *
 * @param args Raw arguments in declaration order
 * @param hints Target field names in declaration order
 * @param mode Normalization strategy
 * @param resolver Expression evaluator for "#{...}" values
 * @param registry Beans visible to expressions
 * @return Object mapping field names to resolved values
 * @throws ConfigurationError if hints size does not fit a GATHER mode
 * @throws ExpressionEvaluationError propagated from the resolver
 */
NormalizedConfig normalize(const ArgMap& args, const std::vector<std::string>& hints,
                           NormalizationMode mode, const ExpressionResolver& resolver,
                           const ServiceRegistry& registry);

/**
 * @brief Normalize using the hints and mode a provider declares
 */
NormalizedConfig normalize(const ArgMap& args, const FieldHintProvider& provider,
                           const ExpressionResolver& resolver, const ServiceRegistry& registry);

} // namespace shortcut

#endif // SHORTCUT_NORMALIZER_HPP
