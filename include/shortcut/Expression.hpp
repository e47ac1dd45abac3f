/**
 * @file Expression.hpp
 * @brief Template expression capability and a reference resolver
 *
 * Argument values written as "#{...}" are template expressions. The
 * normalizer only decides whether a value looks like one and forwards
 * it; evaluation is delegated to an ExpressionResolver supplied by the
 * caller.
 *
 * TemplateExpressionResolver is a small resolver covering literals and
 * bean references:
 *
 *     #{'text'}               -> "text"
 *     #{42}  #{1.5}  #{true}  -> typed scalars
 *     #{@myBean}              -> the bean's property object
 *     #{@myBean.name}         -> property
 *     #{@myBean.getValue()}   -> method call (or getter fallback)
 *     #{@svc.lookup('a', 2)}  -> method call with arguments
 *     prefix-#{@b.id}-suffix  -> "prefix-<id>-suffix"
 */

#ifndef SHORTCUT_EXPRESSION_HPP
#define SHORTCUT_EXPRESSION_HPP

#include "shortcut/Registry.hpp"
#include "shortcut/Value.hpp"
#include <string>

namespace shortcut {

/// Opens an embedded expression.
extern const std::string EXPRESSION_PREFIX;
/// Closes an embedded expression.
extern const std::string EXPRESSION_SUFFIX;

/**
 * @brief Check the expression marker syntax
 *
 * True when the trimmed value starts with "#{" and the untrimmed value
 * ends with "}". Trailing whitespace after the closing brace therefore
 * disqualifies a value.
 */
bool is_template_expression(const std::string& raw);

/**
 * @brief Evaluates template expressions against a service registry
 */
class ExpressionResolver {
public:
    virtual ~ExpressionResolver() = default;

    /**
     * @brief Evaluate a template expression
     * @param raw Untrimmed expression text, e.g. "#{@myBean.getValue()}"
     * @param registry Beans visible to the expression
     * @return Evaluated value
     * @throws ExpressionEvaluationError on parse or evaluation failure
     */
    virtual Value resolve(const std::string& raw, const ServiceRegistry& registry) const = 0;
};

/**
 * @brief Reference resolver for the "#{...}" template syntax
 *
 * A template made of exactly one expression block yields the block's
 * typed value. Any surrounding literal text turns the result into a
 * string: every block is stringified (strings verbatim, other values as
 * JSON) and concatenated with the literal parts.
 */
class TemplateExpressionResolver : public ExpressionResolver {
public:
    Value resolve(const std::string& raw, const ServiceRegistry& registry) const override;

    /**
     * @brief Evaluate a bare expression (no "#{" "}" delimiters)
     * @throws ExpressionEvaluationError on parse or evaluation failure
     */
    Value evaluate(const std::string& expr, const ServiceRegistry& registry) const;
};

} // namespace shortcut

#endif // SHORTCUT_EXPRESSION_HPP
