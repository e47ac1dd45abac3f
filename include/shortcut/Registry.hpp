/**
 * @file Registry.hpp
 * @brief Named service registry used to resolve "@bean" references
 *
 * Template expressions such as "#{@myBean.getValue()}" refer to beans by
 * name. A bean is a bag of properties (a Value object) plus any number of
 * named callables. The registry is read-only while expressions evaluate.
 */

#ifndef SHORTCUT_REGISTRY_HPP
#define SHORTCUT_REGISTRY_HPP

#include "shortcut/Value.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace shortcut {

/**
 * @brief Callable bean member: receives evaluated arguments
 */
using BeanMethod = std::function<Value(const std::vector<Value>&)>;

/**
 * @brief A registered bean
 */
struct Bean {
    Value properties = Value::object();
    std::map<std::string, BeanMethod> methods;
};

class ServiceRegistry {
public:
    ServiceRegistry() = default;

    /**
     * @brief Register (or replace) a bean's properties
     * @param name Bean name as referenced by "@name"
     * @param properties Property object; non-objects are stored as-is and
     *        only reachable as the bean's own value
     */
    void register_bean(const std::string& name, Value properties = Value::object());

    /**
     * @brief Attach a callable to a bean, creating the bean if needed
     */
    void register_method(const std::string& bean, const std::string& method, BeanMethod fn);

    bool contains(const std::string& name) const;

    /**
     * @brief Get a bean by name
     * @throws ExpressionEvaluationError if no such bean
     */
    const Bean& bean(const std::string& name) const;

    /// Registered bean names, sorted.
    std::vector<std::string> names() const;

    /**
     * @brief Read a bean property
     * @throws ExpressionEvaluationError if bean or property is missing
     */
    Value property(const std::string& bean, const std::string& name) const;

    /**
     * @brief Invoke a bean member
     *
     * A registered method wins. Otherwise a zero-argument getter
     * ("getFoo" or "isFoo") reads property "foo".
     *
     * @throws ExpressionEvaluationError if nothing matches
     */
    Value invoke(const std::string& bean, const std::string& method,
                 const std::vector<Value>& args) const;

private:
    std::map<std::string, Bean> beans_;
};

/**
 * @brief Build a registry from a loaded document
 *
 * Expected shape: { "beans": { "<name>": { <properties> }, ... } }.
 * A document without "beans" yields an empty registry.
 *
 * @throws ConfigurationError if "beans" is present but not an object
 */
ServiceRegistry load_registry(const Value& doc);

} // namespace shortcut

#endif // SHORTCUT_REGISTRY_HPP
