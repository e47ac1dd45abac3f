/**
 * @file Registry.cpp
 * @brief Implementation of the service registry
 */

#include "shortcut/Registry.hpp"
#include "shortcut/Errors.hpp"
#include "shortcut/Util.hpp"

#include <cctype>

namespace shortcut {

namespace {
    /**
     * @brief Map a getter name to its property: getValue -> value, isOpen -> open
     */
    std::string getter_property(const std::string& method) {
        std::string rest;
        if (starts_with(method, "get") && method.size() > 3) {
            rest = method.substr(3);
        } else if (starts_with(method, "is") && method.size() > 2) {
            rest = method.substr(2);
        } else {
            return "";
        }
        if (!std::isupper(static_cast<unsigned char>(rest[0]))) return "";
        rest[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(rest[0])));
        return rest;
    }
}

void ServiceRegistry::register_bean(const std::string& name, Value properties) {
    beans_[name].properties = std::move(properties);
}

void ServiceRegistry::register_method(const std::string& bean, const std::string& method,
                                      BeanMethod fn) {
    beans_[bean].methods[method] = std::move(fn);
}

bool ServiceRegistry::contains(const std::string& name) const {
    return beans_.find(name) != beans_.end();
}

const Bean& ServiceRegistry::bean(const std::string& name) const {
    auto it = beans_.find(name);
    if (it == beans_.end()) {
        throw ExpressionEvaluationError("@" + name, "no bean named '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> ServiceRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(beans_.size());
    for (const auto& [name, b] : beans_) out.push_back(name);
    return out;
}

Value ServiceRegistry::property(const std::string& bean_name, const std::string& name) const {
    const Bean& b = bean(bean_name);
    if (b.properties.is_object()) {
        auto it = b.properties.find(name);
        if (it != b.properties.end()) return *it;
    }
    throw ExpressionEvaluationError("@" + bean_name + "." + name,
                                    "bean '" + bean_name + "' has no property '" + name + "'");
}

Value ServiceRegistry::invoke(const std::string& bean_name, const std::string& method,
                              const std::vector<Value>& args) const {
    const Bean& b = bean(bean_name);
    auto it = b.methods.find(method);
    if (it != b.methods.end()) {
        return it->second(args);
    }

    std::string prop = getter_property(method);
    if (args.empty() && !prop.empty() && b.properties.is_object() && b.properties.contains(prop)) {
        return b.properties.at(prop);
    }

    throw ExpressionEvaluationError("@" + bean_name + "." + method + "()",
                                    "bean '" + bean_name + "' has no method '" + method +
                                    "' taking " + std::to_string(args.size()) + " argument(s)");
}

ServiceRegistry load_registry(const Value& doc) {
    ServiceRegistry registry;
    if (!doc.is_object() || !doc.contains("beans")) {
        return registry;
    }

    const Value& beans = doc.at("beans");
    if (!beans.is_object()) {
        throw ConfigurationError("'beans' must be an object, got " + type_name(beans));
    }
    for (auto it = beans.begin(); it != beans.end(); ++it) {
        registry.register_bean(it.key(), it.value());
    }
    return registry;
}

} // namespace shortcut
