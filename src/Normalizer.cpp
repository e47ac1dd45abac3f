/**
 * @file Normalizer.cpp
 * @brief Implementation of the normalization strategies
 */

#include "shortcut/Normalizer.hpp"
#include "shortcut/Errors.hpp"
#include "shortcut/Shorthand.hpp"
#include "shortcut/Util.hpp"

#include <array>
#include <vector>

namespace shortcut {

namespace {

using Strategy = NormalizedConfig (*)(const ArgMap&, const std::vector<std::string>&,
                                      const ExpressionResolver&, const ServiceRegistry&);

void require_hint_count(NormalizationMode mode, const std::vector<std::string>& hints,
                        size_t expected) {
    if (hints.size() != expected) {
        throw ConfigurationError("Shortcut Configuration Type " + mode_name(mode) +
                                 " must have shortcutFieldOrder of size " +
                                 std::to_string(expected) + ", got " +
                                 std::to_string(hints.size()));
    }
}

bool is_boolean_literal(const RawValue& v) {
    return v.has_value() && (equals_ignore_case(*v, "true") || equals_ignore_case(*v, "false"));
}

std::vector<RawValue> values_of(const ArgMap& args) {
    std::vector<RawValue> out;
    out.reserve(args.size());
    for (const auto& entry : args) out.push_back(entry.second);
    return out;
}

Value resolve_all(const std::vector<RawValue>& values, const ExpressionResolver& resolver,
                  const ServiceRegistry& registry) {
    Value list = Value::array();
    for (const auto& v : values) {
        list.push_back(resolve_value(v, resolver, registry));
    }
    return list;
}

NormalizedConfig normalize_default(const ArgMap& args, const std::vector<std::string>& hints,
                                   const ExpressionResolver& resolver,
                                   const ServiceRegistry& registry) {
    NormalizedConfig out = Value::object();
    size_t index = 0;
    for (const auto& [key, value] : args) {
        // Duplicate normalized keys: last one wins.
        out[normalize_key(key, index, hints, args)] = resolve_value(value, resolver, registry);
        ++index;
    }
    return out;
}

NormalizedConfig normalize_gather_list(const ArgMap& args, const std::vector<std::string>& hints,
                                       const ExpressionResolver& resolver,
                                       const ServiceRegistry& registry) {
    require_hint_count(NormalizationMode::GatherList, hints, 1);

    NormalizedConfig out = Value::object();
    out[hints[0]] = resolve_all(values_of(args), resolver, registry);
    return out;
}

NormalizedConfig normalize_gather_list_tail_flag(const ArgMap& args,
                                                 const std::vector<std::string>& hints,
                                                 const ExpressionResolver& resolver,
                                                 const ServiceRegistry& registry) {
    require_hint_count(NormalizationMode::GatherListTailFlag, hints, 2);

    NormalizedConfig out = Value::object();
    std::vector<RawValue> values = values_of(args);
    if (!values.empty() && is_boolean_literal(values.back())) {
        out[hints[1]] = resolve_value(values.back(), resolver, registry);
        values.pop_back();
    }
    out[hints[0]] = resolve_all(values, resolver, registry);
    return out;
}

// Indexed by NormalizationMode.
const std::array<Strategy, 3> STRATEGIES = {
    &normalize_default,
    &normalize_gather_list,
    &normalize_gather_list_tail_flag,
};

} // anonymous namespace

std::string mode_name(NormalizationMode mode) {
    switch (mode) {
        case NormalizationMode::Default: return "DEFAULT";
        case NormalizationMode::GatherList: return "GATHER_LIST";
        case NormalizationMode::GatherListTailFlag: return "GATHER_LIST_TAIL_FLAG";
    }
    return "UNKNOWN";
}

NormalizationMode parse_mode(const std::string& name) {
    std::string key = to_lower(trim(name));
    if (key == "default") return NormalizationMode::Default;
    if (key == "gather_list") return NormalizationMode::GatherList;
    if (key == "gather_list_tail_flag") return NormalizationMode::GatherListTailFlag;
    throw ConfigurationError("Unknown shortcut type '" + name +
                             "' (expected DEFAULT, GATHER_LIST or GATHER_LIST_TAIL_FLAG)");
}

std::string normalize_key(const std::string& key, size_t index,
                          const std::vector<std::string>& hints, const ArgMap& args) {
    if (is_generated_name(key) && !hints.empty() &&
        index < args.size() && index < hints.size()) {
        return hints[index];
    }
    return key;
}

Value resolve_value(const RawValue& raw, const ExpressionResolver& resolver,
                    const ServiceRegistry& registry) {
    if (!raw.has_value()) {
        return nullptr;
    }
    if (is_template_expression(*raw)) {
        return resolver.resolve(*raw, registry);
    }
    return *raw;
}

NormalizedConfig normalize(const ArgMap& args, const std::vector<std::string>& hints,
                           NormalizationMode mode, const ExpressionResolver& resolver,
                           const ServiceRegistry& registry) {
    return STRATEGIES.at(static_cast<size_t>(mode))(args, hints, resolver, registry);
}

NormalizedConfig normalize(const ArgMap& args, const FieldHintProvider& provider,
                           const ExpressionResolver& resolver, const ServiceRegistry& registry) {
    return normalize(args, provider.shortcut_field_order(), provider.shortcut_type(),
                     resolver, registry);
}

} // namespace shortcut
