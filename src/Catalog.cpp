/**
 * @file Catalog.cpp
 * @brief Hint catalog and JSON/TOML document loading
 */

#include "shortcut/Catalog.hpp"
#include "shortcut/Errors.hpp"
#include "shortcut/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace shortcut {

namespace {

// ============================================================================
// Document loading
// ============================================================================

/**
 * @brief Convert a toml++ node tree into a Value
 *
 * Dates and times have no JSON counterpart and become their TOML text.
 */
Value to_value(const toml::node& node) {
    return node.visit([](auto&& n) -> Value {
        using Node = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<Node, toml::table>) {
            Value obj = Value::object();
            for (const auto& [key, child] : n) {
                obj[std::string(key.str())] = to_value(child);
            }
            return obj;
        } else if constexpr (std::is_same_v<Node, toml::array>) {
            Value arr = Value::array();
            for (const auto& child : n) arr.push_back(to_value(child));
            return arr;
        } else if constexpr (std::is_same_v<Node, toml::value<toml::date>> ||
                             std::is_same_v<Node, toml::value<toml::time>> ||
                             std::is_same_v<Node, toml::value<toml::date_time>>) {
            std::ostringstream text;
            text << n.get();
            return Value(text.str());
        } else {
            return Value(n.get());
        }
    });
}

Value parse_json_stream(std::istream& in, const std::string& path) {
    try {
        return Value::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(path, e.what());
    }
}

Value parse_toml_stream(std::istream& in, const std::string& path) {
    try {
        return to_value(toml::parse(in, path));
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw ConfigParseError(path, details.str());
    }
}

StaticFieldHints hints_from_value(const std::string& type, const Value& decl) {
    if (!decl.is_object()) {
        throw ConfigurationError("Type '" + type + "' must be an object, got " + type_name(decl));
    }

    auto fields_it = decl.find("fields");
    if (fields_it == decl.end() || !fields_it->is_array()) {
        throw ConfigurationError("Type '" + type + "' must declare 'fields' as an array");
    }
    std::vector<std::string> fields;
    for (const auto& f : *fields_it) {
        if (!f.is_string()) {
            throw ConfigurationError("Type '" + type + "' has a non-string field name: " + f.dump());
        }
        fields.push_back(f.get<std::string>());
    }

    NormalizationMode mode = NormalizationMode::Default;
    auto mode_it = decl.find("mode");
    if (mode_it != decl.end()) {
        if (!mode_it->is_string()) {
            throw ConfigurationError("Type '" + type + "' has a non-string 'mode'");
        }
        mode = parse_mode(mode_it->get<std::string>());
    }

    std::string prefix;
    auto prefix_it = decl.find("prefix");
    if (prefix_it != decl.end()) {
        if (!prefix_it->is_string()) {
            throw ConfigurationError("Type '" + type + "' has a non-string 'prefix'");
        }
        prefix = prefix_it->get<std::string>();
    }

    // GATHER modes fix the field count.
    if (mode == NormalizationMode::GatherList && fields.size() != 1) {
        throw ConfigurationError("Type '" + type + "' uses GATHER_LIST and must declare exactly 1 field");
    }
    if (mode == NormalizationMode::GatherListTailFlag && fields.size() != 2) {
        throw ConfigurationError("Type '" + type +
                                 "' uses GATHER_LIST_TAIL_FLAG and must declare exactly 2 fields");
    }
    return StaticFieldHints(std::move(fields), mode, std::move(prefix));
}

} // anonymous namespace

// ============================================================================
// HintCatalog
// ============================================================================

HintCatalog HintCatalog::builtin() {
    using M = NormalizationMode;
    HintCatalog c;
    auto declare = [&c](const std::string& type, std::vector<std::string> fields,
                        M mode = M::Default) {
        c.add(type, StaticFieldHints(std::move(fields), mode));
    };
    // Predicates
    declare("After", {"datetime"});
    declare("Before", {"datetime"});
    declare("Between", {"datetime1", "datetime2"});
    declare("Cookie", {"name", "regexp"});
    declare("Header", {"header", "regexp"});
    declare("Host", {"patterns"}, M::GatherList);
    declare("Method", {"methods"}, M::GatherList);
    declare("Path", {"patterns", "matchTrailingSlash"}, M::GatherListTailFlag);
    declare("Query", {"param", "regexp"});
    declare("RemoteAddr", {"sources"}, M::GatherList);
    declare("Weight", {"group", "weight"});
    // Filters
    declare("AddRequestHeader", {"name", "value"});
    declare("RewritePath", {"regexp", "replacement"});
    declare("SetStatus", {"status"});
    declare("StripPrefix", {"parts"});
    return c;
}

void HintCatalog::add(const std::string& type, StaticFieldHints hints) {
    types_[type] = std::move(hints);
}

std::optional<StaticFieldHints> HintCatalog::find(const std::string& type) const {
    auto it = types_.find(type);
    if (it == types_.end()) return std::nullopt;
    return it->second;
}

const StaticFieldHints& HintCatalog::at(const std::string& type) const {
    auto it = types_.find(type);
    if (it == types_.end()) {
        throw ConfigurationError("No field hints declared for type '" + type + "'");
    }
    return it->second;
}

bool HintCatalog::contains(const std::string& type) const {
    return types_.find(type) != types_.end();
}

std::vector<std::string> HintCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(types_.size());
    for (const auto& [name, hints] : types_) out.push_back(name);
    return out;
}

void HintCatalog::merge(const HintCatalog& other) {
    for (const auto& [name, hints] : other.types_) {
        types_[name] = hints;
    }
}

StaticFieldHints select_hints(const HintCatalog& catalog, const std::string& type,
                              const std::optional<std::string>& fields,
                              const std::optional<std::string>& mode) {
    std::optional<StaticFieldHints> declared = catalog.find(type);
    std::string prefix = declared ? declared->prefix() : "";

    if (fields) {
        NormalizationMode m = mode ? parse_mode(*mode) : NormalizationMode::Default;
        return StaticFieldHints(split(*fields, ','), m, prefix);
    }
    if (!declared) {
        return catalog.at(type);
    }
    if (mode) {
        return StaticFieldHints(declared->fields(), parse_mode(*mode), prefix);
    }
    return *declared;
}

HintCatalog catalog_from_value(const Value& doc) {
    if (!doc.is_object()) {
        throw ConfigurationError("Catalog document must be an object, got " + type_name(doc));
    }
    auto types_it = doc.find("types");
    if (types_it == doc.end()) {
        throw ConfigurationError("Catalog document has no 'types' table");
    }
    if (!types_it->is_object()) {
        throw ConfigurationError("'types' must be an object, got " + type_name(*types_it));
    }

    HintCatalog catalog;
    for (auto it = types_it->begin(); it != types_it->end(); ++it) {
        catalog.add(it.key(), hints_from_value(it.key(), it.value()));
    }
    return catalog;
}

// ============================================================================
// File loading
// ============================================================================

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_document_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext != ".json" && ext != ".toml") {
        throw ConfigurationError("Unsupported file type: " + ext + " (expected .json or .toml)");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }
    return ext == ".json" ? parse_json_stream(in, path) : parse_toml_stream(in, path);
}

HintCatalog load_catalog_file(const std::string& path) {
    return catalog_from_value(load_document_file(path));
}

} // namespace shortcut
