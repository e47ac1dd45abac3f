/**
 * @file Catalog.hpp
 * @brief Declared field hints per config type, and file loading
 *
 * A catalog maps a shorthand definition name ("Cookie", "Path", ...) to
 * the field order and normalization mode of its config type. Catalogs
 * can be loaded from JSON (nlohmann::json) or TOML (toml++) files:
 *
 * ```toml
 * [types.Cookie]
 * fields = ["name", "regexp"]
 *
 * [types.Path]
 * fields = ["patterns", "matchTrailingSlash"]
 * mode = "GATHER_LIST_TAIL_FLAG"
 * ```
 */

#ifndef SHORTCUT_CATALOG_HPP
#define SHORTCUT_CATALOG_HPP

#include "shortcut/Normalizer.hpp"
#include "shortcut/Value.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shortcut {

/**
 * @brief FieldHintProvider with a fixed field order and mode
 */
class StaticFieldHints : public FieldHintProvider {
public:
    StaticFieldHints() = default;
    explicit StaticFieldHints(std::vector<std::string> fields,
                              NormalizationMode mode = NormalizationMode::Default,
                              std::string prefix = "")
        : fields_(std::move(fields)), mode_(mode), prefix_(std::move(prefix)) {}

    std::vector<std::string> shortcut_field_order() const override { return fields_; }
    NormalizationMode shortcut_type() const override { return mode_; }
    std::string shortcut_field_prefix() const override { return prefix_; }

    const std::vector<std::string>& fields() const noexcept { return fields_; }
    NormalizationMode mode() const noexcept { return mode_; }
    const std::string& prefix() const noexcept { return prefix_; }

private:
    std::vector<std::string> fields_;
    NormalizationMode mode_ = NormalizationMode::Default;
    std::string prefix_;
};

class HintCatalog {
public:
    HintCatalog() = default;

    /**
     * @brief Hints for the common gateway predicates and filters
     */
    static HintCatalog builtin();

    /// Register or replace the hints for a type name.
    void add(const std::string& type, StaticFieldHints hints);

    /// Look up a type; std::nullopt if unknown.
    std::optional<StaticFieldHints> find(const std::string& type) const;

    /**
     * @brief Look up a type
     * @throws ConfigurationError if the type is unknown
     */
    const StaticFieldHints& at(const std::string& type) const;

    bool contains(const std::string& type) const;

    /// Known type names, sorted.
    std::vector<std::string> names() const;

    size_t size() const noexcept { return types_.size(); }

    /**
     * @brief Merge other into this catalog; other's entries win
     */
    void merge(const HintCatalog& other);

private:
    std::map<std::string, StaticFieldHints> types_;
};

/**
 * @brief Pick the hints for a type, applying command-line style overrides
 *
 * - fields given: a comma-separated field order replaces the catalog entry;
 *   mode applies to it (DEFAULT when absent).
 * - only mode given: the catalog entry's fields are kept, its mode replaced.
 * - neither: the catalog entry as declared.
 *
 * A known type keeps its declared prefix in every case.
 *
 * @throws ConfigurationError if the type is unknown and no fields are
 *         given, or the mode name is unknown
 */
StaticFieldHints select_hints(const HintCatalog& catalog, const std::string& type,
                              const std::optional<std::string>& fields,
                              const std::optional<std::string>& mode);

/**
 * @brief Build a catalog from a loaded document
 *
 * Expected shape:
 * { "types": { "<Name>": { "fields": [...], "mode": "...", "prefix": "..." } } }.
 * "mode" is optional and defaults to DEFAULT; "prefix" is optional and
 * defaults to "".
 *
 * @throws ConfigurationError on structural problems
 */
HintCatalog catalog_from_value(const Value& doc);

/**
 * @brief Get file extension (lowercase, including the dot)
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Load a JSON or TOML document, detected by extension
 *
 * @param path Path ending in .json or .toml
 * @return Parsed document as a Value
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError on syntax errors
 * @throws ConfigurationError for any other extension
 */
Value load_document_file(const std::string& path);

/**
 * @brief Load a catalog file (load_document_file + catalog_from_value)
 */
HintCatalog load_catalog_file(const std::string& path);

} // namespace shortcut

#endif // SHORTCUT_CATALOG_HPP
