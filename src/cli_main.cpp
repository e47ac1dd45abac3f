#include <cxxopts.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>
#include "shortcut/Catalog.hpp"
#include "shortcut/Errors.hpp"
#include "shortcut/Expression.hpp"
#include "shortcut/Normalizer.hpp"
#include "shortcut/Registry.hpp"
#include "shortcut/Shorthand.hpp"
#include "shortcut/Util.hpp"

using nlohmann::json;
using namespace shortcut;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("shortcut-cpp", "Normalize shorthand predicate/filter declarations");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,catalog", "Path to JSON/TOML catalog of type field hints", cxxopts::value<std::string>())
            ("b,beans", "Path to JSON/TOML file of beans for #{...} expressions", cxxopts::value<std::string>())
            ("hints", "Comma-separated field order, overrides the catalog", cxxopts::value<std::string>())
            ("m,mode", "DEFAULT | GATHER_LIST | GATHER_LIST_TAIL_FLAG, overrides the catalog", cxxopts::value<std::string>())
            ("no-builtin", "Do not preload the built-in gateway types")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: normalize TEXT | tokenize TEXT | types\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        std::string cmd = cmdv[0];

        HintCatalog catalog;
        if (!result.count("no-builtin")) catalog = HintCatalog::builtin();
        if (result.count("catalog")) {
            catalog.merge(load_catalog_file(result["catalog"].as<std::string>()));
        }

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                std::exit(1);
            }
        };

        // TOKENIZE
        if (cmd == "tokenize") {
            expect_args(2);
            ShorthandDefinition def = parse_shorthand(cmdv[1]);
            json args = json::array();
            for (const auto& [key, value] : def.args) {
                args.push_back({{"key", key}, {"value", value ? json(*value) : json(nullptr)}});
            }
            std::cout << json{{"name", def.name}, {"args", args}}.dump(2) << "\n";
            return 0;
        }

        // NORMALIZE
        if (cmd == "normalize") {
            expect_args(2);
            ShorthandDefinition def = parse_shorthand(cmdv[1]);

            std::optional<std::string> fields;
            std::optional<std::string> mode;
            if (result.count("hints")) fields = result["hints"].as<std::string>();
            if (result.count("mode")) mode = result["mode"].as<std::string>();
            StaticFieldHints hints = select_hints(catalog, def.name, fields, mode);

            ServiceRegistry registry;
            if (result.count("beans")) {
                registry = load_registry(load_document_file(result["beans"].as<std::string>()));
            }

            TemplateExpressionResolver resolver;
            NormalizedConfig cfg = normalize(def.args, hints, resolver, registry);
            std::cout << json{{"name", def.name}, {"args", cfg}}.dump(2) << "\n";
            return 0;
        }

        // TYPES
        if (cmd == "types") {
            for (const auto& name : catalog.names()) {
                const StaticFieldHints& h = catalog.at(name);
                std::cout << name << ": [" << join(h.fields(), ", ") << "] "
                          << mode_name(h.mode());
                if (!h.prefix().empty()) std::cout << " prefix=" << h.prefix();
                std::cout << "\n";
            }
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const ShortcutError& se) {
        std::cerr << "Error: " << se.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
