#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include "shapeql/CanonicalTree.hpp"
#include "shapeql/Codec.hpp"
#include "shapeql/Delivery.hpp"
#include "shapeql/Document.hpp"
#include "shapeql/Errors.hpp"
#include "shapeql/Loader.hpp"
#include "shapeql/Parse.hpp"
#include "shapeql/Settings.hpp"

using namespace shapeql;

namespace {

Value slots_to_json(const std::vector<DeferredSlot>& slots) {
    Value out = Value::array();
    for (const auto& slot : slots) {
        Value entry = Value::object();
        entry["path"] = path_to_json(slot.path);
        entry["label"] = slot.label ? Value(*slot.label) : Value();
        out.push_back(entry);
    }
    return out;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("shapeql", "Compile query documents and decode responses against them");
        options.positional_help("COMMAND");

        options.add_options()
            ("s,schema", "Schema interchange file (JSON)", cxxopts::value<std::string>())
            ("d,document", "Document interchange file (JSON)", cxxopts::value<std::string>())
            ("o,operation", "Operation name (default: the only operation)", cxxopts::value<std::string>()->default_value(""))
            ("p,payload", "Payload or value file (JSON)", cxxopts::value<std::string>())
            ("variables", "Variables file (JSON)", cxxopts::value<std::string>())
            ("patches", "File holding a JSON array of incremental patches", cxxopts::value<std::string>())
            ("c,config", "Path to JSON/TOML settings", cxxopts::value<std::string>())
            ("set", "Settings override KEY=VALUE (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("partial", "Decode with error recovery")
            ("v,verbose", "Log at debug level")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: tree | decode [--partial] | encode | stream --patches FILE | config\n";
            return 0;
        }

        spdlog::set_default_logger(spdlog::stderr_color_mt("shapeql"));

        SettingsOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (result.count("set")) {
            for (const auto& item : result["set"].as<std::vector<std::string>>()) {
                auto [key, value] = parse_assignment(item);
                load.overrides[key] = value;
            }
        }

        const std::string cmd = result["command"].as<std::vector<std::string>>().front();
        if (cmd != "config") {
            load.mandatory.push_back("codec.catch_all");
        }

        Settings settings = Settings::load(load);
        spdlog::set_level(result.count("verbose") ? spdlog::level::debug : settings.log_level());

        if (cmd == "config") {
            std::cout << settings.data().dump(2) << "\n";
            return 0;
        }

        auto require = [&](const std::string& name) {
            if (!result.count(name)) {
                throw ShapeError("--" + name + " is required for '" + cmd + "'");
            }
            return result[name].as<std::string>();
        };

        const Schema schema = Schema::from_json(load_json_file(require("schema")));
        const Document document = document_from_json(load_json_file(require("document")));
        const CanonicalTree tree = compile_operation(schema, document,
                                                     result["operation"].as<std::string>(),
                                                     settings.tree_options());
        const ScalarRegistry scalars = ScalarRegistry::from_settings(settings);
        const Value variables = result.count("variables")
            ? load_json_file(result["variables"].as<std::string>())
            : Value::object();

        if (cmd == "tree") {
            std::cout << tree.describe().dump(2) << "\n";
            return 0;
        }

        if (cmd == "decode") {
            const Value payload = load_json_file(require("payload"));
            const DecodedResponse decoded = result.count("partial")
                ? decode_partial(tree, payload, scalars, variables)
                : decode(tree, payload, scalars, variables);

            Value out = Value::object();
            out["data"] = decoded.data;
            out["deferred"] = slots_to_json(decoded.deferred);
            if (result.count("partial")) {
                Value errors = Value::array();
                for (const auto& error : decoded.errors) {
                    errors.push_back({{"path", path_to_json(error.path)},
                                      {"message", error.message}});
                }
                out["errors"] = errors;
            }
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        if (cmd == "encode") {
            const Value value = load_json_file(require("payload"));
            std::cout << encode(tree, value, scalars, variables).dump(2) << "\n";
            return 0;
        }

        if (cmd == "stream") {
            const Value payload = load_json_file(require("payload"));
            const Value patches = load_json_file(require("patches"));

            DeliveryMerger merger(tree, scalars, payload, variables);
            Value rejected = Value::array();
            for (const auto& skipped : apply_patches(merger, patches)) {
                std::cerr << "Error: patch " << skipped.index << ": " << skipped.message << "\n";
                rejected.push_back({{"index", skipped.index}, {"message", skipped.message}});
            }

            Value out = Value::object();
            out["data"] = merger.current_result();
            out["complete"] = merger.is_complete();
            out["pending"] = slots_to_json(merger.pending());
            out["rejected"] = rejected;
            std::cout << out.dump(2) << "\n";
            return merger.is_complete() ? 0 : 2;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const MissingMandatoryConfig& mmc) {
        std::cerr << "Error: " << mmc.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
