#include <cxxopts.hpp>
#include <iostream>
#include <iterator>
#include <sstream>
#include <nlohmann/json.hpp>
#include "docpath/Document.hpp"
#include "docpath/Errors.hpp"
#include "docpath/Loader.hpp"
#include "docpath/Parse.hpp"

using nlohmann::json;
using namespace docpath;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("docpath", "Read & mutate JSON/TOML documents via delimited paths");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("f,file", "Path to JSON/TOML document", cxxopts::value<std::string>())
            ("json", "Inline JSON document (used when --file is absent)", cxxopts::value<std::string>())
            ("s,separator", "Path separator", cxxopts::value<std::string>()->default_value("."))
            ("o,out", "Write the mutated document to this file", cxxopts::value<std::string>())
            ("i,in-place", "Write the mutated document back to --file")
            ("indent", "JSON indentation", cxxopts::value<int>()->default_value("2"))
            ("toml", "Print documents as TOML instead of JSON")
            ("string", "Store VALUE as a plain string instead of a JSON literal")
            ("v,verbose", "Trace operations on stderr")
            ("h,help", "Show help");

        // Command + its arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get PATH | exists PATH | create PATH VALUE | update PATH VALUE | delete PATH | dump\n";
            return 0;
        }

        const bool verbose = result.count("verbose") > 0;
        const bool as_toml = result.count("toml") > 0;
        const int indent = result["indent"].as<int>();
        const ValueMode value_mode = result.count("string") ? ValueMode::String : ValueMode::Json;
        const std::string separator = result["separator"].as<std::string>();

        auto trace = [&](const std::string& msg) {
            if (verbose) std::cerr << "[docpath] " << msg << "\n";
        };

        // Parse subcommand
        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        auto has_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        // Load the document
        Document doc;
        if (result.count("file")) {
            const std::string file = result["file"].as<std::string>();
            trace("loading " + file);
            doc = Document::load(file, separator);
        } else if (result.count("json")) {
            doc = Document::parse(result["json"].as<std::string>(), separator);
        } else {
            trace("reading document from stdin");
            std::string text{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
            doc = Document(parse_json_document(text, "<stdin>"), separator);
        }

        auto print_value = [&](const json& v) {
            if (as_toml && v.is_object()) {
                std::cout << to_toml_string(v) << "\n";
            } else {
                std::cout << v.dump(indent) << "\n";
            }
        };

        // Emit the document after a mutation
        auto emit = [&]() -> int {
            if (result.count("out")) {
                const std::string out = result["out"].as<std::string>();
                doc.save(out, indent);
                trace("wrote " + out);
            } else if (result.count("in-place")) {
                if (!result.count("file")) {
                    std::cerr << "Error: --in-place requires --file\n";
                    return 1;
                }
                const std::string file = result["file"].as<std::string>();
                doc.save(file, indent);
                trace("wrote " + file);
            } else {
                print_value(doc.data());
            }
            return 0;
        };

        // GET
        if (cmd == "get") {
            if (!has_args(2)) return 1;
            trace("get '" + cmdv[1] + "' (separator '" + doc.separator() + "')");
            print_value(doc.get(cmdv[1]));
            return 0;
        }

        // EXISTS
        if (cmd == "exists") {
            if (!has_args(2)) return 1;
            bool ok = doc.contains(cmdv[1]);
            std::cout << (ok ? "true" : "false") << "\n";
            return ok ? 0 : 1;
        }

        // CREATE
        if (cmd == "create") {
            if (!has_args(3)) return 1;
            json parsed = parse_value(cmdv[2], value_mode);
            trace("create '" + cmdv[1] + "' = " + parsed.dump());
            doc.create(cmdv[1], parsed);
            return emit();
        }

        // UPDATE
        if (cmd == "update") {
            if (!has_args(3)) return 1;
            json parsed = parse_value(cmdv[2], value_mode);
            trace("update '" + cmdv[1] + "' = " + parsed.dump());
            doc.update(cmdv[1], parsed);
            return emit();
        }

        // DELETE
        if (cmd == "delete") {
            if (!has_args(2)) return 1;
            trace("delete '" + cmdv[1] + "'");
            doc.remove(cmdv[1]);
            return emit();
        }

        // DUMP
        if (cmd == "dump") {
            print_value(doc.data());
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const DocpathError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
