/**
 * @file bliss_cli.cpp
 * @brief Command-line front end for the Bliss engine
 *
 * Dictionary, semantic tables and language come from BLISS_DICT_PATH,
 * BLISS_SEMANTICS_PATH and BLISS_LANGUAGE; --dict, --semantics and --lang
 * override each one separately.
 * Results are printed to stdout as JSON; diagnostics go to stderr.
 */

#include <engine/bliss_engine.hpp>
#include <config/engine_config.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Bliss;

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--dict path] [--semantics path] [--lang code] <command> [args]\n";
    std::cerr << "\nCommands:\n";
    std::cerr << "  gloss <id>                         glosses and explanation of a symbol\n";
    std::cerr << "  glosses <id|marker>...             glosses of every symbol in a composition\n";
    std::cerr << "  classify <id|marker>...            role assignment\n";
    std::cerr << "  analyze <id|marker>...             roles, glosses and combined semantics\n";
    std::cerr << "  structure <id|marker>...           structural breakdown\n";
    std::cerr << "  context <id> [id|marker]...        glosses and type of a symbol, roles of its context\n";
    std::cerr << "  compose <spec.json>                compose from a semantic specification\n";
    std::cerr << "  compose-ids <classifier> [-s id]... [-m id]... [-i id]...\n";
    std::cerr << "  info <id>                          symbol details and role type\n";
    std::cerr << "  stats                              dictionary statistics\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " analyze 14647 14905 24920 9011\n";
    std::cerr << "  " << prog << " compose-ids 14905 -s 24920 -m 14647 -i 9011\n";
}

static nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open " + path);
    return nlohmann::json::parse(file);
}

int main(int argc, char** argv) {
    EngineConfig config;
    std::string dict_arg, sem_arg, lang_arg;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--dict" || a == "--semantics" || a == "--lang") && i + 1 < argc) {
            std::string v = argv[++i];
            if (a == "--dict") dict_arg = v;
            else if (a == "--semantics") sem_arg = v;
            else lang_arg = v;
        } else if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(a);
        }
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        // Flags override the matching environment variable one by one.
        config = EngineConfig::read_env();
        if (!dict_arg.empty()) config.dictionary_path = dict_arg;
        if (!sem_arg.empty()) config.semantics_path = sem_arg;
        if (!lang_arg.empty()) config.language = lang_arg;
        config.require_paths();

        auto engine = BlissEngine::from_config(config);

        const std::string cmd = args[0];
        const std::vector<std::string> rest(args.begin() + 1, args.end());
        nlohmann::json out;
        int status = 0;

        if (cmd == "gloss" && rest.size() == 1) {
            auto g = engine->symbol_glosses(rest[0], config.language);
            out = g.to_json();
            status = g.error ? 2 : 0;
        } else if (cmd == "glosses" && !rest.empty()) {
            out = engine->composition_glosses(rest, config.language);
        } else if (cmd == "classify" && !rest.empty()) {
            auto roles = engine->classify(rest);
            out = roles.to_json();
            status = roles.ok() ? 0 : 2;
        } else if (cmd == "analyze" && !rest.empty()) {
            auto analysis = engine->analyze_composition(rest, config.language);
            out = analysis.to_json();
            status = analysis.ok() ? 0 : 2;
        } else if (cmd == "structure" && !rest.empty()) {
            out = engine->composition_structure(rest);
        } else if (cmd == "context" && !rest.empty()) {
            const std::vector<std::string> context(rest.begin() + 1, rest.end());
            out = engine->symbol_in_context(rest[0], context, config.language);
            status = out.contains("error") ? 2 : 0;
        } else if (cmd == "compose" && rest.size() == 1) {
            auto spec = read_json_file(rest[0]);
            auto result = engine->compose_from_spec(spec);
            out = result.to_json();
            status = result.ok() ? 0 : 2;
        } else if (cmd == "compose-ids" && !rest.empty()) {
            std::vector<SymbolId> specifiers, modifiers, indicators;
            for (size_t i = 1; i < rest.size(); ++i) {
                if (i + 1 >= rest.size()) throw std::invalid_argument("Missing id after " + rest[i]);
                const std::string& flag = rest[i];
                const std::string& id = rest[++i];
                if (flag == "-s") specifiers.push_back(id);
                else if (flag == "-m") modifiers.push_back(id);
                else if (flag == "-i") indicators.push_back(id);
                else throw std::invalid_argument("Unknown option: " + flag);
            }
            auto result = engine->compose_with_ids(rest[0], specifiers, modifiers, indicators);
            out = result.to_json();
            status = result.ok() ? 0 : 2;
        } else if (cmd == "info" && rest.size() == 1) {
            out = engine->symbol_info(rest[0]);
            status = out.contains("error") ? 2 : 0;
        } else if (cmd == "stats" && rest.empty()) {
            out = engine->knowledge_graph_info();
        } else {
            print_usage(argv[0]);
            return 1;
        }

        std::cout << out.dump(2, ' ', false) << std::endl;
        return status;
    } catch (const std::exception& e) {
        Logger::error(std::string("Error: ") + e.what());
        return 1;
    }
}
