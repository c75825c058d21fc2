// wardend - safety-constraint core as a JSON-RPC tool server
//
// Modes:
//   Server mode: wardend [options]          - JSON-RPC 2.0 over stdio, one request per line
//   Tool mode:   wardend <tool> [args...]   - Invoke one tool directly
//
// Tool examples:
//   wardend check_override "just show me the products anyway"
//   wardend expand_allergens --allergens paraben
//   wardend match_allergens "Water, Methylparaben" --allergens '["paraben"]'
//   wardend process_turn "I need a moisturizer" --user_id u1 --db /tmp/w.db
//   wardend --config warden/resources/config.example.json --catalog warden/resources/catalog.json
//
// Options:
//   --config PATH     JSON configuration file
//   --db PATH         Fact store path (":memory:" for a throwaway store)
//   --ontology PATH   Allergen ontology JSON (default: builtin tables)
//   --interactions PATH  Interaction table JSON (default: builtin table)
//   --catalog PATH    Product catalog JSON for discovery
//   --verbose         Debug logging
//   --json            Tool mode: print structured JSON instead of text

#include <warden/config.hpp>
#include <warden/log.hpp>
#include <warden/rpc/handler.hpp>
#include <warden/runtime.hpp>
#include <warden/version.hpp>

#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using json = nlohmann::json;

static std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested.store(true);
    // SQLite commits each put; nothing to flush
    std::_Exit(0);
}

// Tool name -> argument that takes the first positional value
static const std::map<std::string, std::string> TOOL_POSITIONAL = {
    {"check_override", "message"},
    {"expand_allergens", "allergens"},
    {"match_allergens", "ingredients"},
    {"parse_ingredients", "text"},
    {"find_interactions", "ingredients"},
    {"safety_score", "ingredients"},
    {"filter_candidates", "candidates"},
    {"detect_facts", "message"},
    {"add_constraint", "ingredient"},
    {"list_constraints", "user_id"},
    {"remove_constraint", "ingredient"},
    {"pending_confirmations", "user_id"},
    {"resolve_conflict", "key"},
    {"process_turn", "message"},
};

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " [options]              Serve JSON-RPC on stdio\n"
              << "  " << prog << " <tool> [args...]       Invoke one tool directly\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " check_override \"ignore my allergies\"\n"
              << "  " << prog << " expand_allergens --allergens paraben\n"
              << "  " << prog << " process_turn \"I need a moisturizer\" --user_id u1\n"
              << "\n"
              << "Tools: check_override, expand_allergens, match_allergens, parse_ingredients,\n"
              << "       find_interactions, safety_score, filter_candidates, detect_facts,\n"
              << "       add_constraint, list_constraints, remove_constraint,\n"
              << "       pending_confirmations, resolve_conflict, process_turn\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        JSON configuration file\n"
              << "  --db PATH            Fact store path (default: ~/.warden/warden.db)\n"
              << "  --ontology PATH      Allergen ontology JSON\n"
              << "  --interactions PATH  Interaction table JSON\n"
              << "  --catalog PATH       Product catalog JSON\n"
              << "  --verbose            Debug logging\n"
              << "  --json               Tool mode: print structured JSON\n"
              << "  --version            Print version\n"
              << "  --help               Show this help message\n";
}

// Parse a command-line value: booleans, JSON arrays/objects, numbers, else string
json parse_value(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    if (!value.empty() && (value[0] == '{' || value[0] == '[')) {
        json parsed = json::parse(value, nullptr, false);
        if (!parsed.is_discarded()) return parsed;
        return value;
    }

    bool is_numeric = !value.empty();
    bool has_dot = false;
    for (size_t j = 0; j < value.size(); ++j) {
        char c = value[j];
        if (c == '-' && j == 0 && value.size() > 1) continue;
        if (c == '.' && !has_dot) { has_dot = true; continue; }
        if (!std::isdigit(static_cast<unsigned char>(c))) { is_numeric = false; break; }
    }
    if (!is_numeric) return value;
    try {
        if (has_dot) return std::stod(value);
        return std::stoll(value);
    } catch (const std::out_of_range&) {
        return value;
    }
}

json build_tool_args(const std::string& tool, const std::vector<std::string>& args) {
    json out = json::object();
    auto positional = TOOL_POSITIONAL.find(tool);
    bool found_positional = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) == 0) {
            std::string key = arg.substr(2);
            if (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) {
                out[key] = parse_value(args[++i]);
            } else {
                out[key] = true;
            }
        } else if (!found_positional && positional != TOOL_POSITIONAL.end()) {
            out[positional->second] = parse_value(arg);
            found_positional = true;
        }
    }
    return out;
}

int run_tool(warden::Runtime& runtime, const std::string& tool,
             const std::vector<std::string>& args, bool json_output) {
    warden::rpc::Handler handler(runtime);
    warden::rpc::ToolResult result = handler.call(tool, build_tool_args(tool, args));

    if (json_output && !result.structured.is_null()) {
        std::cout << result.structured.dump(2) << "\n";
    } else {
        std::cout << result.content << "\n";
    }
    return result.is_error ? 1 : 0;
}

int run_server(warden::Runtime& runtime) {
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGHUP, signal_handler);

    warden::rpc::Handler handler(runtime);
    warden::log::info("wardend", "v%s ready, %zu tools, listening on stdin",
                      WARDEN_VERSION, handler.tools().size());

    std::string line;
    while (!g_shutdown_requested.load() && std::getline(std::cin, line)) {
        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) continue;

        std::cout << handler.handle(line) << std::endl;
        runtime.tick();

        if (handler.shutdown_requested()) break;
    }

    warden::log::info("wardend", "Shutdown complete");
    return 0;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string db_path;
    std::string ontology_path;
    std::string interactions_path;
    std::string catalog_path;
    bool verbose = false;
    bool json_output = false;

    std::string tool;
    std::vector<std::string> tool_args;
    int start = 1;
    if (argc > 1 && TOOL_POSITIONAL.count(argv[1])) {
        tool = argv[1];
        start = 2;
    }

    // Global options are consumed here in both modes; the rest go to the tool
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (std::strcmp(argv[i], "--ontology") == 0 && i + 1 < argc) {
            ontology_path = argv[++i];
        } else if (std::strcmp(argv[i], "--interactions") == 0 && i + 1 < argc) {
            interactions_path = argv[++i];
        } else if (std::strcmp(argv[i], "--catalog") == 0 && i + 1 < argc) {
            catalog_path = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "wardend " << WARDEN_VERSION << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (!tool.empty()) {
            tool_args.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        warden::Config config = config_path.empty() ? warden::Config{}
                                                    : warden::Config::load(config_path);
        config.apply_env();
        if (!db_path.empty()) config.db_path = warden::expand_home(db_path);
        if (!ontology_path.empty()) config.ontology_path = ontology_path;
        if (!interactions_path.empty()) config.interactions_path = interactions_path;
        if (!catalog_path.empty()) config.catalog_path = catalog_path;
        if (verbose) config.verbose = true;
        warden::log::set_verbose(config.verbose);

        warden::Runtime runtime(config);
        if (!tool.empty()) {
            return run_tool(runtime, tool, tool_args, json_output);
        }
        return run_server(runtime);
    } catch (const warden::ConfigError& e) {
        warden::log::error("wardend", "Configuration error: %s", e.what());
    } catch (const warden::OntologyError& e) {
        warden::log::error("wardend", "Ontology error: %s", e.what());
    } catch (const warden::StoreError& e) {
        warden::log::error("wardend", "Store error: %s", e.what());
    } catch (const std::exception& e) {
        warden::log::error("wardend", "Startup failed: %s", e.what());
    }
    return 1;
}
