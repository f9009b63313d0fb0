#include "commands.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "store.hpp"
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>

static void print_usage() {
    std::cout << "Usage: engram [options] <command> [json-args]\n"
              << "\n"
              << "Options:\n"
              << "  --db PATH            Use a specific store file\n"
              << "  --backend NAME       Storage backend (sqlite, json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Commands:\n"
              << engram::command_usage()
              << "\n"
              << "Pass '-' as json-args to read the arguments from stdin.\n"
              << "\n"
              << "Environment variables:\n"
              << "  ENGRAM_DB_PATH       Store file (default: ~/.engram/memory.db)\n"
              << "  ENGRAM_BACKEND       Storage backend\n"
              << "  ENGRAM_AGENT_ID      Agent whose self-schema is used\n";
}

int main(int argc, char* argv[]) try {
    std::string db_path;
    std::string backend;
    std::string command;
    std::string args_json;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (std::strcmp(argv[i], "--backend") == 0 && i + 1 < argc) {
            backend = argv[++i];
        } else if (command.empty() && argv[i][0] != '-') {
            command = argv[i];
        } else if (!command.empty() && args_json.empty()) {
            args_json = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }
    if (args_json == "-") {
        args_json.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto config = engram::Config::load();
    if (!db_path.empty()) config.storage.path = db_path;
    if (!backend.empty()) config.storage.backend = backend;

    auto store = engram::create_store(config);
    engram::StoreSession session(*store);
    engram::MemoryEngine engine(session.store(), config);

    auto result = engram::run_command(engine, command, args_json);
    if (!result.success) {
        std::cerr << "Error: " << result.output << "\n";
        return 1;
    }
    std::cout << result.output << "\n";
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
