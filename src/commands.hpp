#pragma once
#include <string>

namespace engram {

class MemoryEngine;

struct CommandResult {
    bool success = false;
    std::string output;
};

// Dispatch one named command with a JSON object of arguments. Engine
// errors come back as an unsuccessful result carrying the error name
// and message; nothing escapes as an exception except std::bad_alloc
// and the like.
//
// Commands: create, get, query, recall, open, update, close, link,
// unlink, archive, restore, history, trace, export, import, schema.
CommandResult run_command(MemoryEngine& engine, const std::string& name,
                          const std::string& args_json);

// One line per command, for --help.
std::string command_usage();

} // namespace engram
