#include "commands.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "model/codec.hpp"
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>

namespace engram {

namespace {

using Handler = std::function<CommandResult(MemoryEngine&, const nlohmann::json&)>;

// Check that a required string field exists. Returns an error result if missing.
std::optional<CommandResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return CommandResult{false, std::string("Missing required parameter: ") + field};
    }
    return std::nullopt;
}

template <typename E>
std::vector<E> enum_list(const nlohmann::json& args, const char* field,
                         std::optional<E> (*parse)(const std::string&)) {
    std::vector<E> out;
    if (!args.contains(field)) return out;
    for (const auto& item : args[field]) {
        std::string s = item.get<std::string>();
        auto value = parse(s);
        if (!value) {
            throw EngramError(ErrorCode::InvalidQuery,
                              std::string("unknown ") + field + " value '" + s + "'");
        }
        out.push_back(*value);
    }
    return out;
}

// Optional non-negative integer argument. Throws InvalidQuery on a
// negative or non-integer value.
template <typename T>
T unsigned_arg(const nlohmann::json& args, const char* field, T fallback) {
    if (!args.contains(field)) return fallback;
    const auto& v = args[field];
    uint64_t u = 0;
    if (v.is_number_unsigned()) {
        u = v.get<uint64_t>();
    } else if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        u = static_cast<uint64_t>(v.get<int64_t>());
    } else {
        throw EngramError(ErrorCode::InvalidQuery,
                          std::string(field) + " must be a non-negative integer");
    }
    if (u > std::numeric_limits<T>::max()) {
        throw EngramError(ErrorCode::InvalidQuery, std::string(field) + " is out of range");
    }
    return static_cast<T>(u);
}

LinkType link_type_arg(const nlohmann::json& args) {
    std::string s = args.value("type", "related_to");
    auto type = link_type_from_string(s);
    if (!type) throw EngramError(ErrorCode::ValidationError, "unknown link type '" + s + "'");
    return *type;
}

QueryCriteria criteria_from_args(const nlohmann::json& args) {
    QueryCriteria c;
    if (args.contains("text") && args["text"].is_string()) c.text = args["text"].get<std::string>();
    c.types = enum_list<MemoryType>(args, "types", memory_type_from_string);
    c.importances = enum_list<Importance>(args, "importances", importance_from_string);
    if (args.contains("tags")) c.tags = args["tags"].get<std::vector<std::string>>();
    if (args.contains("created_after")) c.created_after = unsigned_arg<uint64_t>(args, "created_after", 0);
    if (args.contains("created_before")) c.created_before = unsigned_arg<uint64_t>(args, "created_before", 0);
    if (args.contains("min_confidence")) c.min_confidence = args["min_confidence"].get<double>();
    c.include_archived = args.value("include_archived", false);
    c.limit = unsigned_arg<uint32_t>(args, "limit", c.limit);
    c.offset = args.value("offset", c.offset);
    if (args.contains("sort")) {
        std::string s = args["sort"].get<std::string>();
        auto key = sort_key_from_string(s);
        if (!key) throw EngramError(ErrorCode::InvalidQuery, "unknown sort key '" + s + "'");
        c.sort = *key;
    }
    return c;
}

nlohmann::json memories_to_json(const std::vector<Memory>& memories) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& m : memories) out.push_back(memory_to_json(m));
    return out;
}

nlohmann::json trace_to_json(const BeliefProvenance& trace) {
    nlohmann::json j;
    j["memory"] = memory_to_json(trace.memory);
    j["creation"] = trace.creation ? provenance_entry_to_json(*trace.creation)
                                   : nlohmann::json(nullptr);
    j["derivation_chain"] = nlohmann::json::array();
    for (const auto& step : trace.derivation_chain) {
        j["derivation_chain"].push_back({{"memory_id", step.memory_id},
                                         {"parent_id", step.parent_id},
                                         {"via", step.via},
                                         {"depth", step.depth},
                                         {"resolved", step.resolved}});
    }
    j["modifications"] = nlohmann::json::array();
    for (const auto& e : trace.modifications) j["modifications"].push_back(provenance_entry_to_json(e));
    j["accesses"] = nlohmann::json::array();
    for (const auto& e : trace.accesses) j["accesses"].push_back(provenance_entry_to_json(e));
    j["reconsolidations"] = nlohmann::json::array();
    for (const auto& e : trace.reconsolidations) {
        j["reconsolidations"].push_back(reconsolidation_event_to_json(e));
    }
    j["truncated"] = trace.truncated;
    j["summary"] = trace.summary;
    return j;
}

// ── Handlers ────────────────────────────────────────────────────

CommandResult cmd_create(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "type")) return *err;
    if (auto err = require_string(args, "content")) return *err;

    CreateOptions options;
    if (args.contains("source")) {
        std::string s = args["source"].get<std::string>();
        auto source = creation_source_from_string(s);
        if (!source) return CommandResult{false, "Unknown creation source: " + s};
        options.source = *source;
    }
    if (args.contains("session_id") && args["session_id"].is_string()) {
        options.session_id = args["session_id"].get<std::string>();
    }

    Memory created = engine.create(memory_from_json(args), options);
    return CommandResult{true, memory_to_json(created).dump(2)};
}

CommandResult cmd_get(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "id")) return *err;
    std::string id = args["id"].get<std::string>();
    auto memory = engine.get(id);
    if (!memory) return CommandResult{false, "NotFound: memory '" + id + "' does not exist"};
    return CommandResult{true, memory_to_json(*memory).dump(2)};
}

CommandResult cmd_query(MemoryEngine& engine, const nlohmann::json& args) {
    QueryCriteria criteria = criteria_from_args(args);
    if (args.contains("budget")) {
        auto selection = engine.query_within_budget(criteria, unsigned_arg<uint64_t>(args, "budget", 0));
        nlohmann::json out = {{"memories", memories_to_json(selection.selected)},
                              {"total_cost", selection.total_cost}};
        return CommandResult{true, out.dump(2)};
    }
    return CommandResult{true, memories_to_json(engine.query(criteria)).dump(2)};
}

CommandResult cmd_recall(MemoryEngine& engine, const nlohmann::json& args) {
    QueryCriteria criteria = criteria_from_args(args);
    RetrievalContext context = retrieval_context_from_json(args);
    if (!context.query && criteria.text) context.query = criteria.text;

    nlohmann::json out = nlohmann::json::array();
    for (const auto& outcome : engine.recall(criteria, context)) {
        nlohmann::json item = memory_to_json(outcome.memory);
        if (outcome.window) item["reconsolidation_event_id"] = outcome.window->id;
        out.push_back(std::move(item));
    }
    return CommandResult{true, out.dump(2)};
}

CommandResult cmd_open(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "id")) return *err;
    auto event = engine.open_window(args["id"].get<std::string>(),
                                    retrieval_context_from_json(args));
    return CommandResult{true, reconsolidation_event_to_json(event).dump(2)};
}

CommandResult cmd_update(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "id")) return *err;
    if (auto err = require_string(args, "field")) return *err;
    if (!args.contains("value")) return CommandResult{false, "Missing required parameter: value"};

    FieldUpdate update;
    update.field = args["field"].get<std::string>();
    update.value = args["value"];
    update.reason = args.value("reason", "");
    Memory updated = engine.apply_update(args["id"].get<std::string>(), update);
    return CommandResult{true, memory_to_json(updated).dump(2)};
}

CommandResult cmd_close(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "id")) return *err;
    auto event = engine.close_window(args["id"].get<std::string>());
    return CommandResult{true, reconsolidation_event_to_json(event).dump(2)};
}

CommandResult cmd_link(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "from")) return *err;
    if (auto err = require_string(args, "to")) return *err;
    std::string from = args["from"].get<std::string>();
    std::string to = args["to"].get<std::string>();
    LinkType type = link_type_arg(args);
    if (!engine.link(from, to, type)) {
        return CommandResult{true, "Link already exists: " + from + " -> " + to};
    }
    return CommandResult{true, "Linked " + from + " -> " + to + " (" + link_type_to_string(type) + ")"};
}

CommandResult cmd_unlink(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "from")) return *err;
    if (auto err = require_string(args, "to")) return *err;
    std::string from = args["from"].get<std::string>();
    std::string to = args["to"].get<std::string>();
    if (!engine.unlink(from, to, link_type_arg(args))) {
        return CommandResult{false, "No such link: " + from + " -> " + to};
    }
    return CommandResult{true, "Unlinked " + from + " -> " + to};
}

CommandResult cmd_archive(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "id")) return *err;
    Memory m = engine.archive(args["id"].get<std::string>(), args.value("reason", ""));
    return CommandResult{true, "Archived " + m.id};
}

CommandResult cmd_restore(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "id")) return *err;
    Memory m = engine.restore(args["id"].get<std::string>(), args.value("reason", ""));
    return CommandResult{true, "Restored " + m.id};
}

CommandResult cmd_history(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "id")) return *err;
    nlohmann::json out = nlohmann::json::array();
    for (const auto& entry : engine.history(args["id"].get<std::string>())) {
        out.push_back(provenance_entry_to_json(entry));
    }
    return CommandResult{true, out.dump(2)};
}

CommandResult cmd_trace(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "id")) return *err;
    TraceOptions options;
    options.max_depth = unsigned_arg<uint32_t>(args, "max_depth", options.max_depth);
    options.include_access_history = args.value("include_access_history",
                                                options.include_access_history);
    options.include_reconsolidations = args.value("include_reconsolidations",
                                                  options.include_reconsolidations);
    auto trace = engine.trace_provenance(args["id"].get<std::string>(), options);
    if (args.value("summary_only", false)) return CommandResult{true, trace.summary};
    return CommandResult{true, trace_to_json(trace).dump(2)};
}

CommandResult cmd_export(MemoryEngine& engine, const nlohmann::json& args) {
    std::string format = args.value("format", "json");
    ShareOptions options;
    if (args.contains("query")) options.query = args["query"].get<std::string>();
    if (args.contains("agent_name")) options.agent_name = args["agent_name"].get<std::string>();
    options.with_identity = args.value("with_identity", options.with_identity);
    options.with_snapshots = args.value("with_snapshots", options.with_snapshots);

    std::string content;
    if (format == "json") {
        content = engine.export_json(options);
    } else if (format == "html") {
        content = engine.export_html(options);
    } else {
        return CommandResult{false, "Unknown export format: " + format};
    }

    if (!args.contains("path")) return CommandResult{true, content};
    std::string path = args["path"].get<std::string>();
    write_export(path, content);
    return CommandResult{true, "Exported " + format + " to " + path};
}

CommandResult cmd_import(MemoryEngine& engine, const nlohmann::json& args) {
    if (auto err = require_string(args, "path")) return *err;
    std::string path = args["path"].get<std::string>();
    std::ifstream file(path);
    if (!file) return CommandResult{false, "Cannot read " + path};
    std::stringstream buffer;
    buffer << file.rdbuf();

    ImportReport report = engine.import_json(buffer.str());
    nlohmann::json out = {{"memories", report.memories},
                          {"provenance", report.provenance},
                          {"reconsolidation_events", report.reconsolidation_events},
                          {"links", report.links},
                          {"snapshots", report.snapshots},
                          {"self_schema", report.self_schema}};
    return CommandResult{true, out.dump(2)};
}

CommandResult cmd_schema(MemoryEngine& engine, const nlohmann::json&) {
    return CommandResult{true, self_schema_to_json(engine.self_schema().current()).dump(2)};
}

const std::map<std::string, Handler>& handlers() {
    static const std::map<std::string, Handler> table = {
        {"create", cmd_create},   {"get", cmd_get},         {"query", cmd_query},
        {"recall", cmd_recall},   {"open", cmd_open},       {"update", cmd_update},
        {"close", cmd_close},     {"link", cmd_link},       {"unlink", cmd_unlink},
        {"archive", cmd_archive}, {"restore", cmd_restore}, {"history", cmd_history},
        {"trace", cmd_trace},     {"export", cmd_export},   {"import", cmd_import},
        {"schema", cmd_schema},
    };
    return table;
}

} // namespace

CommandResult run_command(MemoryEngine& engine, const std::string& name,
                          const std::string& args_json) {
    auto it = handlers().find(name);
    if (it == handlers().end()) return CommandResult{false, "Unknown command: " + name};

    nlohmann::json args;
    try {
        args = args_json.empty() ? nlohmann::json::object() : nlohmann::json::parse(args_json);
    } catch (const nlohmann::json::parse_error& e) {
        return CommandResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (!args.is_object()) return CommandResult{false, "Arguments must be a JSON object"};

    try {
        return it->second(engine, args);
    } catch (const EngramError& e) {
        return CommandResult{false, e.what()};
    } catch (const nlohmann::json::exception& e) {
        return CommandResult{false, std::string("Invalid arguments: ") + e.what()};
    }
}

std::string command_usage() {
    return "  create   {type, content, ...}        Store a new memory\n"
           "  get      {id}                        Read one memory (not an access)\n"
           "  query    {text?, types?, ..., budget?} Ranked search (not an access)\n"
           "  recall   {text?, trigger?, ...}      Search and record an access per result\n"
           "  open     {id, trigger?}              Open a lability window\n"
           "  update   {id, field, value, reason?} Change a field inside the window\n"
           "  close    {id}                        Close the window\n"
           "  link     {from, to, type?}           Link two memories\n"
           "  unlink   {from, to, type?}           Remove a link\n"
           "  archive  {id, reason?}               Tombstone a memory\n"
           "  restore  {id, reason?}               Undo an archive\n"
           "  history  {id}                        Provenance entries, oldest first\n"
           "  trace    {id, max_depth?, ...}       Explain why a belief exists\n"
           "  export   {format?, path?, query?, with_identity?, with_snapshots?, agent_name?}\n"
           "                                       JSON or HTML snapshot\n"
           "  import   {path}                      Merge a verified JSON export\n"
           "  schema   {}                          Current self-schema\n";
}

} // namespace engram
