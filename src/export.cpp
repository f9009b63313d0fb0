#include "export.hpp"
#include "errors.hpp"
#include "model/codec.hpp"
#include "util.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace engram {

MemorySystemSnapshot build_snapshot(Store& store, const std::string& agent_id, uint64_t now) {
    MemorySystemSnapshot snap;
    snap.exported_at = now;
    snap.agent_id = agent_id;

    MemoryFilter all;
    all.include_archived = true;
    snap.memories = store.query_memories(all);
    snap.self_schema = store.get_self_schema(agent_id);
    snap.provenance = store.all_provenance();
    snap.reconsolidation_events = store.all_reconsolidation_events();
    snap.links = store.all_links();
    snap.snapshots = store.list_snapshots(0);
    snap.checksum = compute_checksum(snap);
    return snap;
}

void restrict_snapshot(MemorySystemSnapshot& snapshot, const std::vector<std::string>& memory_ids) {
    std::set<std::string> keep(memory_ids.begin(), memory_ids.end());
    auto kept = [&keep](const std::string& id) { return keep.count(id) > 0; };

    auto& memories = snapshot.memories;
    memories.erase(std::remove_if(memories.begin(), memories.end(),
                                  [&](const Memory& m) { return !kept(m.id); }),
                   memories.end());
    auto& provenance = snapshot.provenance;
    provenance.erase(std::remove_if(provenance.begin(), provenance.end(),
                                    [&](const ProvenanceEntry& e) { return !kept(e.memory_id); }),
                     provenance.end());
    auto& events = snapshot.reconsolidation_events;
    events.erase(std::remove_if(events.begin(), events.end(),
                                [&](const ReconsolidationEvent& e) { return !kept(e.memory_id); }),
                 events.end());
    auto& links = snapshot.links;
    links.erase(std::remove_if(links.begin(), links.end(),
                               [&](const MemoryLink& l) { return !kept(l.from_id) || !kept(l.to_id); }),
                links.end());
    snapshot.checksum = compute_checksum(snapshot);
}

static nlohmann::json snapshot_body(const MemorySystemSnapshot& snap) {
    nlohmann::json j;
    j["exported_at"] = snap.exported_at;
    j["agent_id"] = snap.agent_id;
    j["schema_version"] = snap.schema_version;

    j["memories"] = nlohmann::json::array();
    for (const auto& m : snap.memories) j["memories"].push_back(memory_to_json(m));

    j["self_schema"] = snap.self_schema ? self_schema_to_json(*snap.self_schema)
                                        : nlohmann::json(nullptr);

    j["provenance"] = nlohmann::json::array();
    for (const auto& e : snap.provenance) j["provenance"].push_back(provenance_entry_to_json(e));

    j["reconsolidation_events"] = nlohmann::json::array();
    for (const auto& e : snap.reconsolidation_events) {
        j["reconsolidation_events"].push_back(reconsolidation_event_to_json(e));
    }

    j["links"] = nlohmann::json::array();
    for (const auto& l : snap.links) j["links"].push_back(link_to_json(l));

    j["snapshots"] = nlohmann::json::array();
    for (const auto& s : snap.snapshots) j["snapshots"].push_back(session_snapshot_to_json(s));
    return j;
}

std::string canonical_serialization(const MemorySystemSnapshot& snapshot) {
    return snapshot_body(snapshot).dump();
}

std::string compute_checksum(const MemorySystemSnapshot& snapshot) {
    std::string canonical = canonical_serialization(snapshot);
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(canonical.data()), canonical.size(), hash);

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (unsigned char byte : hash) out << std::setw(2) << static_cast<int>(byte);
    return out.str();
}

nlohmann::json snapshot_to_json(const MemorySystemSnapshot& snapshot) {
    nlohmann::json j = snapshot_body(snapshot);
    j["checksum"] = snapshot.checksum;
    return j;
}

MemorySystemSnapshot snapshot_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw EngramError(ErrorCode::SchemaViolation, "export document is not an object");
    }
    try {
        MemorySystemSnapshot snap;
        snap.exported_at = j.at("exported_at").get<uint64_t>();
        snap.agent_id = j.at("agent_id").get<std::string>();
        snap.schema_version = j.value("schema_version", CURRENT_SCHEMA_VERSION);
        for (const auto& m : j.at("memories")) snap.memories.push_back(memory_from_json(m));
        if (j.contains("self_schema") && !j["self_schema"].is_null()) {
            snap.self_schema = self_schema_from_json(j["self_schema"]);
        }
        for (const auto& e : j.value("provenance", nlohmann::json::array())) {
            snap.provenance.push_back(provenance_entry_from_json(e));
        }
        for (const auto& e : j.value("reconsolidation_events", nlohmann::json::array())) {
            snap.reconsolidation_events.push_back(reconsolidation_event_from_json(e));
        }
        for (const auto& l : j.value("links", nlohmann::json::array())) {
            snap.links.push_back(link_from_json(l));
        }
        for (const auto& s : j.value("snapshots", nlohmann::json::array())) {
            snap.snapshots.push_back(session_snapshot_from_json(s));
        }
        snap.checksum = j.value("checksum", "");
        return snap;
    } catch (const nlohmann::json::exception& e) {
        throw EngramError(ErrorCode::SchemaViolation,
                          std::string("malformed export document: ") + e.what());
    }
}

MemorySystemSnapshot parse_snapshot(const std::string& document) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(document);
    } catch (const nlohmann::json::parse_error& e) {
        throw EngramError(ErrorCode::SchemaViolation, std::string("export is not JSON: ") + e.what());
    }

    MemorySystemSnapshot snap = snapshot_from_json(j);
    std::string expected = compute_checksum(snap);
    if (snap.checksum != expected) {
        throw EngramError(ErrorCode::IntegrityMismatch,
                          "checksum " + snap.checksum + " does not match contents (" + expected + ")");
    }
    return snap;
}

ImportReport import_snapshot(Store& store, const MemorySystemSnapshot& snapshot) {
    ImportReport report;

    for (const auto& m : snapshot.memories) {
        if (store.get_memory(m.id)) continue;
        store.create_memory(m);
        ++report.memories;
    }

    std::set<std::string> known;
    for (const auto& e : store.all_provenance()) known.insert(e.id);
    for (const auto& e : snapshot.provenance) {
        if (!known.insert(e.id).second) continue;
        store.append_provenance(e);
        ++report.provenance;
    }

    known.clear();
    for (const auto& e : store.all_reconsolidation_events()) known.insert(e.id);
    for (const auto& e : snapshot.reconsolidation_events) {
        if (!known.insert(e.id).second) continue;
        store.put_reconsolidation_event(e);
        ++report.reconsolidation_events;
    }

    for (const auto& l : snapshot.links) {
        if (store.add_link(l)) ++report.links;
    }

    known.clear();
    for (const auto& s : store.list_snapshots(0)) known.insert(s.id);
    for (const auto& s : snapshot.snapshots) {
        if (!known.insert(s.id).second) continue;
        store.save_snapshot(s);
        ++report.snapshots;
    }

    if (snapshot.self_schema && !store.get_self_schema(snapshot.self_schema->agent_id)) {
        store.put_self_schema(*snapshot.self_schema);
        report.self_schema = true;
    }
    return report;
}

// ── HTML rendering ──────────────────────────────────────────────

static const char* STYLE = R"css(
body{font-family:system-ui,sans-serif;margin:0;background:#f6f7f9;color:#1d232b}
header{background:#1d232b;color:#fff;padding:16px 24px}
header h1{margin:0;font-size:20px}
header p{margin:4px 0 0;font-size:13px;color:#b8c0cc}
main{max-width:960px;margin:0 auto;padding:16px 24px}
section{margin-bottom:24px}
h2{font-size:16px;border-bottom:1px solid #d9dde3;padding-bottom:4px}
.stats{display:flex;flex-wrap:wrap;gap:8px}
.stat{background:#fff;border:1px solid #d9dde3;border-radius:6px;padding:8px 12px;font-size:13px}
.stat b{display:block;font-size:18px}
.controls{display:flex;gap:8px;margin-bottom:12px}
.controls input,.controls select{padding:6px;font-size:13px}
.memory{background:#fff;border:1px solid #d9dde3;border-left:4px solid #8a94a3;border-radius:6px;padding:10px 12px;margin-bottom:8px}
.memory.critical{border-left-color:#c62828}
.memory.high{border-left-color:#ef6c00}
.memory.low{border-left-color:#c0c6cf}
.memory.archived{opacity:.55}
.meta{font-size:12px;color:#5f6b7a;margin-bottom:4px}
.tag{display:inline-block;background:#eef1f5;border-radius:3px;padding:0 6px;margin-right:4px;font-size:11px}
.empty{color:#5f6b7a;font-style:italic}
button{padding:6px 14px;font-size:13px;cursor:pointer}
)css";

static const char* SCRIPT = R"js(
(function(){
  var data=JSON.parse(document.getElementById('engram-data').textContent);
  var list=document.getElementById('memory-list');
  var more=document.getElementById('show-more');
  var count=document.getElementById('match-count');
  var typeSel=document.getElementById('filter-type');
  var impSel=document.getElementById('filter-importance');
  var search=document.getElementById('filter-search');
  var mems=data.memories.slice().sort(function(a,b){
    if(a.created_at!==b.created_at)return b.created_at-a.created_at;
    return a.id<b.id?-1:(a.id>b.id?1:0);
  });
  var visible=PAGE_SIZE;
  function esc(s){return String(s).replace(/[&<>"']/g,function(c){
    return {'&':'&amp;','<':'&lt;','>':'&gt;','"':'&quot;',"'":'&#39;'}[c];});}
  function matches(m){
    if(typeSel.value&&m.type!==typeSel.value)return false;
    if(impSel.value&&m.importance!==impSel.value)return false;
    var q=search.value.trim().toLowerCase();
    if(!q)return true;
    var hay=[m.content,m.context||''].concat(m.tags||[]).join(' ').toLowerCase();
    return hay.indexOf(q)!==-1;
  }
  function card(m){
    var cls='memory '+m.importance+(m.is_archived?' archived':'');
    var tags=(m.tags||[]).map(function(t){return '<span class="tag">'+esc(t)+'</span>';}).join('');
    return '<div class="'+cls+'"><div class="meta">'+esc(m.type)+' &middot; '+esc(m.importance)+
      ' &middot; '+new Date(m.created_at).toISOString()+'</div><div>'+esc(m.content)+'</div>'+
      (tags?'<div>'+tags+'</div>':'')+'</div>';
  }
  function render(){
    var hits=mems.filter(matches);
    var page=hits.slice(0,visible);
    list.innerHTML=page.length?page.map(card).join(''):'<p class="empty">No memories match.</p>';
    count.textContent=hits.length+' matching';
    more.style.display=hits.length>page.length?'':'none';
  }
  [typeSel,impSel].forEach(function(el){el.addEventListener('change',render);});
  search.addEventListener('input',render);
  more.addEventListener('click',function(){visible+=PAGE_SIZE;render();});
  render();
})();
)js";

static void render_memory_card(std::ostringstream& out, const Memory& m) {
    out << "<div class=\"memory " << importance_to_string(m.importance)
        << (m.is_archived ? " archived" : "") << "\">"
        << "<div class=\"meta\">" << memory_type_to_string(m.type()) << " &middot; "
        << importance_to_string(m.importance) << " &middot; " << iso_timestamp(m.created_at)
        << "</div><div>" << html_escape(m.content) << "</div>";
    if (!m.tags.empty()) {
        out << "<div>";
        for (const auto& tag : m.tags) out << "<span class=\"tag\">" << html_escape(tag) << "</span>";
        out << "</div>";
    }
    out << "</div>\n";
}

static void render_identity(std::ostringstream& out, const SelfSchema& schema) {
    const auto& present = schema.present_self;
    out << "<section id=\"identity\"><h2>Identity</h2>\n";
    if (!schema.autobiographical_narrative.core_summary.empty()) {
        out << "<p>" << html_escape(schema.autobiographical_narrative.core_summary) << "</p>\n";
    }
    if (present.identity_statements.empty() && present.capabilities.empty() &&
        present.values.empty()) {
        out << "<p class=\"empty\">No identity statements yet.</p>\n";
    }
    if (!present.identity_statements.empty()) {
        out << "<ul>\n";
        for (const auto& s : present.identity_statements) {
            out << "<li>" << html_escape(s.statement) << "</li>\n";
        }
        out << "</ul>\n";
    }
    if (!present.capabilities.empty()) {
        out << "<h3>Capabilities</h3><ul>\n";
        for (const auto& c : present.capabilities) {
            out << "<li><b>" << html_escape(c.name) << "</b> (" << html_escape(c.domain) << ", "
                << trajectory_to_string(c.trajectory) << ")</li>\n";
        }
        out << "</ul>\n";
    }
    if (!present.values.empty()) {
        out << "<h3>Values</h3><ul>\n";
        for (const auto& v : present.values) out << "<li>" << html_escape(v.statement) << "</li>\n";
        out << "</ul>\n";
    }
    out << "</section>\n";
}

static void render_snapshots(std::ostringstream& out, const std::vector<SessionSnapshot>& snapshots) {
    constexpr size_t MAX_SNAPSHOTS = 20;
    out << "<section id=\"snapshots\"><h2>Session snapshots</h2>\n";
    if (snapshots.empty()) out << "<p class=\"empty\">No session snapshots.</p>\n";
    for (size_t i = 0; i < snapshots.size() && i < MAX_SNAPSHOTS; ++i) {
        const auto& s = snapshots[i];
        out << "<div class=\"memory\"><div class=\"meta\">"
            << snapshot_importance_to_string(s.importance) << " &middot; "
            << iso_timestamp(s.created_at) << "</div><div><b>" << html_escape(s.name)
            << "</b></div><div>" << html_escape(s.summary) << "</div></div>\n";
    }
    out << "</section>\n";
}

// "</" inside a script element would end it early.
static std::string script_safe(const std::string& json) {
    std::string out;
    out.reserve(json.size());
    for (size_t i = 0; i < json.size(); ++i) {
        if (json[i] == '<' && i + 1 < json.size() && json[i + 1] == '/') {
            out += "<\\/";
            ++i;
        } else {
            out += json[i];
        }
    }
    return out;
}

std::string render_html(const MemorySystemSnapshot& snapshot, const HtmlOptions& options) {
    std::map<std::string, size_t> by_type;
    std::map<std::string, size_t> by_importance;
    size_t archived = 0;
    for (const auto& m : snapshot.memories) {
        ++by_type[memory_type_to_string(m.type())];
        ++by_importance[importance_to_string(m.importance)];
        if (m.is_archived) ++archived;
    }

    ViewProjection view(snapshot.memories, options.page_size);
    ViewPage first = view.apply(view.initial_state());

    std::string agent = options.agent_name.empty() ? snapshot.agent_id : options.agent_name;

    std::ostringstream out;
    out << "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n"
        << "<title>" << html_escape(options.title) << "</title>\n"
        << "<style>" << STYLE << "</style>\n</head>\n<body>\n"
        << "<header><h1>" << html_escape(options.title) << "</h1><p>" << html_escape(agent)
        << " &middot; exported " << iso_timestamp(snapshot.exported_at);
    if (!options.filter.empty()) out << " &middot; filter <code>" << html_escape(options.filter) << "</code>";
    out << " &middot; checksum <code>" << html_escape(snapshot.checksum) << "</code></p></header>\n"
        << "<main>\n";

    out << "<section id=\"stats\"><h2>Overview</h2><div class=\"stats\">\n"
        << "<div class=\"stat\"><b>" << snapshot.memories.size() << "</b>memories</div>\n";
    for (const auto& kv : by_type) {
        out << "<div class=\"stat\"><b>" << kv.second << "</b>" << kv.first << "</div>\n";
    }
    for (const auto& kv : by_importance) {
        out << "<div class=\"stat\"><b>" << kv.second << "</b>" << kv.first << "</div>\n";
    }
    out << "<div class=\"stat\"><b>" << archived << "</b>archived</div>\n"
        << "<div class=\"stat\"><b>" << snapshot.provenance.size() << "</b>provenance events</div>\n"
        << "</div></section>\n";

    if (options.include_identity && snapshot.self_schema) render_identity(out, *snapshot.self_schema);
    if (options.include_snapshots) render_snapshots(out, snapshot.snapshots);

    out << "<section id=\"memories\"><h2>Memories</h2>\n<div class=\"controls\">\n"
        << "<select id=\"filter-type\"><option value=\"\">All types</option>"
        << "<option value=\"episodic\">episodic</option><option value=\"semantic\">semantic</option>"
        << "<option value=\"procedural\">procedural</option></select>\n"
        << "<select id=\"filter-importance\"><option value=\"\">All importance</option>"
        << "<option value=\"critical\">critical</option><option value=\"high\">high</option>"
        << "<option value=\"normal\">normal</option><option value=\"low\">low</option></select>\n"
        << "<input id=\"filter-search\" type=\"search\" placeholder=\"Search\">\n"
        << "<span id=\"match-count\" class=\"meta\">" << first.total_matching << " matching</span>\n"
        << "</div>\n<div id=\"memory-list\">\n";
    if (first.visible.empty()) out << "<p class=\"empty\">No memories match.</p>\n";
    for (const auto& m : first.visible) render_memory_card(out, m);
    out << "</div>\n<button id=\"show-more\"" << (first.has_more ? "" : " style=\"display:none\"")
        << ">Show more</button>\n</section>\n</main>\n";

    out << "<script type=\"application/json\" id=\"engram-data\">"
        << script_safe(snapshot_to_json(snapshot).dump()) << "</script>\n"
        << "<script>var PAGE_SIZE=" << view.page_size() << ";" << SCRIPT << "</script>\n"
        << "</body>\n</html>\n";
    return out.str();
}

void write_export(const std::string& path, const std::string& content) {
    if (!atomic_write_file(path, content)) {
        throw EngramError(ErrorCode::StorageFailure, "failed to write export to " + path);
    }
}

} // namespace engram
