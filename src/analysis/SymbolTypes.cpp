#include "analysis/SymbolTypes.h"

std::string occurrenceKindName(OccurrenceKind kind) {
    switch (kind) {
        case OccurrenceKind::Definition: return "definition";
        case OccurrenceKind::Call: return "call";
        case OccurrenceKind::Ref: return "ref";
        case OccurrenceKind::Attr: return "attr";
        case OccurrenceKind::Store: return "store";
    }
    return "ref";
}

std::optional<OccurrenceKind> parseOccurrenceKind(const std::string& name) {
    if (name == "definition") return OccurrenceKind::Definition;
    if (name == "call") return OccurrenceKind::Call;
    if (name == "ref") return OccurrenceKind::Ref;
    if (name == "attr") return OccurrenceKind::Attr;
    if (name == "store") return OccurrenceKind::Store;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const FunctionDecl& f) {
    j = nlohmann::json{
        {"name", f.name},
        {"start", f.start},
        {"end", f.end},
        {"params", f.params},
        {"doc", f.doc},
        {"decorators", f.decorators},
        {"is_async", f.isAsync}
    };
}

void from_json(const nlohmann::json& j, FunctionDecl& f) {
    f.name = j.at("name").get<std::string>();
    f.start = j.value("start", 0);
    f.end = j.value("end", 0);
    f.params = j.value("params", std::vector<std::string>{});
    f.doc = j.value("doc", "");
    f.decorators = j.value("decorators", std::vector<std::string>{});
    f.isAsync = j.value("is_async", false);
}

void to_json(nlohmann::json& j, const ClassDecl& c) {
    j = nlohmann::json{
        {"name", c.name},
        {"start", c.start},
        {"end", c.end},
        {"bases", c.bases},
        {"methods", c.methods},
        {"doc", c.doc}
    };
}

void from_json(const nlohmann::json& j, ClassDecl& c) {
    c.name = j.at("name").get<std::string>();
    c.start = j.value("start", 0);
    c.end = j.value("end", 0);
    c.bases = j.value("bases", std::vector<std::string>{});
    c.methods = j.value("methods", std::vector<std::string>{});
    c.doc = j.value("doc", "");
}

void to_json(nlohmann::json& j, const VariableDecl& v) {
    j = nlohmann::json{{"name", v.name}, {"line", v.line}, {"value", v.value}};
}

void from_json(const nlohmann::json& j, VariableDecl& v) {
    v.name = j.at("name").get<std::string>();
    v.line = j.value("line", 0);
    v.value = j.value("value", "");
}

void to_json(nlohmann::json& j, const ImportDecl& i) {
    j = nlohmann::json{
        {"name", i.name},
        {"alias", i.alias},
        {"source", i.source},
        {"line", i.line},
        {"kind", i.kind}
    };
}

void from_json(const nlohmann::json& j, ImportDecl& i) {
    i.name = j.at("name").get<std::string>();
    i.alias = j.value("alias", "");
    i.source = j.value("source", "");
    i.line = j.value("line", 0);
    i.kind = j.value("kind", "import");
}

void to_json(nlohmann::json& j, const AssignmentDecl& a) {
    j = nlohmann::json{{"target", a.target}, {"line", a.line}, {"value", a.value}};
}

void from_json(const nlohmann::json& j, AssignmentDecl& a) {
    a.target = j.at("target").get<std::string>();
    a.line = j.value("line", 0);
    a.value = j.value("value", "");
}

void to_json(nlohmann::json& j, const AnnotationDecl& a) {
    j = nlohmann::json{{"name", a.name}, {"annotation", a.annotation}, {"line", a.line}};
}

void from_json(const nlohmann::json& j, AnnotationDecl& a) {
    a.name = j.at("name").get<std::string>();
    a.annotation = j.value("annotation", "");
    a.line = j.value("line", 0);
}

void to_json(nlohmann::json& j, const FileSymbolTable& t) {
    j = nlohmann::json{
        {"functions", t.functions},
        {"classes", t.classes},
        {"variables", t.variables},
        {"imports", t.imports},
        {"assignments", t.assignments},
        {"annotations", t.annotations},
        {"confidence", t.confidence},
        {"has_errors", t.hasErrors}
    };
}

void from_json(const nlohmann::json& j, FileSymbolTable& t) {
    t.functions = j.value("functions", std::vector<FunctionDecl>{});
    t.classes = j.value("classes", std::vector<ClassDecl>{});
    t.variables = j.value("variables", std::vector<VariableDecl>{});
    t.imports = j.value("imports", std::vector<ImportDecl>{});
    t.assignments = j.value("assignments", std::vector<AssignmentDecl>{});
    t.annotations = j.value("annotations", std::vector<AnnotationDecl>{});
    t.confidence = j.value("confidence", "exact");
    t.hasErrors = j.value("has_errors", false);
}

// name 是 crossRefs 的键，不重复写入条目
void to_json(nlohmann::json& j, const SymbolOccurrence& o) {
    j = nlohmann::json{{"file", o.file}, {"line", o.line}, {"kind", occurrenceKindName(o.kind)}};
}

void to_json(nlohmann::json& j, const Chunk& c) {
    j = nlohmann::json{
        {"file", c.file},
        {"symbol", c.symbol},
        {"kind", c.kind},
        {"start", c.startLine},
        {"end", c.endLine},
        {"score", c.score},
        {"doc", c.doc},
        {"source", c.source}
    };
}

nlohmann::json graphToJson(const CrossRefGraph& graph) {
    nlohmann::json j;
    j["schema_version"] = graph.schemaVersion;
    j["file_hash"] = graph.fileHash;
    j["file_table"] = graph.fileTable;
    j["cross_refs"] = graph.crossRefs;
    return j;
}

CrossRefGraph graphFromJson(const nlohmann::json& j) {
    CrossRefGraph graph;
    graph.schemaVersion = j.at("schema_version").get<int>();
    graph.fileHash = j.value("file_hash", std::map<std::string, std::string>{});
    graph.fileTable = j.value("file_table", std::map<std::string, FileSymbolTable>{});

    if (j.contains("cross_refs")) {
        for (const auto& [name, entries] : j.at("cross_refs").items()) {
            auto& list = graph.crossRefs[name];
            for (const auto& e : entries) {
                SymbolOccurrence occ;
                occ.name = name;
                occ.file = e.at("file").get<std::string>();
                occ.line = e.value("line", 0);
                occ.kind = parseOccurrenceKind(e.value("kind", "ref")).value_or(OccurrenceKind::Ref);
                list.push_back(std::move(occ));
            }
        }
    }
    return graph;
}
