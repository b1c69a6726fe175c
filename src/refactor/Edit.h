#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * 一次原子文本修改。
 * line 为 1-based 行号；[colStart, colEnd) 为相对该行行首的字节偏移，
 * 跨行的 oldText 其 colEnd 会超出该行长度。写入前 oldText 必须与该位置的原文逐字节一致。
 */
struct Edit {
    std::string file;
    int line = 0;
    int colStart = 0;
    int colEnd = 0;
    std::string oldText;
    std::string newText;
    std::string context;
};

struct RenameResult {
    std::string oldName;
    std::string newName;
    std::vector<Edit> edits;
    std::vector<std::string> errors;
    bool applied = false;
};

/** 未改写、需人工确认的低可信度调用点 */
struct FlaggedSite {
    std::string file;
    int line = 0;
    std::string reason;
    std::string context;
};

struct MigrationResult {
    std::string functionName;
    std::vector<std::string> oldParams;
    std::vector<Edit> edits;
    std::vector<FlaggedSite> flagged;
    std::vector<std::string> errors;
    bool applied = false;
};

inline void to_json(nlohmann::json& j, const Edit& e) {
    j = nlohmann::json{
        {"file", e.file},
        {"line", e.line},
        {"col_start", e.colStart},
        {"col_end", e.colEnd},
        {"old_text", e.oldText},
        {"new_text", e.newText},
        {"context", e.context}
    };
}

inline void to_json(nlohmann::json& j, const FlaggedSite& f) {
    j = nlohmann::json{{"file", f.file}, {"line", f.line}, {"reason", f.reason}, {"context", f.context}};
}

inline void to_json(nlohmann::json& j, const RenameResult& r) {
    j = nlohmann::json{
        {"old_name", r.oldName},
        {"new_name", r.newName},
        {"edits", r.edits},
        {"errors", r.errors},
        {"applied", r.applied}
    };
}

inline void to_json(nlohmann::json& j, const MigrationResult& r) {
    j = nlohmann::json{
        {"function", r.functionName},
        {"old_params", r.oldParams},
        {"edits", r.edits},
        {"flagged", r.flagged},
        {"errors", r.errors},
        {"applied", r.applied}
    };
}
