#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class OccurrenceKind {
    Definition,
    Call,
    Ref,
    Attr,
    Store
};

std::string occurrenceKindName(OccurrenceKind kind);
std::optional<OccurrenceKind> parseOccurrenceKind(const std::string& name);

/** 一次标识符出现。file 由图构建器填入，解析器产出时为空 */
struct SymbolOccurrence {
    std::string file;
    int line = 0;
    OccurrenceKind kind = OccurrenceKind::Ref;
    std::string name;
};

struct FunctionDecl {
    std::string name;
    int start = 0;
    int end = 0;
    std::vector<std::string> params; // "*args" / "**kwargs" / "*" 保留星号
    std::string doc;
    std::vector<std::string> decorators;
    bool isAsync = false;
};

struct ClassDecl {
    std::string name;
    int start = 0;
    int end = 0;
    std::vector<std::string> bases;
    std::vector<std::string> methods;
    std::string doc;
};

struct VariableDecl {
    std::string name;
    int line = 0;
    std::string value;
};

struct ImportDecl {
    std::string name;
    std::string alias;
    std::string source;
    int line = 0;
    std::string kind; // "import" | "from" | "require"
};

struct AssignmentDecl {
    std::string target;
    int line = 0;
    std::string value;
};

struct AnnotationDecl {
    std::string name;
    std::string annotation;
    int line = 0;
};

struct FileSymbolTable {
    std::vector<FunctionDecl> functions;
    std::vector<ClassDecl> classes;
    std::vector<VariableDecl> variables;
    std::vector<ImportDecl> imports;
    std::vector<AssignmentDecl> assignments;
    std::vector<AnnotationDecl> annotations;
    std::string confidence = "exact"; // "exact" | "heuristic"
    bool hasErrors = false;

    bool empty() const {
        return functions.empty() && classes.empty() && variables.empty() &&
               imports.empty() && assignments.empty() && annotations.empty();
    }
};

/** 检索的最小单元：一个函数 / 类 / 方法 / 常量 / 代码块 */
struct Chunk {
    std::string file;
    std::string symbol;
    std::string kind; // "function" | "class" | "method" | "variable" | "block"
    int startLine = 0;
    int endLine = 0;
    std::string source;
    std::string doc;
    double score = 0.0;
};

constexpr int kGraphSchemaVersion = 1;

/**
 * @brief 仓库级交叉引用图
 *
 * std::map 保证序列化顺序稳定：同样的文件内容两次构建得到逐字节相同的持久化结果。
 */
struct CrossRefGraph {
    int schemaVersion = kGraphSchemaVersion;
    std::map<std::string, std::string> fileHash;
    std::map<std::string, FileSymbolTable> fileTable;
    std::map<std::string, std::vector<SymbolOccurrence>> crossRefs;
};

void to_json(nlohmann::json& j, const FunctionDecl& f);
void from_json(const nlohmann::json& j, FunctionDecl& f);
void to_json(nlohmann::json& j, const ClassDecl& c);
void from_json(const nlohmann::json& j, ClassDecl& c);
void to_json(nlohmann::json& j, const VariableDecl& v);
void from_json(const nlohmann::json& j, VariableDecl& v);
void to_json(nlohmann::json& j, const ImportDecl& i);
void from_json(const nlohmann::json& j, ImportDecl& i);
void to_json(nlohmann::json& j, const AssignmentDecl& a);
void from_json(const nlohmann::json& j, AssignmentDecl& a);
void to_json(nlohmann::json& j, const AnnotationDecl& a);
void from_json(const nlohmann::json& j, AnnotationDecl& a);
void to_json(nlohmann::json& j, const FileSymbolTable& t);
void from_json(const nlohmann::json& j, FileSymbolTable& t);
void to_json(nlohmann::json& j, const SymbolOccurrence& o);
void to_json(nlohmann::json& j, const Chunk& c);

nlohmann::json graphToJson(const CrossRefGraph& graph);
/** 抛出 nlohmann::json::exception（结构错误）；schemaVersion 由调用方检查 */
CrossRefGraph graphFromJson(const nlohmann::json& j);
