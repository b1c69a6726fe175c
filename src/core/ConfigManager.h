#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    /** 路径段与其中任一相同则跳过。以 . 开头的目录始终不扫描（内置） */
    std::vector<std::string> ignoreDirs = {".git", ".venv", "__pycache__", "node_modules", "dist", "build", ".codemap"};
    /** 扫描忽略：正则列表（ECMAScript），相对路径匹配任一则跳过。字面点用 \\. 如 "\\.min\\.js$" */
    std::vector<std::string> ignorePatterns;
    std::vector<std::string> codeExtensions = {".py", ".js", ".jsx", ".ts", ".tsx", ".java"};

    size_t contextBudget = 3000;   // chunk loader 默认字符预算
    size_t chunkFileLimit = 20;    // chunk loader 最多读取的候选文件数
    size_t minSymbolLength = 2;    // 更短的名字不进入 crossRefs

    bool debug = false;
    std::string logFile;

    static constexpr const char* kDataDir = ".codemap";
    static constexpr const char* kConfigFile = "config.json";

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be an object: " + path.string());
        }

        Config cfg;
        try {
            cfg.ignoreDirs = j.value("ignore_dirs", cfg.ignoreDirs);
            cfg.ignorePatterns = j.value("ignore_patterns", cfg.ignorePatterns);
            cfg.codeExtensions = j.value("code_extensions", cfg.codeExtensions);
            cfg.contextBudget = j.value("context_budget", cfg.contextBudget);
            cfg.chunkFileLimit = j.value("chunk_file_limit", cfg.chunkFileLimit);
            cfg.minSymbolLength = j.value("min_symbol_length", cfg.minSymbolLength);
            cfg.debug = j.value("debug", cfg.debug);
            cfg.logFile = j.value("log_file", cfg.logFile);
        } catch (const nlohmann::json::type_error& e) {
            throw std::runtime_error("Invalid value in " + path.string() + ": " + e.what());
        }
        return cfg;
    }

    /** <root>/.codemap/config.json 存在则加载（出错抛异常），否则返回默认配置 */
    static Config loadOrDefault(const std::string& rootPath) {
        std::filesystem::path p = std::filesystem::u8path(rootPath) / kDataDir / kConfigFile;
        std::error_code ec;
        if (!std::filesystem::exists(p, ec)) {
            return Config{};
        }
        return load(p.u8string());
    }
};
