#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

const char* const RESET = "\033[0m";

struct LevelStyle {
    const char* fileTag;   // 日志文件中的级别标记
    const char* color;
    const char* marker;    // 控制台前缀
};

LevelStyle styleFor(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:   return {"[ERROR]", "\033[1m\033[38;5;196m", "✖ "};
        case LogLevel::WARNING: return {"[WARN]", "\033[38;5;226m", "⚠ "};
        case LogLevel::SUCCESS: return {"[OK]", "\033[38;5;46m", "✔ "};
        case LogLevel::DEBUG:   return {"[DEBUG]", "\033[38;5;242m", "[Debug] "};
        case LogLevel::INFO:
        default:                return {"[INFO]", "\033[38;5;51m", "[Info] "};
    }
}

std::string timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace

Logger::Logger() {
    debugEnabled = std::getenv("CODEMAP_DEBUG") != nullptr;
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (logFilePath.empty()) return;
    std::ofstream out(logFilePath, std::ios::app);
    if (!out) return;  // 日志文件不可写时静默放弃，控制台仍然输出
    out << "[" << timestamp() << "] " << styleFor(level).fileTag << " " << message << "\n";
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    const LevelStyle style = styleFor(level);

    std::string body = message;
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) {
        body.pop_back();
    }

    // 多行消息每行都带前缀
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        std::cerr << style.color << style.marker << RESET << line << "\n";
    }
    std::cerr.flush();
}
