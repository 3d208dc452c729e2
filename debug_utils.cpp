#include "debug_utils.h"

#include <algorithm>
#include <cctype>

// 默认只输出到控制台；日志文件由调用方通过 setLogFile 或 THERMAL_LOG_FILE 指定
DebugLogger::DebugLogger() {
    minLevel_ = parseLogLevel(get_env("THERMAL_LOG_LEVEL", "info"));

    const std::string envFile = get_env("THERMAL_LOG_FILE", "");
    if (!envFile.empty()) {
        setLogFile(envFile);
    }
}

DebugLogger::~DebugLogger() {
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
}

void DebugLogger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.close();
    }

    // 获取当前时间戳
    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    std::tm now_tm = *std::localtime(&now_time);

    std::ostringstream ts;
    ts << "_" << std::put_time(&now_tm, "%Y%m%d_%H%M%S");

    // 拆分文件名（不含扩展名）
    std::string finalName = filename;
    auto pos = filename.find_last_of('.');
    auto slash = filename.find_last_of('/');
    if (pos != std::string::npos && (slash == std::string::npos || pos > slash)) {
        finalName = filename.substr(0, pos) + ts.str() + filename.substr(pos);
    } else {
        finalName = filename + ts.str() + ".log";
    }

    currentLogFile = finalName;
    logFile.open(finalName, std::ios::app);

    if (!logFile.is_open()) {
        std::cerr << "Error: Could not open log file: " << finalName << std::endl;
    }
}

void DebugLogger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex);
    minLevel_ = level;
}

void DebugLogger::log(const std::string& message, LogLevel level) {
    if (static_cast<int>(level) < static_cast<int>(minLevel_)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    std::tm now_tm = *std::localtime(&now_time);

    std::ostringstream logLine;
    logLine << "[" << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S") << "]["
            << levelToStr(level) << "] " << message << "\n";

    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open())
    {
        logFile << logLine.str();
        logFile.flush();
    }
    // stdout 留给统计结果输出
    if (consoleOutput) std::cerr << logLine.str();
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return fallback;
}

std::string get_env(const std::string& key, const std::string& defv)
{
    if (const char *v = std::getenv(key.c_str()))
        return std::string(v);
    return defv;
}
