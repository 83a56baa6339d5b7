#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unistd.h>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "[ERROR] ";
            case LogLevel::WARNING: return "[WARN] ";
            case LogLevel::INFO: return "[INFO] ";
            case LogLevel::SUCCESS: return "[OK] ";
            default: return "[DEBUG] ";
        }
    }
}

void Logger::writeOut(LogLevel level, const std::string& message) {
    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    if (!logFilePath.empty()) {
        std::ofstream logFile(logFilePath, std::ios::app);
        if (logFile.is_open()) {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            struct tm timeInfo;
            localtime_r(&now, &timeInfo);
            logFile << std::put_time(&timeInfo, "[%Y-%m-%d %H:%M:%S] ") << levelTag(level) << trimmedMsg << std::endl;
        }
    }

    if (!consoleEnabled) return;

    // 只有 stderr 是终端时才上色
    static const bool useColor = isatty(STDERR_FILENO) != 0;
    std::string prefix;
    switch (level) {
        case LogLevel::INFO:
            prefix = useColor ? CYAN + "[Info] " + RESET : "[Info] ";
            break;
        case LogLevel::SUCCESS:
            prefix = useColor ? GREEN + "✔ " + RESET : "[OK] ";
            break;
        case LogLevel::WARNING:
            prefix = useColor ? YELLOW + "⚠ " + RESET : "[Warn] ";
            break;
        case LogLevel::ERROR:
            prefix = useColor ? RED + BOLD + "✖ " + RESET : "[Error] ";
            break;
        case LogLevel::DEBUG:
            prefix = useColor ? GRAY + "[Debug] " + RESET : "[Debug] ";
            break;
    }

    // Handle multi-line messages by prepending prefix to each line
    std::stringstream ss(trimmedMsg);
    std::string line;
    bool first = true;
    while (std::getline(ss, line)) {
        if (first) {
            std::cerr << prefix << line << std::endl;
        } else {
            std::cerr << (useColor ? GRAY + "  │ " + RESET : "  | ") << line << std::endl;
        }
        first = false;
    }
}
