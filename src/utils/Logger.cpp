#include "utils/Logger.h"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace EdgeShare::Utils {

    Logger& Logger::GetInstance() {
        static Logger instance;
        return instance;
    }

    Logger::Logger() {
        logFile.open("edgeshare.log", std::ios::out | std::ios::app);
        if (!logFile.is_open()) {
            std::cerr << "CRITICAL: Failed to open log file: edgeshare.log" << std::endl;
        }
    }

    Logger::~Logger() {
        if (logFile.is_open()) {
            logFile.close();
        }
    }

    void Logger::Log(const std::string& message, LogLevel level) {
        Sink currentSink;
        std::string formatted;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (level < minLevel) {
                return;
            }
            formatted = FormatMessage(message, level);
            logs.push_back(formatted);
            if (logs.size() > MAX_HISTORY) {
                logs.erase(logs.begin(), logs.begin() + (logs.size() - MAX_HISTORY));
            }

            if (consoleOutput) {
                std::cout << formatted << std::endl;
            }
            if (logFile.is_open()) {
                logFile << formatted << std::endl;
            }
            currentSink = sink;
        }
        // Sink runs unlocked so it may log back into us.
        if (currentSink) {
            currentSink(level, formatted);
        }
    }

    void Logger::Debug(const std::string& message) {
        Log(message, LogLevel::Debug);
    }

    void Logger::Info(const std::string& message) {
        Log(message, LogLevel::Info);
    }

    void Logger::Warning(const std::string& message) {
        Log(message, LogLevel::Warning);
    }

    void Logger::Error(const std::string& message) {
        Log(message, LogLevel::Error);
    }

    void Logger::Critical(const std::string& message) {
        Log(message, LogLevel::Critical);
    }

    void Logger::Trace(const std::string& message) {
        Log(message, LogLevel::Trace);
    }

    std::vector<std::string> Logger::GetLogs() const {
        std::lock_guard<std::mutex> lock(mutex);
        return logs;
    }

    void Logger::SetMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex);
        minLevel = level;
    }

    LogLevel Logger::GetMinLevel() const {
        std::lock_guard<std::mutex> lock(mutex);
        return minLevel;
    }

    void Logger::SetSink(Sink newSink) {
        std::lock_guard<std::mutex> lock(mutex);
        sink = std::move(newSink);
    }

    void Logger::SetConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex);
        consoleOutput = enabled;
    }

    void Logger::Clear() {
        std::lock_guard<std::mutex> lock(mutex);
        logs.clear();
    }

    std::string Logger::FormatMessage(const std::string& message, LogLevel level) {
        auto now = std::chrono::system_clock::now();
        auto now_time_t = std::chrono::system_clock::to_time_t(now);
        std::tm now_tm{};
        localtime_r(&now_time_t, &now_tm);

        std::stringstream ss;
        ss << "[" << std::put_time(&now_tm, "%H:%M:%S") << "] ";
        ss << "[" << LogLevelToString(level) << "] ";
        ss << message;

        return ss.str();
    }

    std::string Logger::LogLevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:
                return "DEBUG";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Warning:
                return "WARNING";
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Critical:
                return "CRITICAL";
            case LogLevel::Trace:
                return "TRACE";
            default:
                return "UNKNOWN";
        }
    }

    std::string Logger::getKeyName(uint8_t vkCode) {
        switch (vkCode) {
            case 0x01: return "MOUSE_LEFT";
            case 0x02: return "MOUSE_RIGHT";
            case 0x04: return "MOUSE_MIDDLE";
            case 0x05: return "MOUSE_BACK";
            case 0x06: return "MOUSE_FORWARD";
            case 0x08: return "BACKSPACE";
            case 0x09: return "TAB";
            case 0x0D: return "ENTER";
            case 0x10: return "SHIFT";
            case 0x11: return "CTRL";
            case 0x12: return "ALT";
            case 0x13: return "PAUSE";
            case 0x14: return "CAPS_LOCK";
            case 0x1B: return "ESC";
            case 0x20: return "SPACE";
            case 0x21: return "PAGE_UP";
            case 0x22: return "PAGE_DOWN";
            case 0x23: return "END";
            case 0x24: return "HOME";
            case 0x25: return "LEFT";
            case 0x26: return "UP";
            case 0x27: return "RIGHT";
            case 0x28: return "DOWN";
            case 0x2C: return "PRINT_SCREEN";
            case 0x2D: return "INSERT";
            case 0x2E: return "DELETE";
            case 0x5B: return "META_LEFT";
            case 0x5C: return "META_RIGHT";
            case 0x5D: return "CONTEXT_MENU";
            case 0xA0: return "SHIFT_LEFT";
            case 0xA1: return "SHIFT_RIGHT";
            case 0xA2: return "CTRL_LEFT";
            case 0xA3: return "CTRL_RIGHT";
            case 0xA4: return "ALT_LEFT";
            case 0xA5: return "ALT_RIGHT";
            default:
                if (vkCode >= 0x70 && vkCode <= 0x87) {
                    return "F" + std::to_string(vkCode - 0x70 + 1);
                }
                if ((vkCode >= 0x30 && vkCode <= 0x39) || (vkCode >= 0x41 && vkCode <= 0x5A)) {
                    return std::string(1, static_cast<char>(vkCode));
                }
                return "VK_" + std::to_string(vkCode);
        }
    }
}
