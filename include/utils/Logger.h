#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <fstream>
#include <functional>
#include <cstdint>

namespace EdgeShare::Utils {
    enum class LogLevel {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical
    };

    class Logger {
    public:
        using Sink = std::function<void(LogLevel level, const std::string& formatted)>;

        static Logger& GetInstance();

        void Log(const std::string& message, LogLevel level = LogLevel::Info);
        void Debug(const std::string& message);
        void Info(const std::string& message);
        void Warning(const std::string& message);
        void Error(const std::string& message);
        void Critical(const std::string& message);
        void Trace(const std::string& message);

        std::vector<std::string> GetLogs() const;

        // Messages below the minimum level are dropped before formatting.
        void SetMinLevel(LogLevel level);
        LogLevel GetMinLevel() const;

        // Additional receiver for every formatted line; pass an empty sink to detach.
        void SetSink(Sink sink);

        void SetConsoleOutput(bool enabled);

        static std::string getKeyName(uint8_t vkCode);
        static std::string LogLevelToString(LogLevel level);

        void Clear();

    private:
        Logger();
        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static constexpr size_t MAX_HISTORY = 2000;

        std::vector<std::string> logs;
        mutable std::mutex mutex;
        std::ofstream logFile;
        Sink sink;
        LogLevel minLevel = LogLevel::Debug;
        bool consoleOutput = true;

        std::string FormatMessage(const std::string& message, LogLevel level);
    };
}
