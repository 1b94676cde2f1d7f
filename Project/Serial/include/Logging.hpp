#pragma once

#include <string>
#include <memory>
#include <queue>
#include <mutex>
#include <chrono>
#include <sstream>
#include <utility>

#include "Serial.h"

namespace SerialLogging {

    // Log levels matching spdlog levels
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    // Structure for queued log messages
    struct LogMessage {
        std::string text;
        LogLevel level;
        double timestamp;

        LogMessage(const std::string& message, LogLevel lvl)
            : text(message), level(lvl), timestamp(std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count()) {}
    };

    // Thread-safe bounded queue fed by the capture sink.
    // Tools and tests drain it to observe what the library reported.
    class LogQueue {
    public:
        void Push(const LogMessage& message);
        bool SERIAL_API TryPop(LogMessage& message);
        void Clear();
        size_t Size() const;
        void SetCapacity(size_t capacity);

    private:
        mutable std::mutex mutex;
        std::queue<LogMessage> queue;
        size_t capacity = DEFAULT_CAPACITY;
        static constexpr size_t DEFAULT_CAPACITY = 1000;
    };

    struct LogOptions {
        LogLevel level = LogLevel::Info;
        bool console = true;
        bool toFile = false;
        std::string filePath = "logs/serial.log";
        size_t queueCapacity = 1000;
    };

    // Initialize the logging system. Safe to call more than once; later calls are no-ops.
    SERIAL_API bool Initialize(const LogOptions& options = LogOptions{});

    // Shutdown the logging system
    SERIAL_API void Shutdown();

    SERIAL_API bool IsInitialized();

    SERIAL_API void SetLevel(LogLevel level);

    // Parses "trace", "debug", "info", "warn", "error", "critical" (case-insensitive).
    SERIAL_API bool ParseLogLevel(const std::string& text, LogLevel& out);

    SERIAL_API LogQueue& GetLogQueue();

    // Logging functions
    void SERIAL_API LogTrace(const std::string& message);
    void SERIAL_API LogDebug(const std::string& message);
    void SERIAL_API LogInfo(const std::string& message);
    void SERIAL_API LogWarn(const std::string& message);
    void SERIAL_API LogError(const std::string& message);
    void SERIAL_API LogCritical(const std::string& message);

    void SERIAL_API Log(LogLevel level, const std::string& message);

    template <typename... Args>
    void PrintOutput(LogLevel level, Args&&... parts)
    {
        std::ostringstream os;
        (os << ... << std::forward<Args>(parts));
        Log(level, os.str());
    }

}

#define SERIAL_LOG_TRACE(msg)    SerialLogging::LogTrace(msg)
#define SERIAL_LOG_DEBUG(msg)    SerialLogging::LogDebug(msg)
#define SERIAL_LOG_INFO(msg)     SerialLogging::LogInfo(msg)
#define SERIAL_LOG_WARN(msg)     SerialLogging::LogWarn(msg)
#define SERIAL_LOG_ERROR(msg)    SerialLogging::LogError(msg)
#define SERIAL_LOG_CRITICAL(msg) SerialLogging::LogCritical(msg)

/**
 * @brief Concatenates every argument after the level and logs the result.
 *
 * SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[Serializer] Unknown type ", tag);
 */
#define SERIAL_PRINT(...) SerialLogging::PrintOutput(__VA_ARGS__)
