#include "pch.h"
#include "Logging.hpp"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/base_sink.h"
#include "spdlog/pattern_formatter.h"

#include <cctype>
#include <filesystem>

namespace SerialLogging {

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    // Sink that pushes every formatted payload to the LogQueue
    class CaptureSink : public spdlog::sinks::base_sink<std::mutex> {
    public:
        explicit CaptureSink(LogQueue& queue) : logQueue(queue) {}

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            LogLevel level;
            switch (msg.level) {
                case spdlog::level::trace:    level = LogLevel::Trace; break;
                case spdlog::level::debug:    level = LogLevel::Debug; break;
                case spdlog::level::info:     level = LogLevel::Info; break;
                case spdlog::level::warn:     level = LogLevel::Warn; break;
                case spdlog::level::err:      level = LogLevel::Error; break;
                case spdlog::level::critical: level = LogLevel::Critical; break;
                default:                      level = LogLevel::Info; break;
            }

            std::string message = fmt::to_string(msg.payload);
            if (message.empty()) return;

            logQueue.Push(LogMessage(message, level));
        }

        void flush_() override {
            // Nothing to flush for the capture sink
        }

    private:
        LogQueue& logQueue;
    };

    // Static instances
    static std::shared_ptr<spdlog::logger> logger;

    static LogQueue logQueue;
    static bool initialized = false;

    // LogQueue implementation
    void LogQueue::Push(const LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);

        // Remove old messages if queue is full
        while (!queue.empty() && queue.size() >= capacity) {
            queue.pop();
        }

        if (capacity > 0) queue.push(message);
    }

    bool LogQueue::TryPop(LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return false;
        }

        message = queue.front();
        queue.pop();
        return true;
    }

    void LogQueue::Clear() {
        std::lock_guard<std::mutex> lock(mutex);
        std::queue<LogMessage> empty;
        queue.swap(empty);
    }

    size_t LogQueue::Size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

    void LogQueue::SetCapacity(size_t newCapacity) {
        std::lock_guard<std::mutex> lock(mutex);
        capacity = newCapacity;
        while (queue.size() > capacity) queue.pop();
    }

    // Logging system functions
    bool Initialize(const LogOptions& options) {
        if (initialized) {
            return true;
        }

        try {
            std::vector<spdlog::sink_ptr> sinks;

            if (options.console) {
                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_level(spdlog::level::trace);
                console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(console_sink);
            }

            if (options.toFile) {
                std::filesystem::path logPath(options.filePath);
                if (logPath.has_parent_path()) {
                    std::filesystem::create_directories(logPath.parent_path());
                }

                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.filePath, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            }

            logQueue.SetCapacity(options.queueCapacity);
            auto capture_sink = std::make_shared<CaptureSink>(logQueue);
            capture_sink->set_level(spdlog::level::trace);
            capture_sink->set_pattern("%v");
            sinks.push_back(capture_sink);

            logger = std::make_shared<spdlog::logger>("serial", sinks.begin(), sinks.end());
            logger->set_level(ToSpdlogLevel(options.level));
            logger->flush_on(spdlog::level::warn);

            initialized = true;

            LogDebug("Serial logging system initialized");

            return true;
        }
        catch (const std::exception& ex) {
            std::cerr << "[SerialLogging] Failed to initialize logging system: " << ex.what() << "\n";
            logger.reset();
            initialized = false;
            return false;
        }
    }

    void Shutdown() {
        if (!initialized) {
            return;
        }

        LogDebug("Shutting down logging system");

        if (logger) {
            logger->flush();
            logger.reset();
        }

        logQueue.Clear();
        initialized = false;
    }

    bool IsInitialized() {
        return initialized;
    }

    void SetLevel(LogLevel level) {
        if (logger) logger->set_level(ToSpdlogLevel(level));
    }

    bool ParseLogLevel(const std::string& text, LogLevel& out) {
        std::string lower;
        lower.reserve(text.size());
        for (char c : text) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

        if (lower == "trace")                          { out = LogLevel::Trace; return true; }
        if (lower == "debug")                          { out = LogLevel::Debug; return true; }
        if (lower == "info")                           { out = LogLevel::Info; return true; }
        if (lower == "warn" || lower == "warning")     { out = LogLevel::Warn; return true; }
        if (lower == "error" || lower == "err")        { out = LogLevel::Error; return true; }
        if (lower == "critical")                       { out = LogLevel::Critical; return true; }
        return false;
    }

    LogQueue& GetLogQueue() {
        return logQueue;
    }

    // Internal helper for logging
    void Log(LogLevel level, const std::string& message) {
        if (message.empty()) return;

        if (!initialized || !logger) {
            // Logger not initialized or already destroyed - fail silently
            return;
        }

        switch (level) {
            case LogLevel::Trace:    logger->trace(message); break;
            case LogLevel::Debug:    logger->debug(message); break;
            case LogLevel::Info:     logger->info(message); break;
            case LogLevel::Warn:     logger->warn(message); break;
            case LogLevel::Error:    logger->error(message); break;
            case LogLevel::Critical: logger->critical(message); break;
        }
    }

    // Public logging functions
    void LogTrace(const std::string& message) {
        Log(LogLevel::Trace, message);
    }

    void LogDebug(const std::string& message) {
        Log(LogLevel::Debug, message);
    }

    void LogInfo(const std::string& message) {
        Log(LogLevel::Info, message);
    }

    void LogWarn(const std::string& message) {
        Log(LogLevel::Warn, message);
    }

    void LogError(const std::string& message) {
        Log(LogLevel::Error, message);
    }

    void LogCritical(const std::string& message) {
        Log(LogLevel::Critical, message);
    }

}
