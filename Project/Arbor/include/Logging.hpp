#pragma once

#include <string>
#include <memory>
#include <functional>
#include <deque>
#include <mutex>
#include <chrono>
#include <vector>

// Cross-platform API export/import macros
#ifdef _WIN32
#ifdef ARBOR_EXPORTS
#define ARBOR_API __declspec(dllexport)
#else
#define ARBOR_API __declspec(dllimport)
#endif
#else
    // Linux/GCC
#ifdef ARBOR_EXPORTS
#define ARBOR_API __attribute__((visibility("default")))
#else
#define ARBOR_API
#endif
#endif

namespace ArborLogging {

    // Log levels matching spdlog levels
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    // Structure for captured log messages
    struct LogMessage {
        std::string text;
        LogLevel level;
        double timestamp;

        LogMessage(const std::string& message, LogLevel lvl)
            : text(message), level(lvl), timestamp(std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count()) {}
    };

    // Thread-safe bounded queue fed by the diagnostic sink. Oldest messages are dropped first.
    class DiagnosticLogQueue {
    public:
        void Push(const LogMessage& message);
        bool ARBOR_API TryPop(LogMessage& message);
        std::vector<LogMessage> ARBOR_API Drain();
        void Clear();
        size_t Size() const;

    private:
        mutable std::mutex mutex;
        std::deque<LogMessage> queue;
        static constexpr size_t MAX_QUEUE_SIZE = 1000;
    };

    struct LoggingOptions {
        LogLevel level = LogLevel::Info;
        bool console = true;
        // Empty path disables the file sink
        std::string filePath;
    };

    // Initialize the logging system. Safe to call more than once.
    ARBOR_API bool Initialize(const LoggingOptions& options = LoggingOptions{});

    // Shutdown the logging system
    ARBOR_API void Shutdown();

    ARBOR_API bool IsInitialized();

    ARBOR_API void SetLevel(LogLevel level);

    // Messages routed through the logger also land here
    ARBOR_API DiagnosticLogQueue& GetDiagnosticQueue();

    // Logging functions
    void ARBOR_API LogTrace(const std::string& message);
    void ARBOR_API LogDebug(const std::string& message);
    void ARBOR_API LogInfo(const std::string& message);
    void ARBOR_API LogWarn(const std::string& message);
    void ARBOR_API LogError(const std::string& message);
    void ARBOR_API LogCritical(const std::string& message);

    ARBOR_API const char* ToString(LogLevel level);
    ARBOR_API LogLevel LogLevelFromString(const std::string& name, LogLevel fallback = LogLevel::Info);
}

#define ARBOR_LOG_TRACE(msg)    ArborLogging::LogTrace(msg)
#define ARBOR_LOG_DEBUG(msg)    ArborLogging::LogDebug(msg)
#define ARBOR_LOG_INFO(msg)     ArborLogging::LogInfo(msg)
#define ARBOR_LOG_WARN(msg)     ArborLogging::LogWarn(msg)
#define ARBOR_LOG_ERROR(msg)    ArborLogging::LogError(msg)
#define ARBOR_LOG_CRITICAL(msg) ArborLogging::LogCritical(msg)
