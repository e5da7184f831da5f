#include "pch.h"
#include "Logging.hpp"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/base_sink.h"

#include <filesystem>

namespace ArborLogging {

    // Sink that copies every formatted payload into the diagnostic queue
    class DiagnosticSink : public spdlog::sinks::base_sink<std::mutex> {
    public:
        explicit DiagnosticSink(DiagnosticLogQueue& queue) : diagnosticQueue(queue) {}

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

            std::string message(msg.payload.data(), msg.payload.size());
            if (message.empty()) return;

            diagnosticQueue.Push(LogMessage(message, level));
        }

        void flush_() override {
        }

    private:
        DiagnosticLogQueue& diagnosticQueue;
    };

    static std::shared_ptr<spdlog::logger> logger;
    static DiagnosticLogQueue diagnosticLogQueue;
    static std::mutex lifecycleMutex;
    static bool initialized = false;

    static spdlog::level::level_enum ToSpdlog(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    // DiagnosticLogQueue implementation
    void DiagnosticLogQueue::Push(const LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);

        while (queue.size() >= MAX_QUEUE_SIZE) {
            queue.pop_front();
        }

        queue.push_back(message);
    }

    bool DiagnosticLogQueue::TryPop(LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return false;
        }

        message = queue.front();
        queue.pop_front();
        return true;
    }

    std::vector<LogMessage> DiagnosticLogQueue::Drain() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<LogMessage> out(queue.begin(), queue.end());
        queue.clear();
        return out;
    }

    void DiagnosticLogQueue::Clear() {
        std::lock_guard<std::mutex> lock(mutex);
        queue.clear();
    }

    size_t DiagnosticLogQueue::Size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

    bool Initialize(const LoggingOptions& options) {
        std::lock_guard<std::mutex> lock(lifecycleMutex);
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

            if (!options.filePath.empty()) {
                std::filesystem::path logPath(options.filePath);
                if (logPath.has_parent_path()) {
                    std::filesystem::create_directories(logPath.parent_path());
                }

                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.filePath, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            }

            auto diagnostic_sink = std::make_shared<DiagnosticSink>(diagnosticLogQueue);
            diagnostic_sink->set_level(spdlog::level::trace);
            diagnostic_sink->set_pattern("%v");
            sinks.push_back(diagnostic_sink);

            logger = std::make_shared<spdlog::logger>("arbor", sinks.begin(), sinks.end());
            logger->set_level(ToSpdlog(options.level));
            logger->flush_on(spdlog::level::warn);

            initialized = true;
        }
        catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Failed to initialize logging system: " << ex.what() << std::endl;
            logger.reset();
            return false;
        }
        catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Failed to create log directory: " << ex.what() << std::endl;
            logger.reset();
            return false;
        }

        LogDebug("Arbor logging system initialized");
        return true;
    }

    void Shutdown() {
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        if (!initialized) {
            return;
        }

        if (logger) {
            logger->flush();
            logger.reset();
        }

        diagnosticLogQueue.Clear();
        initialized = false;
    }

    bool IsInitialized() {
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        return initialized;
    }

    void SetLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        if (logger) {
            logger->set_level(ToSpdlog(level));
        }
    }

    DiagnosticLogQueue& GetDiagnosticQueue() {
        return diagnosticLogQueue;
    }

    // Internal helper for logging
    static void LogInternal(LogLevel level, const std::string& message) {
        if (message.empty()) {
            return;
        }

        std::shared_ptr<spdlog::logger> current;
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex);
            current = logger;
        }

        // Logger not initialized or already destroyed
        if (!current) {
            return;
        }

        switch (level) {
            case LogLevel::Trace:    current->trace(message); break;
            case LogLevel::Debug:    current->debug(message); break;
            case LogLevel::Info:     current->info(message); break;
            case LogLevel::Warn:     current->warn(message); break;
            case LogLevel::Error:    current->error(message); break;
            case LogLevel::Critical: current->critical(message); break;
            case LogLevel::Off:      break;
        }
    }

    void LogTrace(const std::string& message) {
        LogInternal(LogLevel::Trace, message);
    }

    void LogDebug(const std::string& message) {
        LogInternal(LogLevel::Debug, message);
    }

    void LogInfo(const std::string& message) {
        LogInternal(LogLevel::Info, message);
    }

    void LogWarn(const std::string& message) {
        LogInternal(LogLevel::Warn, message);
    }

    void LogError(const std::string& message) {
        LogInternal(LogLevel::Error, message);
    }

    void LogCritical(const std::string& message) {
        LogInternal(LogLevel::Critical, message);
    }

    const char* ToString(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return "trace";
            case LogLevel::Debug:    return "debug";
            case LogLevel::Info:     return "info";
            case LogLevel::Warn:     return "warn";
            case LogLevel::Error:    return "error";
            case LogLevel::Critical: return "critical";
            case LogLevel::Off:      return "off";
        }
        return "info";
    }

    LogLevel LogLevelFromString(const std::string& name, LogLevel fallback) {
        static const std::pair<const char*, LogLevel> names[] = {
            { "trace", LogLevel::Trace }, { "debug", LogLevel::Debug }, { "info", LogLevel::Info },
            { "warn", LogLevel::Warn }, { "error", LogLevel::Error }, { "critical", LogLevel::Critical },
            { "off", LogLevel::Off }
        };
        for (const auto& entry : names) {
            if (name == entry.first) return entry.second;
        }
        return fallback;
    }
}
