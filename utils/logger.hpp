// ────────────────────────────────────────────
//  File: logger.hpp · Created by Yash Patel · 6-22-2025
// ────────────────────────────────────────────

#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <mutex>
#include <queue>
#include <thread>
#include <condition_variable>

#define TEMPO_LOG(level, fmt, ...) \
    do { \
        if (tempo::Logger::getInstance().isEnabled(tempo::Logger::Level::level)) \
        { \
            tempo::Logger::getInstance().enqueueLog( \
                tempo::Logger::Level::level, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

// zero runtime overhead for debug and trace logs in release builds
#ifndef NDEBUG
    #define TEMPO_LOG_TRACE(fmt, ...) TEMPO_LOG(Trace, fmt, ##__VA_ARGS__)
    #define TEMPO_LOG_DEBUG(fmt, ...) TEMPO_LOG(Debug, fmt, ##__VA_ARGS__)
#else
    #define TEMPO_LOG_TRACE(fmt, ...) ((void)0)
    #define TEMPO_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define TEMPO_LOG_INFO(fmt, ...)  TEMPO_LOG(Info,  fmt, ##__VA_ARGS__)
#define TEMPO_LOG_WARN(fmt, ...)  TEMPO_LOG(Warn,  fmt, ##__VA_ARGS__)
#define TEMPO_LOG_ERROR(fmt, ...) TEMPO_LOG(Error, fmt, ##__VA_ARGS__)
#define TEMPO_LOG_FATAL(fmt, ...) TEMPO_LOG(Fatal, fmt, ##__VA_ARGS__)

namespace tempo
{
    class Logger
    {
        public:
            // severity levels
            enum class Level : uint8_t
            {
                Trace = 0,
                Debug,
                Info,
                Warn,
                Error,
                Fatal
            };

            // singleton creation
            static Logger& getInstance() noexcept;

            // disable copy and move semantics
            Logger(const Logger&) = delete;
            Logger(Logger&&) = delete;
            Logger& operator=(const Logger&) = delete;
            Logger& operator=(Logger&&) = delete;

            // logging operations
            void enqueueLog(Level level, const char* file, int line, const char* fmt, ...) noexcept;
            void terminate() noexcept;
            void setConsoleOutput(bool enabled) noexcept    { m_consoleOutput.store(enabled); }

            // log level control
            void setMinLevel(Level level) noexcept;
            bool isEnabled(Level level) const noexcept;

            // case-insensitive level name ("trace" ... "fatal"); false leaves out untouched
            static bool levelFromString(std::string_view name, Level& out) noexcept;

        private:
            explicit Logger(const std::string& filename) noexcept;
            ~Logger();

            // internal helpers
            void processQueue() noexcept;
            void flush() noexcept;
            void write(Level level, const std::string& message) noexcept;
            std::string formatLogMessage(Level level, const char* file, int line, const char* message) const;

            static uint8_t levelBit(Level level) noexcept { return static_cast<uint8_t>(1u << static_cast<uint8_t>(level)); }
            static const char* levelToString(Level level) noexcept;
            static std::string getCurrentTimestamp();
            static std::string getFileLine(const char* fullPath, int line);

        private:
            struct LogEntry
            {
                Level       mLevel;
                std::string mMessage;
            };

            mutable std::mutex m_stateMutex;
            mutable std::mutex m_queueMutex;

            std::string             m_filename;
            std::ofstream           m_logStream;
            std::atomic<uint8_t>    m_levelMask;
            std::atomic<bool>       m_consoleOutput;
            std::queue<LogEntry>    m_messageQueue;
            std::condition_variable m_cv;
            std::atomic<bool>       m_shutdown;
            std::thread             m_worker;
    };
}   // namespace tempo
