// ────────────────────────────────────────────
//  File: logger.cpp · Created by Yash Patel · 6-22-2025
// ────────────────────────────────────────────

#include "logger.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>
#include <vector>

#include "core/tempo_config.hpp"

namespace
{
    constexpr size_t kStackBufferSize = 1024;
    constexpr size_t kFileLineWidth   = 28;

    // levels enabled by default; trace and debug only in debug builds
#ifndef NDEBUG
    constexpr tempo::Logger::Level kDefaultMinLevel = tempo::Logger::Level::Trace;
#else
    constexpr tempo::Logger::Level kDefaultMinLevel = tempo::Logger::Level::Info;
#endif

    uint8_t maskFrom(tempo::Logger::Level minLevel) noexcept
    {
        uint8_t mask = 0;
        for (int lvl = static_cast<int>(minLevel); lvl <= static_cast<int>(tempo::Logger::Level::Fatal); ++lvl)
        {
            mask |= static_cast<uint8_t>(1u << lvl);
        }
        return mask;
    }
}

namespace tempo
{
    Logger& Logger::getInstance() noexcept
    {
        static Logger instance(config::kLogFile);
        return instance;
    }

    Logger::Logger(const std::string& filename) noexcept
        : m_filename(filename)
        , m_logStream(m_filename, std::ios::out | std::ios::trunc)
        , m_levelMask(maskFrom(kDefaultMinLevel))
        , m_consoleOutput(false)
        , m_shutdown(false)
        , m_worker(&Logger::processQueue, this)
    {
        if (!m_logStream.is_open())
        {
            std::cerr << "Logger: failed to open log file: " << m_filename << std::endl;
        }
    }

    Logger::~Logger()
    {
        terminate();
    }

    void Logger::enqueueLog(Level level, const char* file, int line, const char* fmt, ...) noexcept
    {
        if (!isEnabled(level) || m_shutdown.load())
        {
            return;
        }

        char stackBuffer[kStackBufferSize];

        va_list args;
        va_start(args, fmt);
        const int len = std::vsnprintf(stackBuffer, kStackBufferSize, fmt, args);
        va_end(args);

        if (len < 0)
        {
            return;
        }

        try
        {
            std::string formatted;
            if (static_cast<size_t>(len) < kStackBufferSize)
            {
                formatted = formatLogMessage(level, file, line, stackBuffer);
            }
            else
            {
                // long message, format again into a heap buffer
                std::vector<char> heapBuffer(static_cast<size_t>(len) + 1);
                va_list args2;
                va_start(args2, fmt);
                std::vsnprintf(heapBuffer.data(), heapBuffer.size(), fmt, args2);
                va_end(args2);
                formatted = formatLogMessage(level, file, line, heapBuffer.data());
            }

            {
                std::lock_guard<std::mutex> lock(m_queueMutex);
                m_messageQueue.push({ level, std::move(formatted) });
            }
            m_cv.notify_one();
        }
        catch (const std::exception& e)
        {
            std::cerr << "Logger: dropped message: " << e.what() << std::endl;
        }
    }

    void Logger::flush() noexcept
    {
        std::queue<LogEntry> pending;
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            std::swap(pending, m_messageQueue);
        }

        while (!pending.empty())
        {
            write(pending.front().mLevel, pending.front().mMessage);
            pending.pop();
        }

        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_logStream.is_open())
        {
            m_logStream.flush();
        }
    }

    void Logger::terminate() noexcept
    {
        {
            std::scoped_lock lock(m_stateMutex, m_queueMutex);
            if (m_shutdown.load()) return;
            m_shutdown.store(true);
        }

        // worker drains the queue before it exits
        m_cv.notify_one();
        if (m_worker.joinable())
        {
            m_worker.join();
        }

        flush();

        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_logStream.is_open())
        {
            m_logStream.close();
        }
    }

    void Logger::setMinLevel(Level level) noexcept
    {
        m_levelMask.store(maskFrom(level));
    }

    bool Logger::isEnabled(Level level) const noexcept
    {
        return (m_levelMask.load() & levelBit(level)) != 0;
    }

    bool Logger::levelFromString(std::string_view name, Level& out) noexcept
    {
        for (int lvl = static_cast<int>(Level::Trace); lvl <= static_cast<int>(Level::Fatal); ++lvl)
        {
            const std::string_view candidate(levelToString(static_cast<Level>(lvl)));
            if (candidate.size() != name.size())
            {
                continue;
            }

            bool match = true;
            for (size_t i = 0; i < name.size() && match; ++i)
            {
                match = (std::tolower(static_cast<unsigned char>(name[i])) == std::tolower(static_cast<unsigned char>(candidate[i])));
            }

            if (match)
            {
                out = static_cast<Level>(lvl);
                return true;
            }
        }

        return false;
    }

    void Logger::processQueue() noexcept
    {
        std::unique_lock<std::mutex> queueLock(m_queueMutex);
        while (true)
        {
            m_cv.wait(queueLock, [this] { return !m_messageQueue.empty() || m_shutdown.load(); });
            while (!m_messageQueue.empty())
            {
                LogEntry entry = std::move(m_messageQueue.front());
                m_messageQueue.pop();

                // release the queue during I/O so producers never block on the file
                queueLock.unlock();
                write(entry.mLevel, entry.mMessage);
                queueLock.lock();
            }

            if (m_shutdown.load())
            {
                break;
            }
        }
    }

    void Logger::write(Level level, const std::string& message) noexcept
    {
        const bool critical = (level == Level::Error || level == Level::Fatal);

        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_logStream.is_open())
            {
                m_logStream << message << "\n";
                if (critical)
                {
                    m_logStream.flush();
                }
            }
        }

        if (m_consoleOutput.load())
        {
            std::ostream& out = (level >= Level::Warn) ? std::cerr : std::cout;
            out << message << "\n";
        }
    }

    std::string Logger::formatLogMessage(Level level, const char* file, int line, const char* message) const
    {
        std::ostringstream tid;
        tid << std::this_thread::get_id();

        std::string fileLine = getFileLine(file, line);
        if (fileLine.length() < kFileLineWidth)
            fileLine.append(kFileLineWidth - fileLine.length(), ' ');

        std::string levelStr(levelToString(level));
        if (levelStr.length() < 5)
            levelStr.append(5 - levelStr.length(), ' ');

        std::string out;
        out.reserve(96 + fileLine.size() + std::char_traits<char>::length(message));
        out += getCurrentTimestamp();
        out += " | TID ";
        out += tid.str();
        out += " | ";
        out += levelStr;
        out += " | ";
        out += fileLine;
        out += " | ";
        out += message;
        return out;
    }

    const char* Logger::levelToString(Level level) noexcept
    {
        switch (level)
        {
            case Level::Trace:
                return "Trace";
            case Level::Debug:
                return "Debug";
            case Level::Info:
                return "Info";
            case Level::Warn:
                return "Warn";
            case Level::Error:
                return "Error";
            case Level::Fatal:
                return "Fatal";
            default:
                return "Unknown";
        }
    }

    std::string Logger::getCurrentTimestamp()
    {
        using namespace std::chrono;

        const auto now = system_clock::now();
        const auto seconds = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

        std::tm timeInfo{};
        #ifdef _WIN32
            localtime_s(&timeInfo, &seconds);
        #else
            localtime_r(&seconds, &timeInfo);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&timeInfo, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::string Logger::getFileLine(const char* fullPath, int line)
    {
        std::string_view path(fullPath);
        const size_t lastSlash = path.find_last_of("/\\");
        const std::string_view filename = (lastSlash != std::string_view::npos) ? path.substr(lastSlash + 1) : path;
        return std::string(filename) + ":" + std::to_string(line);
    }
}   // namespace tempo
