#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace apphys
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    // Case-insensitive parse of "error", "warn", "info", "debug", "trace", "off".
    inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept
    {
        auto eq = [s](std::string_view name)
        {
            if (s.size() != name.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < s.size(); ++i)
            {
                char c = s[i];
                if (c >= 'A' && c <= 'Z')
                {
                    c = static_cast<char>(c - 'A' + 'a');
                }
                if (c != name[i])
                {
                    return false;
                }
            }
            return true;
        };

        if (eq("error"))
            return LogLevel::Error;
        if (eq("warn") || eq("warning"))
            return LogLevel::Warn;
        if (eq("info"))
            return LogLevel::Info;
        if (eq("debug"))
            return LogLevel::Debug;
        if (eq("trace"))
            return LogLevel::Trace;
        if (eq("off") || eq("none"))
            return LogLevel::Off;
        return std::nullopt;
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    class Logger
    {
    public:
        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        LogLevel level() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_level;
        }

        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        // Lets callers skip building expensive arguments.
        bool enabled(LogLevel lvl) const { return log_enabled(level(), lvl); }

        // Line format: "[+<seconds since first use>][LEVEL][component] message".
        void logf(LogLevel lvl, const char *component, const char *fmt, ...)
        {
            if (!enabled(lvl))
            {
                return;
            }

            char buf[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);

            const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_start).count();

            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_sink)
            {
                return;
            }
            std::fprintf(m_sink, "[+%.3f][%s][%s] %s\n", elapsed, log_level_name(lvl), component ? component : "-", buf);
            std::fflush(m_sink);
        }

    private:
        Logger() = default;

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Warn;
        FILE *m_sink = stderr;
        const std::chrono::steady_clock::time_point m_start = std::chrono::steady_clock::now();
    };
}
