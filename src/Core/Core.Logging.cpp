module;

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string_view>
#include <utility>

module Core:Logging.Impl;
import :Logging;

namespace Core::Log
{
    namespace
    {
#ifdef NDEBUG
        std::atomic<Level> s_Threshold{Level::Info};
#else
        std::atomic<Level> s_Threshold{Level::Debug};
#endif
        std::mutex s_SinkMutex;
        Sink s_Sink;

        const char* AnsiColor(Level level)
        {
            switch (level)
            {
            case Level::Debug:   return "\033[36m";
            case Level::Info:    return "\033[32m";
            case Level::Warning: return "\033[33m";
            case Level::Error:   return "\033[31m";
            }
            return "\033[0m";
        }

        // Warnings and errors go to stderr so they survive stdout redirection.
        void WriteConsole(Level level, std::string_view msg)
        {
            std::FILE* stream = level >= Level::Warning ? stderr : stdout;
            std::fprintf(stream, "%s%-7s%.*s\033[0m\n", AnsiColor(level), LevelLabel(level).data(),
                         static_cast<int>(msg.size()), msg.data());
            std::fflush(stream);
        }
    }

    std::string_view LevelLabel(Level level)
    {
        switch (level)
        {
        case Level::Debug:   return "[DBG]";
        case Level::Info:    return "[INFO]";
        case Level::Warning: return "[WARN]";
        case Level::Error:   return "[ERR]";
        }
        return "[?]";
    }

    void SetThreshold(Level level) { s_Threshold.store(level, std::memory_order_relaxed); }
    Level GetThreshold() { return s_Threshold.load(std::memory_order_relaxed); }

    void SetSink(Sink sink)
    {
        std::lock_guard lock(s_SinkMutex);
        s_Sink = std::move(sink);
    }

    void Write(Level level, std::string_view msg)
    {
        if (level < GetThreshold()) return;

        std::lock_guard lock(s_SinkMutex);
        if (s_Sink)
            s_Sink(level, msg);
        else
            WriteConsole(level, msg);
    }
}
