module;
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    [[nodiscard]] std::string_view LevelLabel(Level level);

    // Messages below the threshold are dropped before formatting reaches the
    // sink. Defaults to Debug in debug builds and Info otherwise.
    void SetThreshold(Level level);
    [[nodiscard]] Level GetThreshold();

    // Receives every message at or above the threshold. Calls are serialised.
    using Sink = std::function<void(Level, std::string_view)>;

    // Replaces the sink; an empty function restores the colour console.
    void SetSink(Sink sink);

    void Write(Level level, std::string_view msg);

    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetThreshold() <= Level::Debug)
            Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetThreshold() <= Level::Info)
            Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetThreshold() <= Level::Warning)
            Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }
}
