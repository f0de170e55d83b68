module;
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    // Ordered by severity so SetMinLevel() can filter with a single compare.
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    // Optional observer for every message that passes the level filter.
    // Invoked after the console write, outside the log lock, so a sink may log again.
    using SinkFn = std::function<void(Level, std::string_view)>;

    void SetMinLevel(Level level);
    [[nodiscard]] Level GetMinLevel();

    // Pass an empty function to detach the current sink.
    void SetSink(SinkFn sink);

    void Write(Level level, std::string_view msg);

    [[nodiscard]] constexpr std::string_view LevelToString(Level level)
    {
        switch (level)
        {
        case Level::Debug:   return "Debug";
        case Level::Info:    return "Info";
        case Level::Warning: return "Warning";
        case Level::Error:   return "Error";
        }
        return "Unknown";
    }

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args) {
        Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args) {
        Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args) {
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args) {
#ifndef NDEBUG
        Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
