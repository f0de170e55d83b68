module;

#include <iostream>
#include <mutex>
#include <string_view>
#include <utility>

module Core;

namespace Core::Log
{
    namespace
    {
        // Global lock to prevent scrambled output from multiple threads
        std::mutex s_LogMutex;
        Level s_MinLevel = Level::Debug;
        SinkFn s_Sink;
    }

    void SetMinLevel(Level level)
    {
        std::lock_guard lock(s_LogMutex);
        s_MinLevel = level;
    }

    Level GetMinLevel()
    {
        std::lock_guard lock(s_LogMutex);
        return s_MinLevel;
    }

    void SetSink(SinkFn sink)
    {
        std::lock_guard lock(s_LogMutex);
        s_Sink = std::move(sink);
    }

    void Write(Level level, std::string_view msg)
    {
        SinkFn sink;
        {
            std::lock_guard lock(s_LogMutex);
            if (level < s_MinLevel)
                return;

            // ANSI Color Codes
            const char* color = "\033[0m";
            const char* label = "[INFO] ";

            switch (level) {
            case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
            case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
            case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
            case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
            }

            std::cout << color << label << msg << "\033[0m" << std::endl;
            sink = s_Sink;
        }

        if (sink)
            sink(level, msg);
    }
}
