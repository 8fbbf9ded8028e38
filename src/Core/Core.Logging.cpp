module;

#include <functional>
#include <iostream>
#include <mutex>
#include <string_view>
#include <utility>

module Core.Logging;

namespace Core::Log
{
    namespace
    {
        // Global lock to prevent scrambled output from multiple threads
        std::mutex s_LogMutex;

#ifndef NDEBUG
        Level s_MinLevel = Level::Debug;
#else
        Level s_MinLevel = Level::Info;
#endif
        SinkFn s_Sink;

        void PrintColored(Level level, std::string_view msg)
        {
            // ANSI Color Codes
            const char* color = "\033[0m";
            const char* label = "[INFO]";

            switch (level) {
            case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
            case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
            case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
            case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
            }

            std::cout << color << label << msg << "\033[0m" << std::endl;
        }
    }

    void SetLevel(Level level)
    {
        std::lock_guard lock(s_LogMutex);
        s_MinLevel = level;
    }

    Level GetLevel()
    {
        std::lock_guard lock(s_LogMutex);
        return s_MinLevel;
    }

    void SetSink(SinkFn sink)
    {
        std::lock_guard lock(s_LogMutex);
        s_Sink = std::move(sink);
    }

    bool IsEnabled(Level level)
    {
        std::lock_guard lock(s_LogMutex);
        return static_cast<int>(level) >= static_cast<int>(s_MinLevel);
    }

    void Write(Level level, std::string_view msg)
    {
        std::lock_guard lock(s_LogMutex);
        if (s_Sink)
        {
            s_Sink(level, msg);
            return;
        }
        PrintColored(level, msg);
    }
}
