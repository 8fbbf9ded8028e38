module;
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core.Logging;

export namespace Core::Log {

    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    // Receives the already formatted message. An empty sink restores the console output.
    // Runs under the log lock, so a sink must not log itself.
    using SinkFn = std::function<void(Level, std::string_view)>;

    // Messages below this level are dropped before formatting reaches the sink.
    // Defaults to Debug, or Info when NDEBUG is defined.
    void SetLevel(Level level);
    [[nodiscard]] Level GetLevel();

    void SetSink(SinkFn sink);

    [[nodiscard]] bool IsEnabled(Level level);

    void Write(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args) {
        if (!IsEnabled(Level::Info)) return;
        Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args) {
        if (!IsEnabled(Level::Warning)) return;
        Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args) {
        if (!IsEnabled(Level::Error)) return;
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args) {
#ifndef NDEBUG
        if (!IsEnabled(Level::Debug)) return;
        Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
