#pragma once

#include <string>
#include <functional>
#include <mutex>
#include <atomic>

namespace sandbox_tail {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Error = 2
};

// Process-wide log sink shared by the service, the cursors and the CLI
class ServerLog {
public:
    using Sink = std::function<void(LogLevel level,
                                     const std::string& component,
                                     const std::string& message)>;

    static void set_sink(Sink sink);
    static void set_verbose(bool verbose);
    static bool verbose() { return verbose_; }

    static void debug(const std::string& component, const std::string& message);
    static void log(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Default sink: "<UTC time> [component] message" to stdout, errors to stderr
    static void console_sink(LogLevel level, const std::string& component,
                             const std::string& message);

private:
    static void write(LogLevel level, const std::string& component, const std::string& message);

    static Sink sink_;
    static std::mutex mutex_;
    static std::atomic<bool> verbose_;
};

} // namespace sandbox_tail
