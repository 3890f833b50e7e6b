#include "server_log.hpp"
#include <iostream>
#include <chrono>
#include <ctime>

namespace sandbox_tail {

ServerLog::Sink ServerLog::sink_ = ServerLog::console_sink;
std::mutex ServerLog::mutex_;
std::atomic<bool> ServerLog::verbose_{false};

void ServerLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void ServerLog::set_verbose(bool verbose) {
    verbose_ = verbose;
}

void ServerLog::debug(const std::string& component, const std::string& message) {
    if (!verbose_) return;
    write(LogLevel::Debug, component, message);
}

void ServerLog::log(const std::string& component, const std::string& message) {
    write(LogLevel::Info, component, message);
}

void ServerLog::error(const std::string& component, const std::string& message) {
    write(LogLevel::Error, component, message);
}

void ServerLog::write(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(level, component, message);
    }
}

void ServerLog::console_sink(LogLevel level, const std::string& component,
                             const std::string& message) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm);

    std::ostream& out = level == LogLevel::Error ? std::cerr : std::cout;
    out << stamp << " [" << component << "] ";
    if (level == LogLevel::Debug) {
        out << "(debug) ";
    }
    out << message << std::endl;
}

} // namespace sandbox_tail
