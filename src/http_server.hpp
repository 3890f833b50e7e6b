#pragma once

#include "cancel_token.hpp"
#include "tail_cursor.hpp"
#include <httplib.h>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sandbox_tail {

struct ServiceOptions {
    std::string agent_id;            // Agent whose sandboxes this service reads
    std::string read_path;           // Path of files/read on the upstream client
    int64_t chunk_size = kDefaultChunkSize;
    int poll_interval_ms = 500;      // Follow-mode wait after an empty pull
};

// Serves task sandbox files as plain text, JSON lines or server-sent events:
//
//   GET /logs/v2/task/frameworks/<fw>/executors/<ex>/runs/<container>[/tasks/<task>]/<file>
//       ?skip_prev=N   last N lines
//       ?limit=N       first N lines
//   Accept: text/event-stream keeps the response open and follows the file.
class HttpServer {
public:
    // upstream is shared by every request's cursor
    HttpServer(uint16_t port, std::shared_ptr<httplib::Client> upstream, ServiceOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds synchronously (port 0 picks a free port) and serves on a thread.
    // Throws std::runtime_error if the port cannot be bound.
    void start(const std::string& host = "0.0.0.0");
    void stop();

    uint16_t port() const { return port_; }
    size_t active_streams() const;

private:
    void setup_routes();
    void handle_task_log(const httplib::Request& req, httplib::Response& res);
    bool stream_body(TailCursor& cursor, httplib::DataSink& sink, const std::string& tag);

    std::unique_ptr<httplib::Server> server_;
    std::shared_ptr<httplib::Client> upstream_;
    ServiceOptions options_;
    uint16_t port_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    // In-flight responses, cancelled on stop()
    mutable std::mutex streams_mutex_;
    std::map<uint64_t, CancelToken> streams_;
    std::atomic<uint64_t> stream_counter_{0};
};

} // namespace sandbox_tail
