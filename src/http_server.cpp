#include "http_server.hpp"
#include "formatters.hpp"
#include "server_log.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

namespace sandbox_tail {

namespace {

// SSE comment sent when a followed file stays quiet this long
constexpr int kPingIntervalMs = 15000;

const char* kTaskLogRoute =
    R"(/logs/v2/task/frameworks/([^/]+)/executors/([^/]+)/runs/([^/]+)(?:/tasks/([^/]+))?/([^/]+))";

int64_t positive_param(const httplib::Request& req, const std::string& name) {
    const std::string value = req.get_param_value(name);
    size_t used = 0;
    int64_t n = 0;
    try {
        n = std::stoll(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size() || n <= 0) {
        throw std::invalid_argument(name + " must be a positive integer, got '" + value + "'");
    }
    return n;
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.status = status;
    res.set_content(error.dump(), kContentTypeJSON);
}

} // namespace

HttpServer::HttpServer(uint16_t port, std::shared_ptr<httplib::Client> upstream, ServiceOptions options)
    : server_(std::make_unique<httplib::Server>())
    , upstream_(std::move(upstream))
    , options_(std::move(options))
    , port_(port)
{
    if (!upstream_) {
        throw std::invalid_argument("HttpServer requires an upstream client");
    }
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

size_t HttpServer::active_streams() const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return streams_.size();
}

void HttpServer::setup_routes() {
    // Requests no route answered; log routes report their own failures
    server_->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        ServerLog::log("HTTP", std::to_string(res.status) + " " + req.method + " " + req.path +
                       " from " + req.remote_addr + " (agent " + options_.agent_id + ")");
        send_error(res, res.status, "no log route for " + req.path);
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json health;
        health["status"] = "ok";
        health["agent_id"] = options_.agent_id;
        health["active_streams"] = active_streams();
        res.set_content(health.dump(), kContentTypeJSON);
    });

    server_->Get(kTaskLogRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_task_log(req, res);
    });
}

void HttpServer::handle_task_log(const httplib::Request& req, httplib::Response& res) {
    TaskCoordinates coords;
    coords.agent_id = options_.agent_id;
    coords.framework_id = req.matches[1].str();
    coords.executor_id = req.matches[2].str();
    coords.container_id = req.matches[3].str();
    coords.task_path = req.matches[4].str();
    const std::string file = req.matches[5].str();

    const std::string accept = req.get_header_value("Accept");
    const uint64_t id = ++stream_counter_;
    const std::string tag = "stream " + std::to_string(id);

    ReadConfig config;
    config.chunk_size = options_.chunk_size;
    config.stream = accept.find(kContentTypeEventStream) != std::string::npos;
    if (req.has_header("Authorization")) {
        config.headers.emplace("Authorization", req.get_header_value("Authorization"));
    }

    CancelToken cancel;
    std::shared_ptr<TailCursor> cursor;
    try {
        if (req.has_param("skip_prev")) {
            config.direction = ReadDirection::BottomToTop;
            config.max_lines = positive_param(req, "skip_prev");
        } else if (req.has_param("limit")) {
            config.max_lines = positive_param(req, "limit");
        }
        cursor = TailCursor::open(upstream_, options_.read_path, coords, file,
                                  formatter_for_accept(accept), config, cancel);
    } catch (const std::invalid_argument& e) {
        ServerLog::error("HTTP", tag + ": " + e.what());
        send_error(res, 400, e.what());
        return;
    } catch (const std::exception& e) {
        ServerLog::error("HTTP", tag + ": unable to open " + coords.file_path(file) + ": " + e.what());
        send_error(res, 502, e.what());
        return;
    }

    ServerLog::log("HTTP", tag + " from " + req.remote_addr + ": " + coords.file_path(file) +
                   " at offset " + std::to_string(cursor->offset()) +
                   (config.stream ? " (follow)" : ""));

    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.emplace(id, cancel);
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        cursor->content_type(),
        [this, cursor, tag](size_t, httplib::DataSink& sink) -> bool {
            return stream_body(*cursor, sink, tag);
        },
        [this, id, cancel, tag](bool success) {
            cancel.cancel();
            {
                std::lock_guard<std::mutex> lock(streams_mutex_);
                streams_.erase(id);
            }
            ServerLog::log("HTTP", tag + (success ? " completed" : " closed"));
        });
}

bool HttpServer::stream_body(TailCursor& cursor, httplib::DataSink& sink, const std::string& tag) {
    const bool event_stream = cursor.content_type() == kContentTypeEventStream;
    int idle_ms = 0;

    while (running_ && sink.is_writable()) {
        PullResult result;
        try {
            result = cursor.pull();
        } catch (const FormatError& e) {
            ServerLog::error("HTTP", tag + ": skipping line: " + e.what());
            continue;
        } catch (const CancelledError& e) {
            ServerLog::log("HTTP", tag + ": " + e.what());
            return false;
        } catch (const FetchError& e) {
            ServerLog::error("HTTP", tag + ": " + e.what());
            return false;
        }

        if (!result.end_of_data()) {
            if (!sink.write(result.data.data(), result.data.size())) {
                return false;
            }
            idle_ms = 0;
            continue;
        }

        if (!cursor.config().stream) {
            sink.done();
            return true;
        }

        // Following: nothing new yet, poll again after a pause
        std::this_thread::sleep_for(std::chrono::milliseconds(options_.poll_interval_ms));
        idle_ms += options_.poll_interval_ms;
        if (event_stream && idle_ms >= kPingIntervalMs) {
            idle_ms = 0;
            const std::string ping = ": ping\n\n";
            if (!sink.write(ping.data(), ping.size())) {
                return false;
            }
        }
    }
    return false;
}

void HttpServer::start(const std::string& host) {
    if (running_) return;

    if (port_ == 0) {
        int bound = server_->bind_to_any_port(host);
        if (bound < 0) {
            throw std::runtime_error("Failed to bind " + host);
        }
        port_ = static_cast<uint16_t>(bound);
    } else if (!server_->bind_to_port(host, port_)) {
        throw std::runtime_error("Failed to bind " + host + ":" + std::to_string(port_));
    }

    running_ = true;
    thread_ = std::thread([this]() {
        ServerLog::log("HTTP", "Serving agent " + options_.agent_id + " on port " + std::to_string(port_));
        server_->listen_after_bind();
    });
}

void HttpServer::stop() {
    if (!running_) return;
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto& stream : streams_) {
            stream.second.cancel();
        }
    }
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace sandbox_tail
