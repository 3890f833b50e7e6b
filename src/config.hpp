#pragma once

#include "sandbox_path.hpp"
#include "tail_cursor.hpp"
#include <httplib.h>
#include <cstdint>
#include <optional>
#include <string>

namespace sandbox_tail {

enum class Mode {
    Serve,   // Run the log service
    Tail     // Print one remote file to stdout
};

struct Config {
    Mode mode = Mode::Serve;
    bool show_help = false;
    bool verbose = false;

    // Full URL of the files/read endpoint, e.g. http://agent:5051/files/read
    std::string endpoint;
    int timeout_ms = 10000;
    int64_t chunk_size = kDefaultChunkSize;

    // serve
    uint16_t http_port = 8080;
    int poll_interval_ms = 500;

    // tail
    TaskCoordinates coords;        // agent_id is shared with serve
    std::string file = "stdout";
    std::optional<int64_t> tail_lines;
    std::optional<int64_t> limit;
    bool follow = false;
    std::string format = "text";
    httplib::Headers headers;

    // Read settings for tail mode
    ReadConfig read_config() const;
};

struct Endpoint {
    std::string origin;   // scheme://host[:port], what httplib::Client takes
    std::string path;     // request path, "/" when the URL has none
};

// Throws std::invalid_argument for URLs without a scheme or host
Endpoint split_endpoint(const std::string& url);

// Parses "[serve|tail] [options]". Throws std::invalid_argument on unknown
// options, missing values, bad numbers and missing required options.
Config parse_args(int argc, const char* const argv[]);

void print_usage(const char* program);

} // namespace sandbox_tail
