#include "config.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace sandbox_tail {

namespace {

int64_t parse_positive(const std::string& option, const std::string& value) {
    size_t used = 0;
    int64_t n = 0;
    try {
        n = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a number, got '" + value + "'");
    }
    if (used != value.size() || n <= 0) {
        throw std::invalid_argument(option + " expects a positive number, got '" + value + "'");
    }
    return n;
}

int parse_millis(const std::string& option, const std::string& value) {
    int64_t n = parse_positive(option, value);
    if (n > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(option + " out of range");
    }
    return static_cast<int>(n);
}

void add_header(httplib::Headers& headers, const std::string& header) {
    auto colon = header.find(':');
    if (colon == std::string::npos || colon == 0) {
        throw std::invalid_argument("--header expects NAME:VALUE, got '" + header + "'");
    }
    std::string value = header.substr(colon + 1);
    value.erase(0, value.find_first_not_of(' '));
    headers.emplace(header.substr(0, colon), value);
}

} // namespace

ReadConfig Config::read_config() const {
    ReadConfig rc;
    rc.stream = follow;
    rc.headers = headers;
    rc.chunk_size = chunk_size;
    if (tail_lines) {
        rc.direction = ReadDirection::BottomToTop;
        rc.max_lines = *tail_lines;
    } else if (limit) {
        rc.max_lines = *limit;
    }
    return rc;
}

Endpoint split_endpoint(const std::string& url) {
    auto scheme = url.find("://");
    if (scheme == std::string::npos || scheme == 0) {
        throw std::invalid_argument("endpoint must be an absolute URL: " + url);
    }
    auto path_start = url.find('/', scheme + 3);
    Endpoint ep;
    ep.origin = url.substr(0, path_start);
    ep.path = path_start == std::string::npos ? "/" : url.substr(path_start);
    if (ep.origin.size() == scheme + 3) {
        throw std::invalid_argument("endpoint has no host: " + url);
    }
    return ep;
}

Config parse_args(int argc, const char* const argv[]) {
    Config config;
    int i = 1;

    if (i < argc) {
        std::string first = argv[i];
        if (first == "serve") {
            config.mode = Mode::Serve;
            ++i;
        } else if (first == "tail") {
            config.mode = Mode::Tail;
            ++i;
        }
    }

    auto value = [&](const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(option + " requires a value");
        }
        return argv[++i];
    };

    for (; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "--endpoint") {
            config.endpoint = value(arg);
        }
        else if (arg == "--agent-id") {
            config.coords.agent_id = value(arg);
        }
        else if (arg == "--timeout-ms") {
            config.timeout_ms = parse_millis(arg, value(arg));
        }
        else if (arg == "--chunk-size") {
            config.chunk_size = parse_positive(arg, value(arg));
        }
        else if (arg == "--http-port" && config.mode == Mode::Serve) {
            int64_t port = parse_positive(arg, value(arg));
            if (port > 65535) {
                throw std::invalid_argument("--http-port out of range");
            }
            config.http_port = static_cast<uint16_t>(port);
        }
        else if (arg == "--poll-interval-ms") {
            config.poll_interval_ms = parse_millis(arg, value(arg));
        }
        else if (arg == "--framework-id" && config.mode == Mode::Tail) {
            config.coords.framework_id = value(arg);
        }
        else if (arg == "--executor-id" && config.mode == Mode::Tail) {
            config.coords.executor_id = value(arg);
        }
        else if (arg == "--container-id" && config.mode == Mode::Tail) {
            config.coords.container_id = value(arg);
        }
        else if (arg == "--task-path" && config.mode == Mode::Tail) {
            config.coords.task_path = value(arg);
        }
        else if (arg == "--file" && config.mode == Mode::Tail) {
            config.file = value(arg);
        }
        else if ((arg == "-n" || arg == "--lines") && config.mode == Mode::Tail) {
            config.tail_lines = parse_positive(arg, value(arg));
        }
        else if (arg == "--limit" && config.mode == Mode::Tail) {
            config.limit = parse_positive(arg, value(arg));
        }
        else if ((arg == "-f" || arg == "--follow") && config.mode == Mode::Tail) {
            config.follow = true;
        }
        else if (arg == "--format" && config.mode == Mode::Tail) {
            config.format = value(arg);
            if (config.format != "text" && config.format != "json" && config.format != "sse") {
                throw std::invalid_argument("--format must be text, json or sse");
            }
        }
        else if (arg == "--header" && config.mode == Mode::Tail) {
            add_header(config.headers, value(arg));
        }
        else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (config.endpoint.empty()) {
        throw std::invalid_argument("--endpoint is required");
    }
    split_endpoint(config.endpoint);  // throws on a malformed URL
    if (config.coords.agent_id.empty()) {
        throw std::invalid_argument("--agent-id is required");
    }
    if (config.tail_lines && config.limit) {
        throw std::invalid_argument("-n and --limit cannot be combined");
    }
    return config;
}

void print_usage(const char* program) {
    std::cout << "sandbox-tail - tail task sandbox files through an agent's files/read endpoint\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program << " serve --endpoint URL --agent-id ID [options]\n";
    std::cout << "  " << program << " tail --endpoint URL --agent-id ID --framework-id ID\n";
    std::cout << "      --executor-id ID --container-id ID [options]\n\n";
    std::cout << "Common options:\n";
    std::cout << "  --endpoint URL          files/read URL (e.g. http://agent:5051/files/read)\n";
    std::cout << "  --agent-id ID           Agent whose sandboxes are read\n";
    std::cout << "  --timeout-ms MS         Connect/read timeout per request (default: 10000)\n";
    std::cout << "  --chunk-size BYTES      Bytes per read request (default: 65536)\n";
    std::cout << "  --poll-interval-ms MS   Follow-mode poll interval (default: 500)\n";
    std::cout << "  --verbose               Log every read request\n";
    std::cout << "  --help                  Show this help message\n\n";
    std::cout << "serve options:\n";
    std::cout << "  --http-port PORT        Port for the log service (default: 8080)\n\n";
    std::cout << "tail options:\n";
    std::cout << "  --task-path ID          Task inside a pod executor\n";
    std::cout << "  --file NAME             Sandbox file (default: stdout)\n";
    std::cout << "  -n, --lines N           Start N lines before the end\n";
    std::cout << "  --limit N               Stop after N lines\n";
    std::cout << "  -f, --follow            Keep printing appended lines\n";
    std::cout << "  --format FMT            text, json or sse (default: text)\n";
    std::cout << "  --header NAME:VALUE     Extra request header, repeatable\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " tail --endpoint http://10.0.0.5:5051/files/read --agent-id S0 \\\n";
    std::cout << "      --framework-id F0 --executor-id E0 --container-id C0 -n 100 -f\n";
}

} // namespace sandbox_tail
