#pragma once

#include "backward_locator.hpp"
#include "chunk_fetcher.hpp"
#include "formatters.hpp"
#include "line.hpp"
#include "sandbox_path.hpp"
#include <httplib.h>
#include <deque>
#include <limits>
#include <memory>
#include <string>

namespace sandbox_tail {

struct ReadConfig {
    ReadDirection direction = ReadDirection::TopToBottom;
    // Lines to emit before end of data; for BottomToTop also the tail size.
    // Ignored for termination when streaming.
    int64_t max_lines = std::numeric_limits<int64_t>::max();
    bool stream = false;
    httplib::Headers headers;   // Sent with every read request
    int64_t chunk_size = kDefaultChunkSize;
};

struct PullResult {
    enum class Status {
        Data,
        EndOfData
    };

    Status status = Status::EndOfData;
    std::string data;

    bool end_of_data() const { return status == Status::EndOfData; }
};

// Pull-based reader over a remote file. Every pull() returns at most one
// formatted line and performs at most one fetch. Not safe for concurrent
// pulls; use one cursor per consumer.
class TailCursor {
public:
    // Throws std::invalid_argument on a bad config, FetchError or
    // CancelledError if locating the tail fails.
    TailCursor(std::unique_ptr<ChunkSource> source,
               std::unique_ptr<EntryFormatter> formatter,
               ReadConfig config,
               CancelToken cancel = CancelToken());

    // Reads coords' sandbox file through the files/read endpoint at read_path
    static std::unique_ptr<TailCursor> open(std::shared_ptr<httplib::Client> client,
                                            const std::string& read_path,
                                            const TaskCoordinates& coords,
                                            const std::string& file,
                                            std::unique_ptr<EntryFormatter> formatter,
                                            ReadConfig config,
                                            CancelToken cancel = CancelToken());

    TailCursor(const TailCursor&) = delete;
    TailCursor& operator=(const TailCursor&) = delete;

    // Next formatted line, or EndOfData. In streaming mode EndOfData means
    // "nothing new yet" and pull() may be called again later.
    // Throws FetchError, CancelledError or FormatError.
    PullResult pull();

    int64_t offset() const { return offset_; }
    int64_t emitted() const { return emitted_; }
    const ReadConfig& config() const { return config_; }
    std::string content_type() const { return formatter_->content_type(); }

private:
    bool refill();

    std::unique_ptr<ChunkSource> source_;
    std::unique_ptr<EntryFormatter> formatter_;
    const ReadConfig config_;
    CancelToken cancel_;

    int64_t offset_ = 0;
    std::deque<Line> buffer_;
    int64_t emitted_ = 0;
};

} // namespace sandbox_tail
