#include "tail_cursor.hpp"
#include "line_splitter.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <stdexcept>

namespace sandbox_tail {

TailCursor::TailCursor(std::unique_ptr<ChunkSource> source,
                       std::unique_ptr<EntryFormatter> formatter,
                       ReadConfig config,
                       CancelToken cancel)
    : source_(std::move(source))
    , formatter_(std::move(formatter))
    , config_(std::move(config))
    , cancel_(std::move(cancel))
{
    if (!source_) throw std::invalid_argument("cursor requires a chunk source");
    if (!formatter_) throw std::invalid_argument("cursor requires a formatter");
    if (config_.max_lines <= 0) throw std::invalid_argument("max_lines must be positive");
    if (config_.chunk_size <= 0) throw std::invalid_argument("chunk_size must be positive");

    if (config_.direction == ReadDirection::BottomToTop) {
        offset_ = locate_tail_offset(*source_, config_.max_lines, config_.chunk_size, cancel_);
    }
}

std::unique_ptr<TailCursor> TailCursor::open(std::shared_ptr<httplib::Client> client,
                                             const std::string& read_path,
                                             const TaskCoordinates& coords,
                                             const std::string& file,
                                             std::unique_ptr<EntryFormatter> formatter,
                                             ReadConfig config,
                                             CancelToken cancel) {
    coords.validate();
    if (file.empty()) {
        throw std::invalid_argument("file cannot be empty");
    }

    auto source = std::make_unique<HttpChunkFetcher>(std::move(client), read_path,
                                                     coords.file_path(file), config.headers);
    return std::make_unique<TailCursor>(std::move(source), std::move(formatter),
                                        std::move(config), std::move(cancel));
}

PullResult TailCursor::pull() {
    if (!config_.stream && emitted_ >= config_.max_lines) {
        return PullResult{};
    }

    if (buffer_.empty() && !refill()) {
        return PullResult{};
    }

    Line line = std::move(buffer_.front());
    buffer_.pop_front();

    // A line that fails to format is dropped without using up the limit
    PullResult result;
    result.status = PullResult::Status::Data;
    result.data = formatter_->format_line(line);
    ++emitted_;
    return result;
}

bool TailCursor::refill() {
    RemoteChunk chunk = source_->fetch(offset_, config_.chunk_size, cancel_);
    const int64_t length = static_cast<int64_t>(chunk.data.size());

    // The source skips the continuation bytes of a character cut by the range start
    offset_ = std::max(offset_, chunk.offset);

    // Zero bytes at the current offset: end of the remote file
    if (length == 0) {
        return false;
    }

    SplitResult split = split_lines(chunk.data, offset_);
    if (split.lines.empty()) {
        // No terminator. A short chunk is the unfinished last line, which a
        // follower waits on; a full chunk is part of an over-long line.
        if (length + chunk.withheld < config_.chunk_size && config_.stream) {
            return false;
        }
        buffer_.emplace_back(std::move(chunk.data), offset_);
        offset_ += length;
        return true;
    }

    for (auto& line : split.lines) {
        buffer_.push_back(std::move(line));
    }
    offset_ += length - split.trailing_partial;

    ServerLog::debug("Cursor", source_->describe() + ": " + std::to_string(buffer_.size()) +
                     " lines buffered, next offset " + std::to_string(offset_));
    return true;
}

} // namespace sandbox_tail
