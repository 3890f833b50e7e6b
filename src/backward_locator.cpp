#include "backward_locator.hpp"
#include "line_splitter.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <stdexcept>

namespace sandbox_tail {

int64_t locate_tail_offset(ChunkSource& source, int64_t lines,
                           int64_t chunk_size, const CancelToken& cancel) {
    if (lines <= 0) {
        throw std::invalid_argument("tail line count must be positive");
    }
    if (chunk_size <= 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    const int64_t size = source.file_size(cancel);
    ServerLog::debug("Locator", source.describe() + ": size " + std::to_string(size) +
                     ", looking for last " + std::to_string(lines) + " lines");

    int64_t end = size;
    int64_t collected = 0;
    int fetches = 0;
    bool at_eof = true;

    while (end > 0) {
        const int64_t start = std::max<int64_t>(0, end - chunk_size);
        RemoteChunk chunk = source.fetch(start, end - start, cancel);
        ++fetches;

        SplitResult split = split_lines(chunk.data, 0, reverse_bytes);
        const std::vector<Line>& units = split.lines;
        const bool has_terminator = !units.empty();
        int64_t chunk_end = chunk.offset + static_cast<int64_t>(chunk.data.size());

        // A trailing '\n' closes the last line, it does not start a new one
        size_t first = 0;
        if (at_eof && has_terminator && units.front().size == 0) {
            first = 1;
            chunk_end -= 1;
        }
        at_eof = false;

        const int64_t available = static_cast<int64_t>(units.size() - first);
        if (collected + available >= lines) {
            int64_t span = 0;
            const size_t last = first + static_cast<size_t>(lines - collected);
            for (size_t i = first; i < last; ++i) {
                span += units[i].size + 1;
            }
            const int64_t offset = chunk_end - span + 1;
            ServerLog::debug("Locator", source.describe() + ": offset " + std::to_string(offset) +
                             " after " + std::to_string(fetches) + " fetches");
            return offset;
        }

        collected += available;
        if (start == 0) {
            break;
        }
        // Continue from the first terminator of this chunk; a chunk with no
        // terminator lies inside a single line.
        end = has_terminator ? chunk.offset + split.trailing_partial : start;
    }

    ServerLog::debug("Locator", source.describe() + ": " + std::to_string(collected) +
                     " lines in file, reading from start");
    return 0;
}

} // namespace sandbox_tail
