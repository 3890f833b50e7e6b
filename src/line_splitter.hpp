#pragma once

#include "line.hpp"
#include <string>
#include <vector>
#include <functional>

namespace sandbox_tail {

// Applied to a raw chunk before it is split
using ChunkTransform = std::function<std::string(const std::string&)>;

struct SplitResult {
    std::vector<Line> lines;
    // Bytes after the last terminator, withheld so the next fetch starts on them
    int64_t trailing_partial = 0;
};

// Split raw on '\n'. Line offsets start at base_offset and advance by
// message + terminator. With a transform, offsets are positions in the
// transformed bytes, which for reverse_bytes means distance from the chunk end.
SplitResult split_lines(const std::string& raw, int64_t base_offset,
                        const ChunkTransform& transform = nullptr);

std::string reverse_bytes(const std::string& s);

} // namespace sandbox_tail
