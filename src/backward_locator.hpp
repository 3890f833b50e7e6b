#pragma once

#include "chunk_fetcher.hpp"
#include <cstdint>

namespace sandbox_tail {

// Size of one ranged read; matches the files/read page size
constexpr int64_t kDefaultChunkSize = 1 << 16;

// Returns the byte offset at which the last `lines` lines of the remote file
// start, or 0 when the file holds no more than that. A '\n' ending the file
// terminates the last line rather than opening an empty one.
//
// Chunks are read backward from the end of the file and split after byte
// reversal, so each split unit is one line body plus the terminator before
// it and units come out nearest-EOF first. Each step re-reads only the
// partial line at the head of the previous chunk, so the fetch count stays
// near file_size / chunk_size while lines are shorter than a chunk.
int64_t locate_tail_offset(ChunkSource& source, int64_t lines,
                           int64_t chunk_size, const CancelToken& cancel);

} // namespace sandbox_tail
