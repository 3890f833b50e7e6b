#pragma once

#include <string>
#include <cstdint>
#include <utility>

namespace sandbox_tail {

// One '\n'-terminated line of a remote file. offset is the byte position of
// the first byte of message in the file, size excludes the terminator.
struct Line {
    std::string message;
    int64_t offset = 0;
    int64_t size = 0;

    Line() = default;
    Line(std::string msg, int64_t off)
        : message(std::move(msg))
        , offset(off)
        , size(static_cast<int64_t>(message.size()))
    {
    }
};

enum class ReadDirection : int {
    TopToBottom = 0,
    BottomToTop = 1
};

} // namespace sandbox_tail
