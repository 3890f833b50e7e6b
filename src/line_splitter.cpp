#include "line_splitter.hpp"

namespace sandbox_tail {

SplitResult split_lines(const std::string& raw, int64_t base_offset,
                        const ChunkTransform& transform) {
    const std::string data = transform ? transform(raw) : raw;

    SplitResult result;
    size_t pos = 0;
    int64_t consumed = 0;
    while (pos < data.size()) {
        size_t nl = data.find('\n', pos);
        if (nl == std::string::npos) {
            break;
        }
        result.lines.emplace_back(data.substr(pos, nl - pos), base_offset + consumed);
        consumed += static_cast<int64_t>(nl - pos) + 1;
        pos = nl + 1;
    }

    result.trailing_partial = static_cast<int64_t>(data.size() - pos);
    return result;
}

std::string reverse_bytes(const std::string& s) {
    return std::string(s.rbegin(), s.rend());
}

} // namespace sandbox_tail
