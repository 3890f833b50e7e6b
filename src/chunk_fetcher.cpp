#include "chunk_fetcher.hpp"
#include "server_log.hpp"
#include <nlohmann/json.hpp>

namespace sandbox_tail {

namespace {

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Byte count of the UTF-8 sequence introduced by lead, 1 for anything else
size_t sequence_length(char lead) {
    const auto b = static_cast<unsigned char>(lead);
    if ((b & 0xE0) == 0xC0) return 2;
    if ((b & 0xF0) == 0xE0) return 3;
    if ((b & 0xF8) == 0xF0) return 4;
    return 1;
}

// Locates the raw "data" string value of a read response, quotes excluded.
// Escapes and structure are ASCII, so bytes >= 0x80 never end the scan.
bool find_data_value(const std::string& body, size_t& begin, size_t& end) {
    size_t pos = body.find("\"data\"");
    if (pos == std::string::npos) return false;
    pos = body.find_first_not_of(" \t\r\n", pos + 6);
    if (pos == std::string::npos || body[pos] != ':') return false;
    pos = body.find_first_not_of(" \t\r\n", pos + 1);
    if (pos == std::string::npos || body[pos] != '"') return false;

    begin = pos + 1;
    for (size_t i = begin; i < body.size(); ++i) {
        if (body[i] == '\\') {
            ++i;
        } else if (body[i] == '"') {
            end = i;
            return true;
        }
    }
    return false;
}

} // namespace

HttpChunkFetcher::HttpChunkFetcher(std::shared_ptr<httplib::Client> client,
                                   std::string read_path,
                                   std::string file_path,
                                   httplib::Headers headers)
    : client_(std::move(client))
    , read_path_(std::move(read_path))
    , file_path_(std::move(file_path))
    , headers_(std::move(headers))
{
    if (!client_) {
        throw std::invalid_argument("HttpChunkFetcher requires a client");
    }
}

std::string HttpChunkFetcher::request(int64_t offset, int64_t length, const CancelToken& cancel) {
    if (cancel.cancelled()) {
        throw CancelledError("fetch cancelled: " + file_path_);
    }

    httplib::Params params;
    params.emplace("path", file_path_);
    params.emplace("offset", std::to_string(offset));
    if (offset != kSizeProbeOffset) {
        params.emplace("length", std::to_string(length));
    }

    ServerLog::debug("Fetch", read_path_ + " path=" + file_path_ +
                     " offset=" + std::to_string(offset) + " length=" + std::to_string(length));

    auto res = client_->Get(read_path_, params, headers_,
        [&cancel](uint64_t, uint64_t) {
            return !cancel.cancelled();
        });

    if (!res) {
        if (res.error() == httplib::Error::Canceled || cancel.cancelled()) {
            throw CancelledError("fetch cancelled: " + file_path_);
        }
        throw FetchError("request to " + read_path_ + " failed: " + httplib::to_string(res.error()));
    }

    if (res->status != 200) {
        throw FetchError("bad status " + std::to_string(res->status) + " reading " + file_path_);
    }

    return res->body;
}

RemoteChunk HttpChunkFetcher::fetch(int64_t offset, int64_t length, const CancelToken& cancel) {
    int64_t missing = 0;
    RemoteChunk chunk = decode(request(offset, length, cancel), missing);

    // A range inside a single character: widen it to the end of that character
    if (chunk.data.empty() && missing > 0) {
        ServerLog::debug("Fetch", file_path_ + ": range at " + std::to_string(offset) +
                         " cuts a character, widening by " + std::to_string(missing));
        chunk = decode(request(offset, length + missing, cancel), missing);
    }
    return chunk;
}

RemoteChunk HttpChunkFetcher::decode(std::string body, int64_t& missing) {
    missing = 0;
    int64_t skipped = 0;

    size_t begin = 0;
    size_t end = 0;
    size_t cut = 0;
    if (find_data_value(body, begin, end)) {
        // Continuation bytes of a character that starts before the range
        size_t lead = begin;
        while (lead < end && lead - begin < 3 && is_continuation(body[lead])) {
            ++lead;
        }
        skipped = static_cast<int64_t>(lead - begin);

        // A character whose last bytes lie past the range
        cut = end;
        size_t back = end;
        while (back > lead && end - back < 4) {
            --back;
            if (!is_continuation(body[back])) {
                const size_t need = sequence_length(body[back]);
                if (need > end - back) {
                    cut = back;
                    missing = static_cast<int64_t>(need - (end - back));
                }
                break;
            }
        }

        body.erase(cut, end - cut);
        body.erase(begin, lead - begin);
    }

    try {
        auto j = nlohmann::json::parse(body);
        RemoteChunk chunk;
        chunk.data = j.at("data").get<std::string>();
        chunk.offset = j.at("offset").get<int64_t>() + skipped;
        chunk.withheld = skipped + static_cast<int64_t>(end - cut);
        return chunk;
    } catch (const nlohmann::json::exception& e) {
        throw FetchError(std::string("malformed read response: ") + e.what());
    }
}

} // namespace sandbox_tail
