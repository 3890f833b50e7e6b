#pragma once

#include "cancel_token.hpp"
#include <httplib.h>
#include <string>
#include <memory>
#include <stdexcept>
#include <cstdint>

namespace sandbox_tail {

// Transport failure, non-200 status or undecodable body from the read endpoint
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Fetch aborted through its CancelToken
class CancelledError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Offset argument that asks the endpoint for the file size instead of data
constexpr int64_t kSizeProbeOffset = -1;

struct RemoteChunk {
    std::string data;
    // File position of data[0], or the file size for a size probe
    int64_t offset = 0;
    // Bytes of the requested range left out of data
    int64_t withheld = 0;
};

// One byte range read per call against a remote file
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual RemoteChunk fetch(int64_t offset, int64_t length, const CancelToken& cancel) = 0;

    // Location of the file, for log messages
    virtual std::string describe() const = 0;

    int64_t file_size(const CancelToken& cancel) {
        return fetch(kSizeProbeOffset, 0, cancel).offset;
    }
};

// Reads through a Mesos-style files/read endpoint:
//   GET <read_path>?path=<file>&offset=<n>&length=<n>  ->  {"data": "...", "offset": n}
// The agent copies file bytes into data unescaped, so a range edge can split a
// UTF-8 character. Those bytes are left out of the chunk and come with the
// neighbouring range.
class HttpChunkFetcher : public ChunkSource {
public:
    // client may be shared by many fetchers; httplib serializes its requests
    HttpChunkFetcher(std::shared_ptr<httplib::Client> client,
                     std::string read_path,
                     std::string file_path,
                     httplib::Headers headers = {});

    RemoteChunk fetch(int64_t offset, int64_t length, const CancelToken& cancel) override;
    std::string describe() const override { return file_path_; }

    const std::string& file_path() const { return file_path_; }

private:
    std::string request(int64_t offset, int64_t length, const CancelToken& cancel);

    // Drops partial UTF-8 characters at either edge of the raw data string so
    // the body parses. missing is set to the bytes needed to finish a cut
    // trailing character.
    static RemoteChunk decode(std::string body, int64_t& missing);

    std::shared_ptr<httplib::Client> client_;
    std::string read_path_;
    std::string file_path_;
    httplib::Headers headers_;
};

} // namespace sandbox_tail
