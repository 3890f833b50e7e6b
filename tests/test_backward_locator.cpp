#include <catch2/catch_test_macros.hpp>
#include "backward_locator.hpp"
#include "memory_chunk_source.hpp"
#include <vector>

using namespace sandbox_tail;

namespace {

// Start offset of every line, counting an unterminated tail as a line
std::vector<int64_t> line_starts(const std::string& content) {
    std::vector<int64_t> starts;
    if (content.empty()) return starts;
    starts.push_back(0);
    for (size_t i = 0; i + 1 < content.size(); ++i) {
        if (content[i] == '\n') starts.push_back(static_cast<int64_t>(i + 1));
    }
    return starts;
}

} // namespace

TEST_CASE("Backward locator finds the start of the last N lines", "[locator]") {
    CancelToken cancel;

    SECTION("Four short lines") {
        MemoryChunkSource source("a\nb\nc\nd\n");
        REQUIRE(locate_tail_offset(source, 2, kDefaultChunkSize, cancel) == 4);
        REQUIRE(locate_tail_offset(source, 1, kDefaultChunkSize, cancel) == 6);
        REQUIRE(locate_tail_offset(source, 4, kDefaultChunkSize, cancel) == 0);
    }

    SECTION("Same file read in 4-byte chunks") {
        MemoryChunkSource source("a\nb\nc\nd\n");
        REQUIRE(locate_tail_offset(source, 1, 4, cancel) == 6);
        REQUIRE(locate_tail_offset(source, 2, 4, cancel) == 4);
        REQUIRE(locate_tail_offset(source, 3, 4, cancel) == 2);
        REQUIRE(locate_tail_offset(source, 4, 4, cancel) == 0);
    }

    SECTION("More lines requested than the file has") {
        MemoryChunkSource source("only\ntwo\n");
        REQUIRE(locate_tail_offset(source, 10, 3, cancel) == 0);
    }

    SECTION("Empty file") {
        MemoryChunkSource source("");
        REQUIRE(locate_tail_offset(source, 5, 4, cancel) == 0);
        REQUIRE(source.data_requests() == 0);
    }

    SECTION("Unterminated last line counts as a line") {
        MemoryChunkSource source("a\nb\nc");
        REQUIRE(locate_tail_offset(source, 1, 3, cancel) == 4);
        REQUIRE(locate_tail_offset(source, 2, 3, cancel) == 2);
    }

    SECTION("Blank lines count") {
        MemoryChunkSource source("x\n\n\ny\n");
        REQUIRE(locate_tail_offset(source, 2, 2, cancel) == 3);
        REQUIRE(locate_tail_offset(source, 3, 2, cancel) == 2);
    }

    SECTION("A line longer than a chunk") {
        std::string content = "head\n" + std::string(50, 'x') + "\ntail\n";
        MemoryChunkSource source(content);
        REQUIRE(locate_tail_offset(source, 1, 8, cancel) == 56);
        REQUIRE(locate_tail_offset(source, 2, 8, cancel) == 5);
        REQUIRE(locate_tail_offset(source, 3, 8, cancel) == 0);
    }

    SECTION("Multi-byte characters are counted in bytes") {
        // "é" is two bytes
        MemoryChunkSource source("\xC3\xA9t\xC3\xA9\n\xC3\xA0 la plage\nfin\n");
        REQUIRE(locate_tail_offset(source, 2, 5, cancel) == 6);
    }

    SECTION("Rejects a non-positive count") {
        MemoryChunkSource source("a\n");
        REQUIRE_THROWS_AS(locate_tail_offset(source, 0, 4, cancel), std::invalid_argument);
        REQUIRE_THROWS_AS(locate_tail_offset(source, 1, 0, cancel), std::invalid_argument);
    }
}

TEST_CASE("Backward locator agrees with a forward scan", "[locator]") {
    CancelToken cancel;
    const std::vector<std::string> files = {
        "one\n",
        "one",
        "\n",
        "1\n22\n333\n4444\n55555\n666666\n7777777\n",
        "no\nfinal\nnewline",
        "\n\n\nblank\n\n",
        "short\n" + std::string(300, 'L') + "\nshort again\n" + std::string(40, 'm'),
    };
    const int64_t chunk_sizes[] = {1, 2, 3, 5, 16, 64, kDefaultChunkSize};

    for (const auto& content : files) {
        auto starts = line_starts(content);
        const int64_t k = static_cast<int64_t>(starts.size());
        for (int64_t chunk : chunk_sizes) {
            for (int64_t n = 1; n <= k + 1; ++n) {
                MemoryChunkSource source(content);
                int64_t expected = n >= k ? 0 : starts[static_cast<size_t>(k - n)];
                INFO("file of " << content.size() << " bytes, chunk " << chunk << ", n " << n);
                REQUIRE(locate_tail_offset(source, n, chunk, cancel) == expected);
            }
        }
    }
}

TEST_CASE("Backward locator request count is bounded by size / chunk", "[locator]") {
    CancelToken cancel;
    std::string content;
    for (int i = 0; i < 2000; ++i) {
        content += "line number " + std::to_string(i) + "\n";
    }
    const int64_t chunk = 256;
    // Each step re-reads at most one partial line (<= 17 bytes here)
    const size_t bound = content.size() / (chunk - 17) + 2;

    SECTION("Whole file requested") {
        MemoryChunkSource source(content);
        REQUIRE(locate_tail_offset(source, 5000, chunk, cancel) == 0);
        REQUIRE(source.data_requests() <= bound);
    }

    SECTION("Small tail touches only the end") {
        MemoryChunkSource source(content);
        int64_t offset = locate_tail_offset(source, 3, chunk, cancel);
        REQUIRE(content.substr(static_cast<size_t>(offset)) ==
                "line number 1997\nline number 1998\nline number 1999\n");
        REQUIRE(source.data_requests() == 1);
        REQUIRE(source.requests().front().offset == kSizeProbeOffset);
    }
}

TEST_CASE("Backward locator propagates fetch failures", "[locator]") {
    CancelToken cancel;

    SECTION("Size probe fails") {
        MemoryChunkSource source("a\nb\n");
        source.fail_next();
        REQUIRE_THROWS_AS(locate_tail_offset(source, 1, 4, cancel), FetchError);
    }

    SECTION("Cancelled") {
        MemoryChunkSource source("a\nb\n");
        cancel.cancel();
        REQUIRE_THROWS_AS(locate_tail_offset(source, 1, 4, cancel), CancelledError);
    }
}
