#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "fileserve/core/error.hpp"
#include "fileserve/core/logging.hpp"
#include "fileserve/core/poll.hpp"
#include "fileserve/core/range.hpp"
#include "fileserve/core/source.hpp"
#include "fileserve/util/expected.hpp"

namespace fileserve {

// Largest chunk a stream hands to the transport in one item
inline constexpr size_t kDefaultMaxChunkSize = 65534;

// What to do when the source ends before a byte window is filled
enum class ShortReadPolicy {
    Fail,     // yield the bytes collected, then an UnexpectedEof error
    Truncate  // yield the bytes collected, then end the sequence
};

struct StreamOptions {
    size_t max_chunk_size = kDefaultMaxChunkSize;
    ShortReadPolicy short_read = ShortReadPolicy::Fail;
    Logger* logger = nullptr;  // nullptr: default_logger()
};

using ChunkResult = expected<std::string, Error>;

// ============================================================================
// ChunkedFileStream - lazy, finite sequence of chunks read from a source
// ============================================================================
//
// poll_next() returns:
//   Pending                  - the source is not ready, poll again
//   ready(nullopt)           - end of sequence
//   ready(ChunkResult value) - next chunk, at most max_chunk_size bytes
//   ready(ChunkResult error) - terminal error, nothing follows
//
// With a window the stream seeks to window.start before the first read and
// never yields a byte outside [start, end). Memory held is bounded by one
// chunk regardless of resource size.

class ChunkedFileStream {
public:
    enum class State { Streaming, Exhausted };

    explicit ChunkedFileStream(std::unique_ptr<SeekableSource> source,
                               std::optional<ByteWindow> window = std::nullopt,
                               StreamOptions options = {});

    ChunkedFileStream(const ChunkedFileStream&) = delete;
    ChunkedFileStream& operator=(const ChunkedFileStream&) = delete;
    ChunkedFileStream(ChunkedFileStream&&) = default;
    ChunkedFileStream& operator=(ChunkedFileStream&&) = default;

    Poll<std::optional<ChunkResult>> poll_next(Context& cx);

    State state() const noexcept { return state_; }
    bool exhausted() const noexcept { return state_ == State::Exhausted; }

    uint64_t bytes_emitted() const noexcept { return bytes_emitted_; }
    const std::optional<ByteWindow>& window() const noexcept { return window_; }
    const SeekableSource& source() const noexcept { return *source_; }
    size_t max_chunk_size() const noexcept { return options_.max_chunk_size; }

    // Bytes the whole sequence carries when the source behaves
    uint64_t content_length() const noexcept {
        return window_ ? window_->length() : source_->size();
    }

private:
    Poll<std::optional<ChunkResult>> poll_unbounded(Context& cx);
    Poll<std::optional<ChunkResult>> poll_bounded(Context& cx);

    // Read into the tail of buffer_, at most want bytes
    Poll<IoResult> read_some(Context& cx, size_t want);

    std::optional<ChunkResult> emit();
    std::optional<ChunkResult> fail(Error err);
    Logger& logger() const;

    std::unique_ptr<SeekableSource> source_;
    std::optional<ByteWindow> window_;
    StreamOptions options_;

    State state_ = State::Streaming;
    std::string buffer_;
    bool seek_done_ = false;
    bool end_of_stream_ = false;
    uint64_t bytes_emitted_ = 0;
    std::optional<Error> deferred_error_;
};

// Build a stream over a source, optionally bounded to a window
inline ChunkedFileStream stream_of(std::unique_ptr<SeekableSource> source,
                                   std::optional<ByteWindow> window = std::nullopt,
                                   StreamOptions options = {}) {
    return ChunkedFileStream(std::move(source), window, options);
}

// Drive a stream to completion with a no-op waker, concatenating its chunks.
// Gives up after max_pending consecutive Pending results.
expected<std::string, Error> drain_to_string(ChunkedFileStream& stream,
                                             size_t max_pending = 1024);

} // namespace fileserve
