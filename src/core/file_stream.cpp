#include "fileserve/core/file_stream.hpp"

#include <algorithm>
#include <span>

namespace fileserve {

ChunkedFileStream::ChunkedFileStream(std::unique_ptr<SeekableSource> source,
                                     std::optional<ByteWindow> window,
                                     StreamOptions options)
    : source_(std::move(source)), window_(window), options_(options) {
    if (options_.max_chunk_size == 0) {
        options_.max_chunk_size = kDefaultMaxChunkSize;
    }
    if (!window_) {
        seek_done_ = true;
    }
}

Logger& ChunkedFileStream::logger() const {
    return options_.logger ? *options_.logger : default_logger();
}

Poll<std::optional<ChunkResult>> ChunkedFileStream::poll_next(Context& cx) {
    if (state_ == State::Exhausted) {
        return std::optional<ChunkResult>{};
    }

    if (deferred_error_) {
        Error err = std::move(*deferred_error_);
        deferred_error_.reset();
        return fail(std::move(err));
    }

    if (!seek_done_) {
        auto seek = source_->poll_seek(cx, window_->start);
        if (seek.is_pending()) {
            return pending;
        }
        auto& pos = seek.value();
        if (!pos) {
            return fail(pos.error());
        }
        if (*pos != window_->start) {
            return fail(Error::io(IoError::SeekOutOfRange,
                                  "seek landed at " + std::to_string(*pos) +
                                  ", expected " + std::to_string(window_->start)));
        }
        seek_done_ = true;
    }

    return window_ ? poll_bounded(cx) : poll_unbounded(cx);
}

Poll<std::optional<ChunkResult>> ChunkedFileStream::poll_unbounded(Context& cx) {
    if (end_of_stream_) {
        // The zero-length read that ended the file was already folded into
        // the previous chunk
        state_ = State::Exhausted;
        return std::optional<ChunkResult>{};
    }

    const size_t max = options_.max_chunk_size;
    while (buffer_.size() < max && !end_of_stream_) {
        auto r = read_some(cx, max - buffer_.size());
        if (r.is_pending()) {
            return pending;
        }
        auto& n = r.value();
        if (!n) {
            if (buffer_.empty()) {
                return fail(n.error());
            }
            deferred_error_ = n.error();
            break;
        }
        end_of_stream_ = (*n == 0);
    }

    // Empty when the first read of this step hit end of file; that empty
    // chunk is the last item
    if (end_of_stream_ && buffer_.empty()) {
        state_ = State::Exhausted;
    }
    return emit();
}

Poll<std::optional<ChunkResult>> ChunkedFileStream::poll_bounded(Context& cx) {
    const uint64_t total = window_->length();
    uint64_t remaining = total - bytes_emitted_;
    if (remaining == 0) {
        state_ = State::Exhausted;
        return std::optional<ChunkResult>{};
    }

    const size_t target = static_cast<size_t>(
        std::min<uint64_t>(remaining, options_.max_chunk_size));

    while (buffer_.size() < target) {
        auto r = read_some(cx, target - buffer_.size());
        if (r.is_pending()) {
            return pending;
        }
        auto& n = r.value();
        if (!n) {
            if (buffer_.empty()) {
                return fail(n.error());
            }
            deferred_error_ = n.error();
            return emit();
        }
        if (*n == 0) {
            uint64_t got = bytes_emitted_ + buffer_.size();
            logger().log(logger().entry(LogLevel::Warn, "source ended inside byte window")
                             .field("path", source_->path().string())
                             .field("expected", total)
                             .field("received", got));

            if (options_.short_read == ShortReadPolicy::Fail) {
                Error err = Error::unexpected_eof(got, total);
                if (buffer_.empty()) {
                    return fail(std::move(err));
                }
                deferred_error_ = std::move(err);
                return emit();
            }

            end_of_stream_ = true;
            if (buffer_.empty()) {
                state_ = State::Exhausted;
                return std::optional<ChunkResult>{};
            }
            auto chunk = emit();
            state_ = State::Exhausted;
            return chunk;
        }
    }

    auto chunk = emit();
    if (bytes_emitted_ >= total) {
        state_ = State::Exhausted;
    }
    return chunk;
}

Poll<IoResult> ChunkedFileStream::read_some(Context& cx, size_t want) {
    const size_t old = buffer_.size();
    buffer_.resize(old + want);

    auto r = source_->poll_read(cx, std::span<char>(buffer_.data() + old, want));
    if (r.is_pending()) {
        buffer_.resize(old);
        return pending;
    }

    auto& n = r.value();
    if (!n) {
        buffer_.resize(old);
        return std::move(r);
    }
    // Sources never report more than they were given, but do not trust it
    buffer_.resize(old + std::min(*n, want));
    return IoResult(std::min(*n, want));
}

std::optional<ChunkResult> ChunkedFileStream::emit() {
    bytes_emitted_ += buffer_.size();
    std::string chunk = std::move(buffer_);
    buffer_.clear();
    return ChunkResult(std::move(chunk));
}

std::optional<ChunkResult> ChunkedFileStream::fail(Error err) {
    state_ = State::Exhausted;
    buffer_.clear();
    logger().log(logger().entry(LogLevel::Error, "stream aborted")
                     .field("path", source_->path().string())
                     .field("error", err.to_string()));
    return ChunkResult(unexpected(std::move(err)));
}

expected<std::string, Error> drain_to_string(ChunkedFileStream& stream, size_t max_pending) {
    Context cx;
    std::string out;
    size_t pending_in_a_row = 0;

    for (;;) {
        auto item = stream.poll_next(cx);
        if (item.is_pending()) {
            if (++pending_in_a_row > max_pending) {
                return unexpected(Error::io(IoError::ReadFailed, "source stayed pending"));
            }
            continue;
        }
        pending_in_a_row = 0;

        auto& next = item.value();
        if (!next) {
            return out;
        }
        if (!*next) {
            return unexpected(next->error());
        }
        out += **next;
    }
}

} // namespace fileserve
