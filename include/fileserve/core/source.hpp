#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

#include "fileserve/core/error.hpp"
#include "fileserve/core/poll.hpp"
#include "fileserve/util/expected.hpp"

namespace fileserve {

using IoResult = expected<size_t, Error>;
using SeekResult = expected<uint64_t, Error>;

// Modification times are kept at second granularity, which is what HTTP dates carry
using FileTime = std::chrono::sys_seconds;

// ============================================================================
// SeekableSource - readable, seekable, described byte resource
// ============================================================================
//
// Both poll operations are cooperative: they either make progress and return
// a ready result, or return Pending after arranging for cx.waker() to be
// woken. A Pending result means "call again", never "failed".

class SeekableSource {
public:
    virtual ~SeekableSource() = default;

    // Read up to buffer.size() bytes at the current offset. 0 means end of file.
    virtual Poll<IoResult> poll_read(Context& cx, std::span<char> buffer) = 0;

    // Move to an absolute offset. Returns the new offset.
    virtual Poll<SeekResult> poll_seek(Context& cx, uint64_t position) = 0;

    virtual const std::filesystem::path& path() const noexcept = 0;
    virtual const std::optional<std::string>& mime() const noexcept = 0;

    // Size captured when the source was bound; range math uses this value
    virtual uint64_t size() const noexcept = 0;

    virtual std::optional<FileTime> last_modified() const noexcept { return std::nullopt; }
};

// ============================================================================
// MemorySource - SeekableSource over an owned byte string
// ============================================================================

class MemorySource : public SeekableSource {
    std::string data_;
    std::filesystem::path path_;
    std::optional<std::string> mime_;
    std::optional<FileTime> last_modified_;
    uint64_t offset_ = 0;

public:
    explicit MemorySource(std::string data,
                          std::filesystem::path path = {},
                          std::optional<std::string> mime = std::nullopt)
        : data_(std::move(data)), path_(std::move(path)), mime_(std::move(mime)) {}

    MemorySource& set_last_modified(FileTime t) {
        last_modified_ = t;
        return *this;
    }

    Poll<IoResult> poll_read(Context& cx, std::span<char> buffer) override;
    Poll<SeekResult> poll_seek(Context& cx, uint64_t position) override;

    const std::filesystem::path& path() const noexcept override { return path_; }
    const std::optional<std::string>& mime() const noexcept override { return mime_; }
    uint64_t size() const noexcept override { return data_.size(); }
    std::optional<FileTime> last_modified() const noexcept override { return last_modified_; }

    uint64_t offset() const noexcept { return offset_; }
};

} // namespace fileserve
