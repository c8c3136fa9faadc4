#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "fileserve/core/source.hpp"

namespace fileserve {

// ============================================================================
// FileDriver - native file primitives
// ============================================================================
//
// Seeking is split in two phases because some native primitives separate the
// request from its completion. start_seek() issues the request and
// poll_seek_complete() observes the result; either may be Pending.

class FileDriver {
public:
    virtual ~FileDriver() = default;

    virtual Poll<IoResult> poll_read(Context& cx, std::span<char> buffer) = 0;
    virtual Poll<expected<void, Error>> start_seek(Context& cx, uint64_t position) = 0;
    virtual Poll<SeekResult> poll_seek_complete(Context& cx) = 0;
};

// POSIX descriptor driver. Owns the descriptor and closes it on destruction.
class PosixFileDriver : public FileDriver {
    int fd_ = -1;
    std::optional<uint64_t> seek_target_;

public:
    explicit PosixFileDriver(int fd) noexcept : fd_(fd) {}
    ~PosixFileDriver() override;

    PosixFileDriver(const PosixFileDriver&) = delete;
    PosixFileDriver& operator=(const PosixFileDriver&) = delete;

    Poll<IoResult> poll_read(Context& cx, std::span<char> buffer) override;
    Poll<expected<void, Error>> start_seek(Context& cx, uint64_t position) override;
    Poll<SeekResult> poll_seek_complete(Context& cx) override;

    int native_handle() const noexcept { return fd_; }
};

// ============================================================================
// FileBinding - SeekableSource over an OS file
// ============================================================================

class FileBinding : public SeekableSource {
    std::unique_ptr<FileDriver> driver_;
    std::filesystem::path path_;
    std::optional<std::string> mime_;
    uint64_t size_ = 0;
    std::optional<FileTime> last_modified_;
    bool seek_in_progress_ = false;

public:
    FileBinding(std::unique_ptr<FileDriver> driver,
                std::filesystem::path path,
                uint64_t size,
                std::optional<FileTime> last_modified = std::nullopt,
                std::optional<std::string> mime = std::nullopt);

    // Open path read-only and capture its size and modification time
    static expected<std::unique_ptr<FileBinding>, Error> open(
        const std::filesystem::path& path,
        std::optional<std::string> mime = std::nullopt);

    Poll<IoResult> poll_read(Context& cx, std::span<char> buffer) override;
    Poll<SeekResult> poll_seek(Context& cx, uint64_t position) override;

    const std::filesystem::path& path() const noexcept override { return path_; }
    const std::optional<std::string>& mime() const noexcept override { return mime_; }
    uint64_t size() const noexcept override { return size_; }
    std::optional<FileTime> last_modified() const noexcept override { return last_modified_; }

    void set_mime(std::string mime) { mime_ = std::move(mime); }

    // True between a successful seek request and the observation of its completion
    bool seek_in_progress() const noexcept { return seek_in_progress_; }
};

// Entry point for callers: open a file as a SeekableSource
inline expected<std::unique_ptr<FileBinding>, Error> open_resource(
    const std::filesystem::path& path,
    std::optional<std::string> mime = std::nullopt) {
    return FileBinding::open(path, std::move(mime));
}

} // namespace fileserve
