#include "fileserve/core/file.hpp"

#include <cerrno>
#include <limits>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fileserve {

// ============================================================================
// PosixFileDriver
// ============================================================================

PosixFileDriver::~PosixFileDriver() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Poll<IoResult> PosixFileDriver::poll_read(Context& cx, std::span<char> buffer) {
    if (fd_ < 0) {
        return unexpected(Error::io(IoError::Closed, "read on closed descriptor"));
    }

    for (;;) {
        ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n >= 0) {
            return IoResult(static_cast<size_t>(n));
        }
        const int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err == EAGAIN || err == EWOULDBLOCK) {
            // No readiness source for plain descriptors: ask to be polled again
            cx.waker().wake();
            return pending;
        }
        return unexpected(Error::from_errno(err, "read failed"));
    }
}

Poll<expected<void, Error>> PosixFileDriver::start_seek(Context&, uint64_t position) {
    if (fd_ < 0) {
        return unexpected(Error::io(IoError::Closed, "seek on closed descriptor"));
    }
    if (position > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
        return unexpected(Error::io(IoError::InvalidArgument, "seek offset too large"));
    }
    seek_target_ = position;
    return expected<void, Error>{};
}

Poll<SeekResult> PosixFileDriver::poll_seek_complete(Context&) {
    if (!seek_target_) {
        return unexpected(Error::io(IoError::SeekFailed, "no seek in progress"));
    }
    auto target = *seek_target_;
    seek_target_.reset();

    off_t result = ::lseek(fd_, static_cast<off_t>(target), SEEK_SET);
    if (result < 0) {
        const int err = errno;
        return unexpected(Error::io(IoError::SeekFailed,
            "lseek to " + std::to_string(target) + " failed: " +
            std::error_code(err, std::generic_category()).message()));
    }
    return SeekResult(static_cast<uint64_t>(result));
}

// ============================================================================
// FileBinding
// ============================================================================

FileBinding::FileBinding(std::unique_ptr<FileDriver> driver,
                         std::filesystem::path path,
                         uint64_t size,
                         std::optional<FileTime> last_modified,
                         std::optional<std::string> mime)
    : driver_(std::move(driver))
    , path_(std::move(path))
    , mime_(std::move(mime))
    , size_(size)
    , last_modified_(last_modified)
{
}

expected<std::unique_ptr<FileBinding>, Error> FileBinding::open(
    const std::filesystem::path& path,
    std::optional<std::string> mime)
{
    // O_NONBLOCK keeps open() from waiting for a writer on a FIFO; it is
    // cleared again once the descriptor is known to be a regular file
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
    if (fd < 0) {
        const int err = errno;
        return unexpected(Error::from_errno(err, path.string()));
    }

    // The driver owns fd from here on, so every early return closes it
    auto driver = std::make_unique<PosixFileDriver>(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        return unexpected(Error::from_errno(err, path.string()));
    }
    if (S_ISDIR(st.st_mode)) {
        return unexpected(Error::io(IoError::IsDirectory, path.string()));
    }
    // Devices, FIFOs and sockets have no meaningful st_size
    if (!S_ISREG(st.st_mode)) {
        return unexpected(Error::io(IoError::NotRegularFile, path.string()));
    }

    const int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        const int err = errno;
        return unexpected(Error::from_errno(err, path.string()));
    }

    auto mtime = FileTime(std::chrono::seconds(st.st_mtim.tv_sec));

    return std::make_unique<FileBinding>(std::move(driver), path,
                                         static_cast<uint64_t>(st.st_size),
                                         mtime, std::move(mime));
}

Poll<IoResult> FileBinding::poll_read(Context& cx, std::span<char> buffer) {
    return driver_->poll_read(cx, buffer);
}

Poll<SeekResult> FileBinding::poll_seek(Context& cx, uint64_t position) {
    if (!seek_in_progress_) {
        auto started = driver_->start_seek(cx, position);
        if (started.is_pending()) {
            return pending;
        }
        if (!started.value()) {
            return unexpected(std::move(started.value().error()));
        }
        seek_in_progress_ = true;
    }

    auto completed = driver_->poll_seek_complete(cx);
    if (completed.is_pending()) {
        return pending;
    }
    seek_in_progress_ = false;
    return std::move(completed).value();
}

} // namespace fileserve
