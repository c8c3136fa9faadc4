#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace fileserve {

// Failures of opening, seeking and reading a served file
enum class IoError {
    Success = 0,
    NotFound,          // open: no such file
    PermissionDenied,  // open: not readable
    IsDirectory,       // open: path names a directory
    NotRegularFile,    // open: device, FIFO or socket
    ReadFailed,
    SeekFailed,
    SeekOutOfRange,    // seek reported an offset other than the one requested
    UnexpectedEof,     // source ended inside a byte window
    Closed,
    InvalidArgument,
    Unknown
};

} // namespace fileserve

template<>
struct std::is_error_code_enum<fileserve::IoError> : std::true_type {};

namespace fileserve {

// Category "fileserve.io"
const std::error_category& io_error_category() noexcept;
std::error_code make_error_code(IoError e) noexcept;

// What expected<T, Error> carries: an IoError or an OS error_code, plus a
// context message (usually the path involved). Equality compares the kind
// only, never the message.
class Error {
public:
    Error() = default;
    Error(IoError kind, std::string context = {})
        : kind_(kind), context_(std::move(context)) {}
    Error(std::error_code os, std::string context = {})
        : kind_(os), context_(std::move(context)) {}

    static Error io(IoError kind, std::string context = {}) {
        return {kind, std::move(context)};
    }
    static Error system(std::error_code os, std::string context = {}) {
        return {os, std::move(context)};
    }

    // Folds the open() failures a file server answers differently (404, 403)
    // into IoError; any other errno stays an OS error
    static Error from_errno(int err, std::string context = {});

    // Source ended after received of expected bytes
    static Error unexpected_eof(uint64_t received, uint64_t expected);

    bool is_io() const noexcept { return std::holds_alternative<IoError>(kind_); }
    bool is_system() const noexcept { return !is_io(); }
    bool is(IoError e) const noexcept { return is_io() && std::get<IoError>(kind_) == e; }
    bool is_not_found() const noexcept { return is(IoError::NotFound); }

    IoError io_error() const noexcept {
        return is_io() ? std::get<IoError>(kind_) : IoError::Unknown;
    }
    std::error_code code() const noexcept;

    // Status to answer with when this error happens before headers are sent
    int http_status() const noexcept;

    std::string_view message() const noexcept { return context_; }
    std::string to_string() const;

    bool operator==(const Error& other) const noexcept { return kind_ == other.kind_; }

    // true if this holds an error
    explicit operator bool() const noexcept { return static_cast<bool>(code()); }

private:
    std::variant<IoError, std::error_code> kind_{IoError::Success};
    std::string context_;
};

} // namespace fileserve
