#include "fileserve/core/error.hpp"

#include <array>
#include <cerrno>

namespace fileserve {

namespace {

constexpr std::array<std::string_view, 12> kIoMessages{
    "Success",
    "No such file",
    "Permission denied",
    "Is a directory",
    "Not a regular file",
    "Read failed",
    "Seek failed",
    "Seek landed on unexpected offset",
    "Unexpected end of file",
    "Source closed",
    "Invalid argument",
    "Unknown error",
};

class IoCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "fileserve.io"; }

    std::string message(int ev) const override {
        if (ev < 0 || static_cast<size_t>(ev) >= kIoMessages.size()) {
            return "Unrecognized fileserve.io error " + std::to_string(ev);
        }
        return std::string(kIoMessages[static_cast<size_t>(ev)]);
    }
};

} // namespace

const std::error_category& io_error_category() noexcept {
    static const IoCategory category;
    return category;
}

std::error_code make_error_code(IoError e) noexcept {
    return {static_cast<int>(e), io_error_category()};
}

Error Error::from_errno(int err, std::string context) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return {IoError::NotFound, std::move(context)};
        case EACCES:
        case EPERM:
            return {IoError::PermissionDenied, std::move(context)};
        case EISDIR:
            return {IoError::IsDirectory, std::move(context)};
        default:
            return {std::error_code(err, std::generic_category()), std::move(context)};
    }
}

Error Error::unexpected_eof(uint64_t received, uint64_t expected) {
    return {IoError::UnexpectedEof, "source ended after " + std::to_string(received) +
                                        " of " + std::to_string(expected) + " bytes"};
}

std::error_code Error::code() const noexcept {
    if (const auto* io = std::get_if<IoError>(&kind_)) return make_error_code(*io);
    return std::get<std::error_code>(kind_);
}

int Error::http_status() const noexcept {
    switch (io_error()) {
        case IoError::NotFound:
        case IoError::IsDirectory:
        case IoError::NotRegularFile:
            return 404;
        case IoError::PermissionDenied:
            return 403;
        default:
            break;
    }
    // ENAMETOOLONG: no file by that name can exist
    return code() == std::errc::filename_too_long ? 404 : 500;
}

std::string Error::to_string() const {
    std::error_code ec = code();
    std::string out = ec.category().name();
    out += ':';
    out += std::to_string(ec.value());
    out += ' ';
    out += ec.message();
    if (!context_.empty()) {
        out += " (";
        out += context_;
        out += ')';
    }
    return out;
}

} // namespace fileserve
