#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fileserve/core/file_stream.hpp"

namespace fileserve {

// ============================================================================
// Response
// ============================================================================
//
// Status, headers and either an in-memory body or a ChunkedFileStream. The
// stream is owned by the response and released with it.

class Response {
public:
    using Header = std::pair<std::string, std::string>;
    using Headers = std::vector<Header>;

private:
    int status_ = 200;
    std::string status_text_ = "OK";
    Headers headers_;
    std::string body_;
    std::unique_ptr<ChunkedFileStream> stream_;

public:
    Response() = default;

    explicit Response(int status)
        : status_(status)
        , status_text_(default_status_text(status)) {}

    Response(Response&&) noexcept = default;
    Response& operator=(Response&&) noexcept = default;

    // Accessors
    int status() const noexcept { return status_; }
    std::string_view status_text() const noexcept { return status_text_; }
    const Headers& headers() const noexcept { return headers_; }
    std::string_view body() const noexcept { return body_; }

    // Case-insensitive lookup of the first header named key
    std::optional<std::string_view> header(std::string_view key) const;
    bool has_header(std::string_view key) const { return header(key).has_value(); }

    // Mutators
    void set_header(std::string key, std::string value);

    void add_header(std::string key, std::string value) {
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void set_status(int status) {
        status_ = status;
        status_text_ = default_status_text(status);
    }

    void set_body(std::string body) {
        body_ = std::move(body);
    }

    void set_stream(std::unique_ptr<ChunkedFileStream> stream) {
        stream_ = std::move(stream);
        body_.clear();  // Stream replaces body
    }

    bool has_stream() const noexcept { return stream_ != nullptr; }
    ChunkedFileStream* stream() noexcept { return stream_.get(); }
    std::unique_ptr<ChunkedFileStream> take_stream() noexcept { return std::move(stream_); }

    // Status line and headers, terminated by the empty line
    std::string serialize_headers() const;

    // Headers followed by the in-memory body; a stream is not drained
    std::string serialize() const;

    // Static factory methods
    static Response plain(int status, std::string body);

    static Response not_found(std::string body = "Not Found") {
        return plain(404, std::move(body));
    }

    static Response forbidden(std::string body = "Forbidden") {
        return plain(403, std::move(body));
    }

    static Response method_not_allowed(std::string body = "Method Not Allowed") {
        Response r = plain(405, std::move(body));
        r.add_header("Allow", "GET, HEAD");
        return r;
    }

    static Response internal_error(std::string body = "Internal Server Error") {
        return plain(500, std::move(body));
    }

    static std::string_view default_status_text(int status) noexcept;
};

} // namespace fileserve
