#include "fileserve/core/response.hpp"
#include <sstream>

namespace fileserve {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i], y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

} // namespace

std::optional<std::string_view> Response::header(std::string_view key) const {
    for (const auto& [k, v] : headers_) {
        if (iequals(k, key)) return std::string_view(v);
    }
    return std::nullopt;
}

void Response::set_header(std::string key, std::string value) {
    for (auto& [k, v] : headers_) {
        if (iequals(k, key)) {
            v = std::move(value);
            return;
        }
    }
    headers_.emplace_back(std::move(key), std::move(value));
}

Response Response::plain(int status, std::string body) {
    Response r(status);
    r.headers_.emplace_back("Content-Type", "text/plain; charset=utf-8");
    r.headers_.emplace_back("Content-Length", std::to_string(body.size()));
    r.body_ = std::move(body);
    return r;
}

std::string Response::serialize_headers() const {
    std::ostringstream oss;

    // Status line
    oss << "HTTP/1.1 " << status_ << " " << status_text_ << "\r\n";

    for (const auto& [key, value] : headers_) {
        oss << key << ": " << value << "\r\n";
    }

    // Empty line separating headers from body
    oss << "\r\n";

    return oss.str();
}

std::string Response::serialize() const {
    return serialize_headers() + body_;
}

std::string_view Response::default_status_text(int status) noexcept {
    switch (status) {
        // 2xx Success
        case 200: return "OK";
        case 206: return "Partial Content";

        // 3xx Redirection
        case 304: return "Not Modified";

        // 4xx Client Errors
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 412: return "Precondition Failed";
        case 416: return "Range Not Satisfiable";

        // 5xx Server Errors
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";

        default: return "Unknown";
    }
}

} // namespace fileserve
