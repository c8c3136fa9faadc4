#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fileserve {

enum class HttpMethod : std::uint8_t {
  GET,
  HEAD,
  POST,
  PUT,
  DELETE,
  PATCH,
  OPTIONS,
  CONNECT,
  TRACE,
  UNKNOWN
};

// Case-sensitive, as method tokens are (RFC 7231 section 4.1)
HttpMethod parse_method(std::string_view token) noexcept;
std::string_view method_to_string(HttpMethod method) noexcept;

// GET and HEAD, the methods a 304 may answer
bool is_safe_read(HttpMethod method) noexcept;

// The slice of an incoming request a file response depends on: the method,
// the target path and the request header fields.
class Request {
public:
  struct Field {
    std::string name;
    std::string value;
  };
  using Fields = std::vector<Field>;

  Request() = default;
  explicit Request(HttpMethod method, std::string path = "/")
      : method_(method), path_(std::move(path)) {}

  HttpMethod method() const noexcept { return method_; }
  std::string_view path() const noexcept { return path_; }
  const Fields &fields() const noexcept { return fields_; }

  void set_method(HttpMethod method) { method_ = method; }
  void set_method(std::string_view token) { method_ = parse_method(token); }
  void set_path(std::string path) { path_ = std::move(path); }

  // A repeated field name is folded into one comma-separated value
  void add_header(std::string_view name, std::string_view value);

  std::optional<std::string_view> header(std::string_view name) const;
  bool has_header(std::string_view name) const { return find(name) != nullptr; }

private:
  const Field *find(std::string_view name) const;

  HttpMethod method_ = HttpMethod::GET;
  std::string path_ = "/";
  Fields fields_;
};

} // namespace fileserve
