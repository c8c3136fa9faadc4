#include "fileserve/core/request.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace fileserve {

namespace {

constexpr std::array<std::pair<HttpMethod, std::string_view>, 9> kMethods{{
    {HttpMethod::GET, "GET"},
    {HttpMethod::HEAD, "HEAD"},
    {HttpMethod::POST, "POST"},
    {HttpMethod::PUT, "PUT"},
    {HttpMethod::DELETE, "DELETE"},
    {HttpMethod::PATCH, "PATCH"},
    {HttpMethod::OPTIONS, "OPTIONS"},
    {HttpMethod::CONNECT, "CONNECT"},
    {HttpMethod::TRACE, "TRACE"},
}};

bool same_name(std::string_view a, std::string_view b) noexcept {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

} // namespace

HttpMethod parse_method(std::string_view token) noexcept {
  for (const auto &[method, name] : kMethods) {
    if (name == token) return method;
  }
  return HttpMethod::UNKNOWN;
}

std::string_view method_to_string(HttpMethod method) noexcept {
  for (const auto &[m, name] : kMethods) {
    if (m == method) return name;
  }
  return "UNKNOWN";
}

bool is_safe_read(HttpMethod method) noexcept {
  return method == HttpMethod::GET || method == HttpMethod::HEAD;
}

const Request::Field *Request::find(std::string_view name) const {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [name](const Field &f) { return same_name(f.name, name); });
  return it == fields_.end() ? nullptr : &*it;
}

void Request::add_header(std::string_view name, std::string_view value) {
  for (auto &f : fields_) {
    if (same_name(f.name, name)) {
      f.value.append(", ").append(value);
      return;
    }
  }
  fields_.push_back(Field{std::string(name), std::string(value)});
}

std::optional<std::string_view> Request::header(std::string_view name) const {
  if (const Field *f = find(name)) return std::string_view(f->value);
  return std::nullopt;
}

} // namespace fileserve
