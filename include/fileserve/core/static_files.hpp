#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "fileserve/core/conditional.hpp"
#include "fileserve/core/etag.hpp"
#include "fileserve/core/file_stream.hpp"
#include "fileserve/core/logging.hpp"
#include "fileserve/core/request.hpp"
#include "fileserve/core/response.hpp"
#include "fileserve/core/source.hpp"

namespace fileserve {

// ============================================================================
// MIME Types
// ============================================================================

class MimeTypes {
public:
    // MIME type for a file extension (without dot), nullopt if unknown
    static std::optional<std::string_view> get(std::string_view extension) noexcept;

    // MIME type from the extension of a path
    static std::optional<std::string> lookup(const std::filesystem::path& path);

    // Register custom MIME type
    static void register_type(std::string extension, std::string mime_type);

private:
    static std::unordered_map<std::string, std::string>& custom_types();
};

inline constexpr std::string_view kDirectoryContentType = "text/html; charset=utf-8";
inline constexpr std::string_view kFallbackContentType = "text/plain; charset=utf-8";

// ============================================================================
// File Serve Options
// ============================================================================

struct FileServeOptions {
    // Emit ETag and use it for If-Match / If-None-Match / If-Range
    bool etag = true;

    // Emit Last-Modified and use it for the date preconditions
    bool last_modified = true;

    // Honor Range; when false every GET is answered with the full body
    bool range_requests = true;

    // Evaluate If-* headers; when false they are ignored
    bool conditional_requests = true;

    StreamOptions stream;

    // Content-Type for sources without a MIME type. Empty: MimeTypes::lookup
    std::function<std::optional<std::string>(const std::filesystem::path&)> mime_lookup;

    // Chooses the fallback Content-Type. Empty: std::filesystem::is_directory
    std::function<bool(const std::filesystem::path&)> is_directory;

    // Empty: etag::derive(source)
    std::function<std::optional<ETag>(const SeekableSource&)> etag_generator;

    // Custom headers to add to all responses built by respond()
    std::vector<std::pair<std::string, std::string>> custom_headers;

    Logger* logger = nullptr;  // nullptr: default_logger()
};

// ============================================================================
// Response assembly
// ============================================================================

// Content-Type for a source: its own MIME type, then the lookup, then a
// directory or plain-text default
std::string resolve_content_type(const SeekableSource& source, const FileServeOptions& options);

// Decide status and headers for a request against an opened source and
// attach the body stream. The source is consumed; it is dropped without any
// read when the answer has no body.
//
//   200  full body                  Content-Length = size
//   206  window body                Content-Range: bytes s-(e-1)/size
//   304  no body                    Content-Length = size
//   412  no body                    Content-Length: 0
//   416  no body                    Content-Range: bytes */size
//   405  methods other than GET and HEAD
Response respond(const Request& req,
                 std::unique_ptr<SeekableSource> source,
                 const FileServeOptions& options = {});

// Open path and respond. Open failures become 404, 403 or 500.
Response serve_path(const Request& req,
                    const std::filesystem::path& path,
                    const FileServeOptions& options = {});

} // namespace fileserve
