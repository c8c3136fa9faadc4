#include "fileserve/core/static_files.hpp"
#include "fileserve/core/file.hpp"
#include "fileserve/core/http_date.hpp"
#include "fileserve/core/range.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fileserve {

// ============================================================================
// MIME Types Implementation
// ============================================================================

namespace {

const std::unordered_map<std::string, std::string_view> default_mime_types = {
    // Text
    {"html", "text/html; charset=utf-8"},
    {"htm", "text/html; charset=utf-8"},
    {"css", "text/css; charset=utf-8"},
    {"js", "text/javascript; charset=utf-8"},
    {"json", "application/json"},
    {"xml", "application/xml"},
    {"txt", "text/plain; charset=utf-8"},
    {"csv", "text/csv; charset=utf-8"},
    {"md", "text/markdown; charset=utf-8"},

    // Images
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"gif", "image/gif"},
    {"svg", "image/svg+xml"},
    {"webp", "image/webp"},
    {"ico", "image/x-icon"},

    // Fonts
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},

    // Audio and video, the usual targets of range requests
    {"mp3", "audio/mpeg"},
    {"ogg", "audio/ogg"},
    {"flac", "audio/flac"},
    {"wav", "audio/wav"},
    {"mp4", "video/mp4"},
    {"m4v", "video/mp4"},
    {"webm", "video/webm"},
    {"mkv", "video/x-matroska"},
    {"mov", "video/quicktime"},

    // Documents and archives
    {"pdf", "application/pdf"},
    {"zip", "application/zip"},
    {"gz", "application/gzip"},
    {"tar", "application/x-tar"},
    {"iso", "application/x-iso9660-image"},
    {"wasm", "application/wasm"},
};

std::string to_lower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // anonymous namespace

std::unordered_map<std::string, std::string>& MimeTypes::custom_types() {
    static std::unordered_map<std::string, std::string> types;
    return types;
}

std::optional<std::string_view> MimeTypes::get(std::string_view extension) noexcept {
    std::string ext = to_lower(extension);

    // Custom types first
    auto& custom = custom_types();
    auto it = custom.find(ext);
    if (it != custom.end()) {
        return std::string_view(it->second);
    }

    auto dit = default_mime_types.find(ext);
    if (dit != default_mime_types.end()) {
        return dit->second;
    }

    return std::nullopt;
}

std::optional<std::string> MimeTypes::lookup(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (ext.size() < 2) {
        return std::nullopt;
    }
    auto mime = get(std::string_view(ext).substr(1));
    if (!mime) {
        return std::nullopt;
    }
    return std::string(*mime);
}

void MimeTypes::register_type(std::string extension, std::string mime_type) {
    custom_types()[to_lower(extension)] = std::move(mime_type);
}

// ============================================================================
// Response assembly
// ============================================================================

namespace {

Logger& logger_of(const FileServeOptions& options) {
    return options.logger ? *options.logger : default_logger();
}

bool default_is_directory(const std::filesystem::path& path) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

ResourceValidators validators_of(const SeekableSource& source, const FileServeOptions& options) {
    ResourceValidators v;
    if (options.etag) {
        v.etag = options.etag_generator ? options.etag_generator(source)
                                        : etag::derive(source);
    }
    if (options.last_modified) {
        v.last_modified = source.last_modified();
    }
    return v;
}

// Headers every answer about this resource carries, whatever its status
void add_entity_headers(Response& resp,
                        const std::string& content_type,
                        const ResourceValidators& validators,
                        const FileServeOptions& options) {
    resp.set_header("Accept-Ranges", options.range_requests ? "bytes" : "none");
    resp.set_header("Content-Type", content_type);
    if (validators.etag) {
        resp.set_header("ETag", validators.etag->to_string());
    }
    if (validators.last_modified) {
        resp.set_header("Last-Modified", http_date::format(*validators.last_modified));
    }
    for (const auto& [key, value] : options.custom_headers) {
        resp.set_header(key, value);
    }
}

} // anonymous namespace

std::string resolve_content_type(const SeekableSource& source, const FileServeOptions& options) {
    if (source.mime()) {
        return *source.mime();
    }

    auto looked_up = options.mime_lookup ? options.mime_lookup(source.path())
                                         : MimeTypes::lookup(source.path());
    if (looked_up) {
        return std::move(*looked_up);
    }

    bool is_dir = options.is_directory ? options.is_directory(source.path())
                                       : default_is_directory(source.path());
    return std::string(is_dir ? kDirectoryContentType : kFallbackContentType);
}

Response respond(const Request& req,
                 std::unique_ptr<SeekableSource> source,
                 const FileServeOptions& options) {
    Logger& log = logger_of(options);

    if (!source) {
        log.error("respond called without a source");
        return Response::internal_error();
    }

    const HttpMethod method = req.method();
    if (method != HttpMethod::GET && method != HttpMethod::HEAD) {
        log.log(log.entry(LogLevel::Debug, "method not allowed for file")
                    .field("method", std::string(method_to_string(method)))
                    .field("path", source->path().string()));
        return Response::method_not_allowed();
    }

    const uint64_t size = source->size();
    const ResourceValidators validators = validators_of(*source, options);
    const std::string content_type = resolve_content_type(*source, options);

    ConditionalOutcome outcome = ConditionalOutcome::Proceed;
    if (options.conditional_requests) {
        outcome = ConditionalEvaluator::evaluate(method, ConditionalHeaders::from(req), validators);
    }

    Response resp;
    add_entity_headers(resp, content_type, validators, options);

    if (outcome == ConditionalOutcome::NotModified) {
        log.log(log.entry(LogLevel::Debug, "not modified")
                    .field("path", source->path().string()));
        resp.set_status(304);
        resp.set_header("Content-Length", std::to_string(size));
        return resp;
    }

    if (outcome == ConditionalOutcome::PreconditionFailed) {
        log.log(log.entry(LogLevel::Debug, "precondition failed")
                    .field("path", source->path().string()));
        resp.set_status(412);
        resp.set_header("Content-Length", "0");
        return resp;
    }

    // Range is only defined for GET
    RangeSpec spec;
    if (options.range_requests && method == HttpMethod::GET &&
        outcome != ConditionalOutcome::RangeIgnored) {
        spec = RangeSpec::evaluate(req.header("Range"), size);
    }

    if (spec.status != RangeStatus::None) {
        log.log(log.entry(LogLevel::Debug, "range evaluated")
                    .field("path", source->path().string())
                    .field("status", std::string(range_status_name(spec.status)))
                    .field("ignored_ranges", spec.ignored_ranges));
    }
    if (outcome == ConditionalOutcome::RangeIgnored) {
        log.log(log.entry(LogLevel::Debug, "If-Range validator is stale, serving full body")
                    .field("path", source->path().string()));
    }

    std::optional<ByteWindow> window;
    switch (spec.status) {
        case RangeStatus::Unsatisfiable:
            resp.set_status(416);
            resp.set_header("Content-Range", range::unsatisfied_content_range(size));
            resp.set_header("Content-Length", "0");
            return resp;

        case RangeStatus::Satisfiable:
            window = spec.window;
            resp.set_status(206);
            resp.set_header("Content-Range", range::content_range(*window, size));
            resp.set_header("Content-Length", std::to_string(window->length()));
            break;

        case RangeStatus::Malformed:
            log.log(log.entry(LogLevel::Warn, "ignoring malformed Range header")
                        .field("path", source->path().string())
                        .field("range", std::string(req.header("Range").value_or(""))));
            [[fallthrough]];

        case RangeStatus::None:
            // The body is held to the size captured at open, so growth after
            // open is not sent and a shrink goes through the short-read policy
            window = ByteWindow{0, size};
            resp.set_status(200);
            resp.set_header("Content-Length", std::to_string(size));
            break;
    }

    if (method == HttpMethod::HEAD) {
        return resp;
    }

    StreamOptions stream_options = options.stream;
    if (!stream_options.logger) {
        stream_options.logger = options.logger;
    }
    resp.set_stream(std::make_unique<ChunkedFileStream>(std::move(source), window, stream_options));
    return resp;
}

Response serve_path(const Request& req,
                    const std::filesystem::path& path,
                    const FileServeOptions& options) {
    auto opened = open_resource(path);
    if (!opened) {
        const Error& err = opened.error();
        Logger& log = logger_of(options);
        int status = err.http_status();

        log.log(log.entry(status == 500 ? LogLevel::Error : LogLevel::Debug, "cannot open file")
                    .field("path", path.string())
                    .field("error", err.to_string()));

        switch (status) {
            case 404: return Response::not_found();
            case 403: return Response::forbidden();
            default: return Response::internal_error();
        }
    }

    return respond(req, std::move(*opened), options);
}

} // namespace fileserve
