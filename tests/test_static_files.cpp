#include <catch2/catch_test_macros.hpp>
#include <fileserve/core/http_date.hpp>
#include <fileserve/core/static_files.hpp>

#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace fileserve;
using namespace fileserve::testing;

namespace {

const FileTime kModified{std::chrono::seconds(1700000000)};

std::unique_ptr<SeekableSource> hundred_bytes(std::optional<std::string> mime = "application/octet-stream") {
    auto src = std::make_unique<MemorySource>(pattern_bytes(100), "/srv/data.bin", std::move(mime));
    src->set_last_modified(kModified);
    return src;
}

std::string current_etag() {
    return etag::derive("/srv/data.bin", 100, kModified).to_string();
}

std::string body_of(Response& resp) {
    REQUIRE(resp.has_stream());
    auto body = drain_to_string(*resp.stream());
    REQUIRE(body);
    return *body;
}

std::string header_or_empty(const Response& resp, std::string_view key) {
    return std::string(resp.header(key).value_or(""));
}

} // namespace

TEST_CASE("MimeTypes returns correct types", "[static_files]") {
    SECTION("Common types") {
        CHECK(MimeTypes::get("html") == "text/html; charset=utf-8");
        CHECK(MimeTypes::get("json") == "application/json");
        CHECK(MimeTypes::get("mp4") == "video/mp4");
        CHECK(MimeTypes::get("png") == "image/png");
    }

    SECTION("Case insensitive") {
        CHECK(MimeTypes::get("MP4") == "video/mp4");
        CHECK(MimeTypes::get("Png") == "image/png");
    }

    SECTION("Unknown extension") {
        CHECK_FALSE(MimeTypes::get("xyz"));
        CHECK_FALSE(MimeTypes::lookup("noextension"));
        CHECK_FALSE(MimeTypes::lookup("trailing."));
    }

    SECTION("From path") {
        CHECK(MimeTypes::lookup("/path/to/movie.webm") == "video/webm");
        CHECK(MimeTypes::lookup("archive.tar.gz") == "application/gzip");
    }

    SECTION("Custom registration") {
        MimeTypes::register_type("M3U8", "application/vnd.apple.mpegurl");
        CHECK(MimeTypes::get("m3u8") == "application/vnd.apple.mpegurl");
        CHECK(MimeTypes::lookup("live.m3u8") == "application/vnd.apple.mpegurl");
    }
}

TEST_CASE("Content-Type resolution", "[static_files]") {
    FileServeOptions options;

    SECTION("Source MIME type wins") {
        MemorySource src("x", "page.html", "text/x-custom");
        CHECK(resolve_content_type(src, options) == "text/x-custom");
    }

    SECTION("Lookup by extension") {
        MemorySource src("x", "page.html");
        CHECK(resolve_content_type(src, options) == "text/html; charset=utf-8");
    }

    SECTION("Plain text fallback") {
        MemorySource src("x", "README");
        CHECK(resolve_content_type(src, options) == "text/plain; charset=utf-8");
    }

    SECTION("Directory fallback") {
        options.is_directory = [](const std::filesystem::path&) { return true; };
        MemorySource src("x", "listing");
        CHECK(resolve_content_type(src, options) == "text/html; charset=utf-8");
    }

    SECTION("Injected lookup") {
        options.mime_lookup = [](const std::filesystem::path& p) -> std::optional<std::string> {
            if (p.extension() == ".bin") return "application/x-firmware";
            return std::nullopt;
        };
        MemorySource src("x", "image.bin");
        CHECK(resolve_content_type(src, options) == "application/x-firmware");
    }
}

TEST_CASE("Full response", "[static_files]") {
    Request req(HttpMethod::GET, "/data.bin");
    auto resp = respond(req, hundred_bytes());

    CHECK(resp.status() == 200);
    CHECK(header_or_empty(resp, "Accept-Ranges") == "bytes");
    CHECK(header_or_empty(resp, "Content-Type") == "application/octet-stream");
    CHECK(header_or_empty(resp, "Content-Length") == "100");
    CHECK(header_or_empty(resp, "ETag") == current_etag());
    CHECK(header_or_empty(resp, "Last-Modified") == http_date::format(kModified));
    CHECK_FALSE(resp.has_header("Content-Range"));
    CHECK(body_of(resp) == pattern_bytes(100));
}

TEST_CASE("Partial content", "[static_files]") {
    Request req(HttpMethod::GET, "/data.bin");

    SECTION("First half") {
        req.add_header("Range", "bytes=0-49");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 206);
        CHECK(resp.status_text() == "Partial Content");
        CHECK(header_or_empty(resp, "Content-Range") == "bytes 0-49/100");
        CHECK(header_or_empty(resp, "Content-Length") == "50");
        CHECK(body_of(resp) == pattern_bytes(100).substr(0, 50));
    }

    SECTION("Suffix") {
        req.add_header("Range", "bytes=-10");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 206);
        CHECK(header_or_empty(resp, "Content-Range") == "bytes 90-99/100");
        CHECK(body_of(resp) == pattern_bytes(100).substr(90));
    }

    SECTION("Multiple ranges serve the first") {
        req.add_header("Range", "bytes=10-19,30-39");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 206);
        CHECK(header_or_empty(resp, "Content-Range") == "bytes 10-19/100");
    }

    SECTION("Unsatisfiable") {
        req.add_header("Range", "bytes=100-");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 416);
        CHECK(header_or_empty(resp, "Content-Range") == "bytes */100");
        CHECK(header_or_empty(resp, "Content-Length") == "0");
        CHECK_FALSE(resp.has_stream());
    }

    SECTION("Malformed header is ignored and logged") {
        auto sink = std::make_shared<MemorySink>();
        Logger logger("test");
        logger.add_sink(sink);
        FileServeOptions options;
        options.logger = &logger;

        req.add_header("Range", "bytes=banana");
        auto resp = respond(req, hundred_bytes(), options);
        CHECK(resp.status() == 200);
        CHECK(header_or_empty(resp, "Content-Length") == "100");
        CHECK(body_of(resp) == pattern_bytes(100));
        CHECK(sink->contains(LogLevel::Warn, "malformed Range"));
    }

    SECTION("Range requests disabled") {
        FileServeOptions options;
        options.range_requests = false;
        req.add_header("Range", "bytes=0-49");
        auto resp = respond(req, hundred_bytes(), options);
        CHECK(resp.status() == 200);
        CHECK(header_or_empty(resp, "Accept-Ranges") == "none");
    }

    SECTION("Small injected chunk size still yields the window") {
        FileServeOptions options;
        options.stream.max_chunk_size = 7;
        req.add_header("Range", "bytes=3-60");
        auto resp = respond(req, hundred_bytes(), options);
        REQUIRE(resp.status() == 206);
        CHECK(resp.stream()->max_chunk_size() == 7);
        CHECK(body_of(resp) == pattern_bytes(100).substr(3, 58));
    }
}

TEST_CASE("Conditional responses", "[static_files]") {
    Request req(HttpMethod::GET, "/data.bin");

    SECTION("If-None-Match hit is 304 even with a Range") {
        req.add_header("If-None-Match", current_etag());
        req.add_header("Range", "bytes=0-49");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 304);
        CHECK_FALSE(resp.has_stream());
        CHECK_FALSE(resp.has_header("Content-Range"));
        CHECK(header_or_empty(resp, "ETag") == current_etag());
        CHECK(header_or_empty(resp, "Content-Length") == "100");
    }

    SECTION("If-Modified-Since at the modification time is 304") {
        req.add_header("If-Modified-Since", http_date::format(kModified));
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 304);
    }

    SECTION("If-Match miss is 412") {
        req.add_header("If-Match", "\"something-else\"");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 412);
        CHECK(header_or_empty(resp, "Content-Length") == "0");
        CHECK_FALSE(resp.has_stream());
    }

    SECTION("Stale If-Range serves the full body") {
        req.add_header("If-Range", "\"stale\"");
        req.add_header("Range", "bytes=0-49");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 200);
        CHECK(header_or_empty(resp, "Content-Length") == "100");
        CHECK(body_of(resp) == pattern_bytes(100));
    }

    SECTION("Current If-Range keeps the range") {
        req.add_header("If-Range", current_etag());
        req.add_header("Range", "bytes=0-49");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 206);
    }

    SECTION("Conditional requests disabled") {
        FileServeOptions options;
        options.conditional_requests = false;
        req.add_header("If-None-Match", "*");
        auto resp = respond(req, hundred_bytes(), options);
        CHECK(resp.status() == 200);
    }

    SECTION("Validators disabled") {
        FileServeOptions options;
        options.etag = false;
        options.last_modified = false;
        req.add_header("If-None-Match", current_etag());
        auto resp = respond(req, hundred_bytes(), options);
        CHECK(resp.status() == 200);
        CHECK_FALSE(resp.has_header("ETag"));
        CHECK_FALSE(resp.has_header("Last-Modified"));
    }

    SECTION("Custom ETag generator") {
        FileServeOptions options;
        options.etag_generator = [](const SeekableSource&) { return std::optional<ETag>(ETag::strong("v7")); };
        req.add_header("If-None-Match", "\"v7\"");
        auto resp = respond(req, hundred_bytes(), options);
        CHECK(resp.status() == 304);
        CHECK(header_or_empty(resp, "ETag") == "\"v7\"");
    }
}

TEST_CASE("Methods", "[static_files]") {
    SECTION("HEAD has headers and no body") {
        Request req(HttpMethod::HEAD, "/data.bin");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 200);
        CHECK(header_or_empty(resp, "Content-Length") == "100");
        CHECK_FALSE(resp.has_stream());
    }

    SECTION("HEAD ignores Range") {
        Request req(HttpMethod::HEAD, "/data.bin");
        req.add_header("Range", "bytes=0-9");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 200);
    }

    SECTION("Other methods are not allowed") {
        Request req(HttpMethod::POST, "/data.bin");
        auto resp = respond(req, hundred_bytes());
        CHECK(resp.status() == 405);
        CHECK(header_or_empty(resp, "Allow") == "GET, HEAD");
    }
}

TEST_CASE("Custom headers are added", "[static_files]") {
    FileServeOptions options;
    options.custom_headers = {{"Cache-Control", "max-age=60"}, {"X-Served-By", "fileserve"}};
    auto resp = respond(Request(HttpMethod::GET), hundred_bytes(), options);
    CHECK(header_or_empty(resp, "Cache-Control") == "max-age=60");
    CHECK(header_or_empty(resp, "X-Served-By") == "fileserve");
}

TEST_CASE("serve_path", "[static_files]") {
    const auto content = pattern_bytes(3000);
    TempFile tmp(content, ".mp4");

    SECTION("Serves a file from disk") {
        Request req(HttpMethod::GET, "/movie.mp4");
        req.add_header("Range", "bytes=1000-1999");
        auto resp = serve_path(req, tmp.path());
        CHECK(resp.status() == 206);
        CHECK(header_or_empty(resp, "Content-Type") == "video/mp4");
        CHECK(header_or_empty(resp, "Content-Range") == "bytes 1000-1999/3000");
        CHECK(resp.has_header("ETag"));
        CHECK(resp.has_header("Last-Modified"));
        CHECK(body_of(resp) == content.substr(1000, 1000));
    }

    SECTION("Revalidation against the file on disk") {
        Request first(HttpMethod::GET, "/movie.mp4");
        auto initial = serve_path(first, tmp.path());
        REQUIRE(initial.has_header("ETag"));

        Request second(HttpMethod::GET, "/movie.mp4");
        second.add_header("If-None-Match", std::string(*initial.header("ETag")));
        auto resp = serve_path(second, tmp.path());
        CHECK(resp.status() == 304);
    }

    SECTION("Missing file is 404") {
        auto resp = serve_path(Request(HttpMethod::GET), tmp.path().string() + ".gone");
        CHECK(resp.status() == 404);
        CHECK(resp.body() == "Not Found");
    }

    SECTION("Device is 404") {
        if (std::filesystem::exists("/dev/zero")) {
            auto resp = serve_path(Request(HttpMethod::GET), "/dev/zero");
            CHECK(resp.status() == 404);
            CHECK_FALSE(resp.has_stream());
        }
    }

    SECTION("Directory is 404") {
        auto resp = serve_path(Request(HttpMethod::GET), std::filesystem::temp_directory_path());
        CHECK(resp.status() == 404);
    }
}

TEST_CASE("Full body is held to the size captured at open", "[static_files]") {
    const auto content = pattern_bytes(100);
    TempFile tmp(content);

    auto resp = serve_path(Request(HttpMethod::GET, "/data.bin"), tmp.path());
    REQUIRE(resp.status() == 200);
    REQUIRE(header_or_empty(resp, "Content-Length") == "100");
    REQUIRE(resp.has_stream());

    SECTION("Bytes appended after open are not sent") {
        {
            std::ofstream f(tmp.path(), std::ios::binary | std::ios::app);
            f << std::string(50, 'x');
        }
        CHECK(body_of(resp) == content);
    }

    SECTION("Truncation after open ends the body with an error") {
        std::filesystem::resize_file(tmp.path(), 40);

        Context cx;
        std::string body;
        std::optional<Error> error;
        for (int guard = 0; guard < 1000; ++guard) {
            auto item = resp.stream()->poll_next(cx);
            if (item.is_pending()) continue;
            auto& next = item.value();
            if (!next) break;
            if (!*next) {
                error = next->error();
                continue;
            }
            body += **next;
        }

        CHECK(body == content.substr(0, 40));
        REQUIRE(error);
        CHECK(error->io_error() == IoError::UnexpectedEof);
    }
}
