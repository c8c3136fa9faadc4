/**
 * fileserve - range_cat
 *
 * Answers one synthetic request for a file and prints the response:
 * status line and headers on stdout, then the body.
 *
 *   range_cat [-X METHOD] [-H "Name: value"]... [--chunk N] [--verbose] FILE
 *
 *   range_cat -H "Range: bytes=0-99" video.mp4
 *   range_cat -X HEAD -H 'If-None-Match: "abc"' index.html
 */

#include <fileserve/fileserve.hpp>

#include <charconv>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

using namespace fileserve;

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [-X METHOD] [-H \"Name: value\"]... [--chunk N] [--verbose] FILE\n";
}

} // namespace

int main(int argc, char** argv) {
    Request req(HttpMethod::GET);
    FileServeOptions options;
    std::string file;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if ((arg == "-X" || arg == "--method") && i + 1 < argc) {
            req.set_method(argv[++i]);
            if (req.method() == HttpMethod::UNKNOWN) {
                std::cerr << "unknown method: " << argv[i] << "\n";
                return 2;
            }
        } else if ((arg == "-H" || arg == "--header") && i + 1 < argc) {
            std::string_view header = argv[++i];
            auto colon = header.find(':');
            if (colon == std::string_view::npos) {
                std::cerr << "malformed header: " << header << "\n";
                return 2;
            }
            auto value = header.substr(colon + 1);
            while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
            req.add_header(header.substr(0, colon), std::string(value));
        } else if (arg == "--chunk" && i + 1 < argc) {
            std::string_view n = argv[++i];
            size_t size = 0;
            auto [ptr, ec] = std::from_chars(n.data(), n.data() + n.size(), size);
            if (ec != std::errc{} || ptr != n.data() + n.size() || size == 0) {
                std::cerr << "invalid chunk size: " << n << "\n";
                return 2;
            }
            options.stream.max_chunk_size = size;
        } else if (arg == "-v" || arg == "--verbose") {
            default_logger().set_level(LogLevel::Debug);
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg.front() != '-' && file.empty()) {
            file = std::string(arg);
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    if (file.empty()) {
        usage(argv[0]);
        return 2;
    }

    req.set_path("/" + file);
    Response resp = serve_path(req, file, options);

    std::cout << resp.serialize();
    std::cout.flush();

    auto stream = resp.take_stream();
    if (!stream) {
        return 0;
    }

    // No event loop here: a Pending result just means poll again
    Context cx;
    size_t chunks = 0;
    for (;;) {
        auto item = stream->poll_next(cx);
        if (item.is_pending()) {
            continue;
        }
        auto& next = item.value();
        if (!next) {
            break;
        }
        if (!*next) {
            std::cerr << "\nstream error: " << next->error().to_string() << "\n";
            return 1;
        }
        std::cout.write((*next)->data(), static_cast<std::streamsize>((*next)->size()));
        ++chunks;
    }
    std::cout.flush();

    log_debug("served " + std::to_string(stream->bytes_emitted()) + " bytes in " +
              std::to_string(chunks) + " chunks");
    return 0;
}
