#include "fileserve/core/range.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace fileserve {

// ============================================================================
// ByteRange
// ============================================================================

std::optional<ByteWindow> ByteRange::resolve(uint64_t size) const noexcept {
    if (is_suffix()) {
        // A zero-length suffix or any suffix of an empty resource selects nothing
        uint64_t suffix = last.value_or(0);
        if (suffix == 0 || size == 0) {
            return std::nullopt;
        }
        uint64_t len = std::min(suffix, size);
        return ByteWindow{size - len, size};
    }

    uint64_t start = *first;
    if (start >= size) {
        return std::nullopt;
    }

    if (!last) {
        return ByteWindow{start, size};
    }

    // Clamp the inclusive last byte to the resource before turning it exclusive
    uint64_t last_byte = std::min(*last, size - 1);
    return ByteWindow{start, last_byte + 1};
}

std::string_view range_status_name(RangeStatus status) noexcept {
    switch (status) {
        case RangeStatus::None: return "none";
        case RangeStatus::Malformed: return "malformed";
        case RangeStatus::Unsatisfiable: return "unsatisfiable";
        case RangeStatus::Satisfiable: return "satisfiable";
        default: return "unknown";
    }
}

// ============================================================================
// Range Parsing
// ============================================================================

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// 1*DIGIT, rejecting overflow
std::optional<uint64_t> parse_digits(std::string_view s) {
    if (s.empty()) {
        return std::nullopt;
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// One element of the byte-range-set
std::optional<ByteRange> parse_range_spec(std::string_view spec) {
    spec = trim(spec);
    auto dash = spec.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }

    auto first_str = trim(spec.substr(0, dash));
    auto last_str = trim(spec.substr(dash + 1));

    ByteRange range;

    if (first_str.empty()) {
        // suffix-byte-range-spec
        auto suffix = parse_digits(last_str);
        if (!suffix) {
            return std::nullopt;
        }
        range.last = *suffix;
        return range;
    }

    range.first = parse_digits(first_str);
    if (!range.first) {
        return std::nullopt;
    }

    if (!last_str.empty()) {
        range.last = parse_digits(last_str);
        if (!range.last || *range.last < *range.first) {
            return std::nullopt;
        }
    }

    return range;
}

} // anonymous namespace

namespace range {

std::optional<std::vector<ByteRange>> parse(std::string_view header) {
    header = trim(header);

    auto eq = header.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }

    if (!iequals(trim(header.substr(0, eq)), "bytes")) {
        return std::nullopt;
    }

    std::vector<ByteRange> ranges;
    auto specs = header.substr(eq + 1);
    size_t start = 0;

    while (start <= specs.size()) {
        auto comma = specs.find(',', start);
        auto spec = (comma == std::string_view::npos)
            ? specs.substr(start)
            : specs.substr(start, comma - start);

        // Empty list elements are allowed by the list syntax and skipped
        if (!trim(spec).empty()) {
            if (auto parsed = parse_range_spec(spec)) {
                ranges.push_back(*parsed);
            }
        }

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }

    if (ranges.empty()) {
        return std::nullopt;
    }
    return ranges;
}

std::string content_range(const ByteWindow& window, uint64_t size) {
    return "bytes " + std::to_string(window.start) + "-" +
           std::to_string(window.end - 1) + "/" + std::to_string(size);
}

std::string unsatisfied_content_range(uint64_t size) {
    return "bytes */" + std::to_string(size);
}

} // namespace range

// ============================================================================
// RangeSpec
// ============================================================================

RangeSpec RangeSpec::evaluate(std::optional<std::string_view> header, uint64_t size) {
    RangeSpec spec;
    if (!header) {
        return spec;
    }

    auto ranges = range::parse(*header);
    if (!ranges) {
        spec.status = RangeStatus::Malformed;
        return spec;
    }

    spec.ignored_ranges = ranges->size() - 1;
    spec.window = ranges->front().resolve(size);
    spec.status = spec.window ? RangeStatus::Satisfiable : RangeStatus::Unsatisfiable;
    return spec;
}

} // namespace fileserve
