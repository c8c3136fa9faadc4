#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fileserve {

// ============================================================================
// Range Request Types
// ============================================================================

// Half-open byte window [start, end) inside a resource
struct ByteWindow {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const noexcept { return end - start; }

    bool operator==(const ByteWindow&) const = default;
};

// One byte-range-spec as written in the header.
//   "500-999" -> first=500, last=999
//   "500-"    -> first=500, last=nullopt
//   "-500"    -> first=nullopt, last=500 (suffix length)
struct ByteRange {
    std::optional<uint64_t> first;
    std::optional<uint64_t> last;

    bool is_suffix() const noexcept { return !first.has_value(); }

    // Resolve against a resource size. nullopt means unsatisfiable.
    std::optional<ByteWindow> resolve(uint64_t size) const noexcept;

    bool operator==(const ByteRange&) const = default;
};

enum class RangeStatus {
    None,           // no Range header
    Malformed,      // ignored, whole resource is served
    Unsatisfiable,  // 416 with "bytes */size"
    Satisfiable     // 206 with one window
};

std::string_view range_status_name(RangeStatus status) noexcept;

// Outcome of validating a Range header against a resource size
struct RangeSpec {
    RangeStatus status = RangeStatus::None;
    std::optional<ByteWindow> window;

    // Further ranges of a multi-range header that were not honored
    size_t ignored_ranges = 0;

    bool satisfiable() const noexcept { return status == RangeStatus::Satisfiable; }

    // Only the first syntactically valid range is honored; multipart
    // responses are not produced.
    static RangeSpec evaluate(std::optional<std::string_view> header, uint64_t size);
};

// ============================================================================
// Range Parsing
// ============================================================================

namespace range {

// Parse a Range header value into its syntactically valid byte-range-specs.
// Returns nullopt if the unit is not "bytes" or no byte-range-spec is valid.
// Examples:
//   "bytes=0-499"     -> {0-499}
//   "bytes=-500"      -> {suffix 500}
//   "bytes=0-0,-1"    -> {0-0, suffix 1}
//   "bytes=x-1, 5-"   -> {5-}
std::optional<std::vector<ByteRange>> parse(std::string_view header);

// "bytes {start}-{end-1}/{size}"
std::string content_range(const ByteWindow& window, uint64_t size);

// "bytes */{size}"
std::string unsatisfied_content_range(uint64_t size);

} // namespace range

} // namespace fileserve
