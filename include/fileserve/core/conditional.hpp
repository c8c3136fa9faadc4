#pragma once

#include <optional>
#include <string_view>

#include "fileserve/core/etag.hpp"
#include "fileserve/core/request.hpp"
#include "fileserve/core/source.hpp"

namespace fileserve {

enum class ConditionalOutcome {
    Proceed,             // serve as requested, honoring Range
    NotModified,         // 304
    PreconditionFailed,  // 412
    RangeIgnored         // If-Range did not match: serve the whole resource
};

std::string_view outcome_name(ConditionalOutcome outcome) noexcept;

// Conditional header values of one request. Views point into the Request.
struct ConditionalHeaders {
    std::optional<std::string_view> if_match;
    std::optional<std::string_view> if_none_match;
    std::optional<std::string_view> if_modified_since;
    std::optional<std::string_view> if_unmodified_since;
    std::optional<std::string_view> if_range;
    bool has_range = false;

    static ConditionalHeaders from(const Request& req);
};

// Current validators of the selected representation
struct ResourceValidators {
    std::optional<ETag> etag;
    std::optional<FileTime> last_modified;
};

class ConditionalEvaluator {
public:
    // Evaluates the preconditions in RFC 7232 section 6 order:
    //   1. If-Match            (strong comparison) -> 412
    //   2. If-Unmodified-Since (only without If-Match) -> 412
    //   3. If-None-Match       (weak comparison) -> 304 for GET/HEAD, else 412
    //   4. If-Modified-Since   (only without If-None-Match, GET/HEAD) -> 304
    //   5. If-Range            (only with Range) -> RangeIgnored on mismatch
    // Dates that do not parse are treated as if the header were absent.
    static ConditionalOutcome evaluate(HttpMethod method,
                                       const ConditionalHeaders& headers,
                                       const ResourceValidators& validators);

    // If-Range holds when its entity-tag strongly matches, or its date
    // equals the last modification time.
    static bool if_range_matches(std::string_view value,
                                 const ResourceValidators& validators);
};

} // namespace fileserve
