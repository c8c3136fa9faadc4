#include "fileserve/core/conditional.hpp"
#include "fileserve/core/http_date.hpp"

namespace fileserve {

std::string_view outcome_name(ConditionalOutcome outcome) noexcept {
    switch (outcome) {
        case ConditionalOutcome::Proceed: return "proceed";
        case ConditionalOutcome::NotModified: return "not-modified";
        case ConditionalOutcome::PreconditionFailed: return "precondition-failed";
        case ConditionalOutcome::RangeIgnored: return "range-ignored";
        default: return "unknown";
    }
}

ConditionalHeaders ConditionalHeaders::from(const Request& req) {
    ConditionalHeaders h;
    h.if_match = req.header("If-Match");
    h.if_none_match = req.header("If-None-Match");
    h.if_modified_since = req.header("If-Modified-Since");
    h.if_unmodified_since = req.header("If-Unmodified-Since");
    h.if_range = req.header("If-Range");
    h.has_range = req.has_header("Range");
    return h;
}

ConditionalOutcome ConditionalEvaluator::evaluate(HttpMethod method,
                                                  const ConditionalHeaders& headers,
                                                  const ResourceValidators& validators) {
    if (headers.if_match) {
        if (!EntityTagList::parse(*headers.if_match).matches_strong(validators.etag)) {
            return ConditionalOutcome::PreconditionFailed;
        }
    } else if (headers.if_unmodified_since && validators.last_modified) {
        auto since = http_date::parse(*headers.if_unmodified_since);
        if (since && *validators.last_modified > *since) {
            return ConditionalOutcome::PreconditionFailed;
        }
    }

    if (headers.if_none_match) {
        if (EntityTagList::parse(*headers.if_none_match).matches_weak(validators.etag)) {
            return is_safe_read(method) ? ConditionalOutcome::NotModified
                                        : ConditionalOutcome::PreconditionFailed;
        }
    } else if (headers.if_modified_since && is_safe_read(method) && validators.last_modified) {
        auto since = http_date::parse(*headers.if_modified_since);
        if (since && *validators.last_modified <= *since) {
            return ConditionalOutcome::NotModified;
        }
    }

    if (headers.if_range && headers.has_range && method == HttpMethod::GET) {
        if (!if_range_matches(*headers.if_range, validators)) {
            return ConditionalOutcome::RangeIgnored;
        }
    }

    return ConditionalOutcome::Proceed;
}

bool ConditionalEvaluator::if_range_matches(std::string_view value,
                                            const ResourceValidators& validators) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }

    if (!value.empty() && (value.front() == '"' || value.starts_with("W/"))) {
        auto tag = ETag::parse(value);
        return tag && validators.etag && tag->strong_equals(*validators.etag);
    }

    auto date = http_date::parse(value);
    return date && validators.last_modified && *date == *validators.last_modified;
}

} // namespace fileserve
