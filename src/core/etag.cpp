#include "fileserve/core/etag.hpp"

#include <array>
#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

namespace fileserve {

// ============================================================================
// ETag
// ============================================================================

namespace {

void skip_ows(std::string_view& s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
}

// etagc = %x21 / %x23-7E / obs-text
bool is_etagc(char c) {
    auto u = static_cast<unsigned char>(c);
    return u == 0x21 || (u >= 0x23 && u != 0x7F);
}

// Consume one entity-tag from the front of s
std::optional<ETag> take_entity_tag(std::string_view& s) {
    bool weak = false;
    if (s.size() >= 2 && s[0] == 'W' && s[1] == '/') {
        weak = true;
        s.remove_prefix(2);
    }
    if (s.empty() || s.front() != '"') {
        return std::nullopt;
    }
    s.remove_prefix(1);

    size_t i = 0;
    while (i < s.size() && s[i] != '"') {
        if (!is_etagc(s[i])) {
            return std::nullopt;
        }
        ++i;
    }
    if (i == s.size()) {
        return std::nullopt;  // unterminated
    }

    ETag tag(std::string(s.substr(0, i)), weak);
    s.remove_prefix(i + 1);
    return tag;
}

} // anonymous namespace

std::optional<ETag> ETag::parse(std::string_view text) {
    skip_ows(text);
    auto tag = take_entity_tag(text);
    skip_ows(text);
    if (!tag || !text.empty()) {
        return std::nullopt;
    }
    return tag;
}

std::string ETag::to_string() const {
    std::string out;
    out.reserve(opaque_.size() + 4);
    if (weak_) out += "W/";
    out += '"';
    out += opaque_;
    out += '"';
    return out;
}

// ============================================================================
// EntityTagList
// ============================================================================

EntityTagList EntityTagList::parse(std::string_view header) {
    EntityTagList list;

    skip_ows(header);
    while (!header.empty() && (header.back() == ' ' || header.back() == '\t')) {
        header.remove_suffix(1);
    }
    if (header == "*") {
        list.any = true;
        return list;
    }

    // #entity-tag: elements separated by commas with optional whitespace.
    // Parsing stops at the first malformed element.
    while (!header.empty()) {
        skip_ows(header);
        if (!header.empty() && header.front() == ',') {
            header.remove_prefix(1);
            continue;
        }
        if (header.empty()) {
            break;
        }
        auto tag = take_entity_tag(header);
        if (!tag) {
            break;
        }
        list.tags.push_back(std::move(*tag));
    }

    return list;
}

bool EntityTagList::matches_strong(const std::optional<ETag>& current) const {
    if (any) {
        return true;
    }
    if (!current) {
        return false;
    }
    for (const auto& tag : tags) {
        if (tag.strong_equals(*current)) {
            return true;
        }
    }
    return false;
}

bool EntityTagList::matches_weak(const std::optional<ETag>& current) const {
    if (any) {
        return true;
    }
    if (!current) {
        return false;
    }
    for (const auto& tag : tags) {
        if (tag.weak_equals(*current)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Derivation
// ============================================================================

namespace etag {

ETag derive(const std::filesystem::path& path, uint64_t size, FileTime mtime) {
    const std::string identity = path.string();

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(identity.data(), identity.size(), digest.data(), &digest_len,
                   EVP_sha1(), nullptr) != 1) {
        // Size and mtime alone still identify the content; drop the path part
        digest_len = 0;
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    // First 4 bytes of the path digest
    for (unsigned int i = 0; i < 4 && i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(digest[i]);
    }
    oss << '-' << size;
    oss << '-' << static_cast<uint64_t>(mtime.time_since_epoch().count());

    return ETag::strong(oss.str());
}

std::optional<ETag> derive(const SeekableSource& source) {
    auto mtime = source.last_modified();
    if (!mtime) {
        return std::nullopt;
    }
    return derive(source.path(), source.size(), *mtime);
}

} // namespace etag

} // namespace fileserve
