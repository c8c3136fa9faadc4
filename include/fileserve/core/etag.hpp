#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fileserve/core/source.hpp"

namespace fileserve {

// ============================================================================
// ETag - entity tag validator
// ============================================================================

class ETag {
    std::string opaque_;  // without quotes
    bool weak_ = false;

public:
    ETag() = default;
    ETag(std::string opaque, bool weak) : opaque_(std::move(opaque)), weak_(weak) {}

    static ETag strong(std::string opaque) { return ETag(std::move(opaque), false); }
    static ETag weak(std::string opaque) { return ETag(std::move(opaque), true); }

    // Parse a single entity-tag: "xyzzy" or W/"xyzzy"
    static std::optional<ETag> parse(std::string_view text);

    const std::string& opaque() const noexcept { return opaque_; }
    bool is_weak() const noexcept { return weak_; }

    // Header form, with quotes and weak prefix
    std::string to_string() const;

    // Both strong and byte-identical
    bool strong_equals(const ETag& other) const noexcept {
        return !weak_ && !other.weak_ && opaque_ == other.opaque_;
    }

    // Byte-identical opaque values, weakness ignored
    bool weak_equals(const ETag& other) const noexcept {
        return opaque_ == other.opaque_;
    }

    bool operator==(const ETag&) const = default;
};

// If-Match / If-None-Match field value: "*" or a list of entity-tags
struct EntityTagList {
    bool any = false;
    std::vector<ETag> tags;

    static EntityTagList parse(std::string_view header);

    bool matches_strong(const std::optional<ETag>& current) const;
    bool matches_weak(const std::optional<ETag>& current) const;
};

namespace etag {

// Strong validator derived from resource identity (path, size, mtime).
// The path contributes through a SHA-1 digest so the tag stays short and
// stable across processes.
ETag derive(const std::filesystem::path& path, uint64_t size, FileTime mtime);

// Derive from a source's metadata; nullopt if it has no modification time
std::optional<ETag> derive(const SeekableSource& source);

} // namespace etag

} // namespace fileserve
