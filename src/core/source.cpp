#include "fileserve/core/source.hpp"

#include <algorithm>
#include <cstring>

namespace fileserve {

Poll<IoResult> MemorySource::poll_read(Context&, std::span<char> buffer) {
    if (offset_ >= data_.size()) {
        return IoResult(size_t{0});
    }
    size_t n = std::min<uint64_t>(buffer.size(), data_.size() - offset_);
    std::memcpy(buffer.data(), data_.data() + offset_, n);
    offset_ += n;
    return IoResult(n);
}

Poll<SeekResult> MemorySource::poll_seek(Context&, uint64_t position) {
    // Like lseek, positioning past the end is allowed; reads there return 0
    offset_ = position;
    return SeekResult(offset_);
}

} // namespace fileserve
