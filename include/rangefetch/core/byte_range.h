#pragma once

#include <cstdint>
#include <vector>

namespace rangefetch {

// Half-open byte range [offset, offset + length).
struct ByteRange {
    std::uint64_t offset{0};
    std::uint64_t length{0};

    bool empty() const noexcept { return length == 0; }

    // Inclusive last byte, as used by the HTTP Range header. Undefined for empty ranges.
    std::uint64_t last() const noexcept { return offset + length - 1; }

    std::uint64_t end() const noexcept { return offset + length; }

    bool operator==(const ByteRange& other) const noexcept {
        return offset == other.offset && length == other.length;
    }
    bool operator!=(const ByteRange& other) const noexcept { return !(*this == other); }
};

// Split [0, total) into `parts` contiguous ranges. Every range gets total / parts bytes and
// the last one also absorbs total % parts, so the union covers every byte exactly once.
// Leading ranges are empty when total < parts. parts == 0 is treated as 1.
inline std::vector<ByteRange> partitionRange(std::uint64_t total, std::uint64_t parts) {
    if (parts == 0)
        parts = 1;
    const std::uint64_t base = total / parts;
    const std::uint64_t remainder = total % parts;

    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<std::size_t>(parts));
    std::uint64_t cursor = 0;
    for (std::uint64_t i = 0; i < parts; ++i) {
        const std::uint64_t len = base + (i == parts - 1 ? remainder : 0);
        ranges.push_back(ByteRange{cursor, len});
        cursor += len;
    }
    return ranges;
}

} // namespace rangefetch
