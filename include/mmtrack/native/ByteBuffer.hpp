#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mmtrack::native {

/// Little-endian writer for vendor records.
class ByteBuffer {
public:
    ByteBuffer() = default;
    explicit ByteBuffer(std::size_t reserveBytes);

    void appendUInt8(std::uint8_t value);
    void appendUInt32(std::uint32_t value);
    void appendInt32(std::int32_t value);
    void appendZeros(std::size_t count);

    /// Copies at most `size` bytes into `out` and zero-fills the remainder.
    std::size_t copyTo(std::uint8_t* out, std::size_t size) const;

    const std::uint8_t* data() const { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace mmtrack::native
