#include "mmtrack/native/ByteBuffer.hpp"

#include <algorithm>
#include <cstring>

namespace mmtrack::native {

ByteBuffer::ByteBuffer(std::size_t reserveBytes) {
    buffer.reserve(reserveBytes);
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendUInt32(std::uint32_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
}

void ByteBuffer::appendInt32(std::int32_t value) {
    appendUInt32(static_cast<std::uint32_t>(value));
}

void ByteBuffer::appendZeros(std::size_t count) {
    buffer.insert(buffer.end(), count, 0);
}

std::size_t ByteBuffer::copyTo(std::uint8_t* out, std::size_t size) const {
    if (!out || size == 0) {
        return 0;
    }
    const std::size_t copied = std::min(size, buffer.size());
    if (copied > 0) {
        std::memcpy(out, buffer.data(), copied);
    }
    std::fill(out + copied, out + size, std::uint8_t{0});
    return copied;
}

} // namespace mmtrack::native
