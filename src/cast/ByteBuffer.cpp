#include "castlink/cast/ByteBuffer.hpp"

namespace castlink::cast {

ByteBuffer::ByteBuffer() {
    buffer.reserve(512);
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendUInt32BE(std::uint32_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void ByteBuffer::appendBytes(std::string_view bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

std::uint32_t ByteBuffer::readUInt32BE(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24)
         | (static_cast<std::uint32_t>(data[1]) << 16)
         | (static_cast<std::uint32_t>(data[2]) << 8)
         | static_cast<std::uint32_t>(data[3]);
}

} // namespace castlink::cast
