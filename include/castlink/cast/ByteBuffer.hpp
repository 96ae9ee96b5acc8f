#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace castlink::cast {

// Growable byte buffer used to assemble length-prefixed frames. Cast framing
// is big-endian (network order).
class ByteBuffer {
public:
    ByteBuffer();

    void clear();
    void appendUInt8(std::uint8_t value);
    void appendUInt32BE(std::uint32_t value);
    void appendBytes(std::string_view bytes);

    static std::uint32_t readUInt32BE(const std::uint8_t* data);

    const std::uint8_t* data() const { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }

    std::vector<std::uint8_t> release() { return std::move(buffer); }

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace castlink::cast
