/**
 * @file LittleEndian.cpp
 * @brief Implementation of the checked little-endian readers.
 */

#include "loopy/LittleEndian.hpp"
#include "utils/BinaryIO.hpp"
#include "utils/Bounds.hpp"

namespace loopy
{

namespace
{
    // Validates the field and returns a pointer to its first byte.
    const uint8_t* fieldAt(std::span<const uint8_t> bytes, int64_t offset, size_t width)
    {
        utils::checkBounds(offset, width, bytes.size());
        return bytes.data() + offset;
    }
}

uint8_t readUInt8(std::span<const uint8_t> bytes, int64_t offset)
{
    return *fieldAt(bytes, offset, 1);
}

int8_t readInt8(std::span<const uint8_t> bytes, int64_t offset)
{
    return static_cast<int8_t>(*fieldAt(bytes, offset, 1));
}

uint16_t readUInt16LE(std::span<const uint8_t> bytes, int64_t offset)
{
    return utils::assembleLe16(fieldAt(bytes, offset, sizeof(uint16_t)));
}

int16_t readInt16LE(std::span<const uint8_t> bytes, int64_t offset)
{
    return utils::toSigned(readUInt16LE(bytes, offset));
}

uint32_t readUInt32LE(std::span<const uint8_t> bytes, int64_t offset)
{
    return utils::assembleLe32(fieldAt(bytes, offset, sizeof(uint32_t)));
}

int32_t readInt32LE(std::span<const uint8_t> bytes, int64_t offset)
{
    return utils::toSigned(readUInt32LE(bytes, offset));
}

uint64_t readUInt64LE(std::span<const uint8_t> bytes, int64_t offset)
{
    return utils::assembleLe64(fieldAt(bytes, offset, sizeof(uint64_t)));
}

int64_t readInt64LE(std::span<const uint8_t> bytes, int64_t offset)
{
    return utils::toSigned(readUInt64LE(bytes, offset));
}

} // namespace loopy
