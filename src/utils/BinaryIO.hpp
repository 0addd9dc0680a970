/**
 * @file BinaryIO.hpp
 * @brief Unchecked little-endian byte assembly.
 *
 * These helpers are the single place where raw bytes are turned into
 * integers. They perform no bounds checking; the public readers in
 * LittleEndian.cpp validate the range before calling them.
 */

#pragma once

#include <cstdint>

namespace loopy
{
namespace utils
{
    /**
     * @brief Assembles a 16-bit little-endian value.
     * @param b A pointer to at least 2 bytes of data.
     */
    inline uint16_t assembleLe16(const uint8_t* b)
    {
        return static_cast<uint16_t>(
            static_cast<uint16_t>(b[0]) |
            (static_cast<uint16_t>(b[1]) << 8)
        );
    }

    /**
     * @brief Assembles a 32-bit little-endian value.
     * @param b A pointer to at least 4 bytes of data.
     */
    inline uint32_t assembleLe32(const uint8_t* b)
    {
        return static_cast<uint32_t>(b[0]) |
               (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) |
               (static_cast<uint32_t>(b[3]) << 24);
    }

    /**
     * @brief Assembles a 64-bit little-endian value.
     * @param b A pointer to at least 8 bytes of data.
     */
    inline uint64_t assembleLe64(const uint8_t* b)
    {
        return static_cast<uint64_t>(b[0]) |
               (static_cast<uint64_t>(b[1]) << 8) |
               (static_cast<uint64_t>(b[2]) << 16) |
               (static_cast<uint64_t>(b[3]) << 24) |
               (static_cast<uint64_t>(b[4]) << 32) |
               (static_cast<uint64_t>(b[5]) << 40) |
               (static_cast<uint64_t>(b[6]) << 48) |
               (static_cast<uint64_t>(b[7]) << 56);
    }

    // Two's-complement reinterpretation. Well defined since C++20.
    inline int16_t toSigned(uint16_t v) { return static_cast<int16_t>(v); }
    inline int32_t toSigned(uint32_t v) { return static_cast<int32_t>(v); }
    inline int64_t toSigned(uint64_t v) { return static_cast<int64_t>(v); }

} // namespace utils
} // namespace loopy
