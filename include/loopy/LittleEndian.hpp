/**
 * @file LittleEndian.hpp
 * @brief Bounds-checked little-endian integer readers.
 *
 * Each function decodes one fixed-width field from a caller-owned byte
 * sequence. Bytes are always taken least-significant first, whatever the
 * host byte order. The functions hold no state, never retain the span and
 * may be called concurrently.
 *
 * Every reader throws loopy::OutOfBounds if `offset` is negative or
 * `offset + width` exceeds `bytes.size()`. Nothing is read in that case.
 */

#pragma once

#include <cstdint>
#include <span>

#include "loopy/OutOfBounds.hpp"

namespace loopy
{
    /**
     * @brief Reads one byte as an unsigned value (0..255).
     */
    uint8_t readUInt8(std::span<const uint8_t> bytes, int64_t offset);

    /**
     * @brief Reads one byte as a two's-complement value (-128..127).
     */
    int8_t readInt8(std::span<const uint8_t> bytes, int64_t offset);

    /**
     * @brief Reads a 2-byte little-endian unsigned integer.
     */
    uint16_t readUInt16LE(std::span<const uint8_t> bytes, int64_t offset);

    /**
     * @brief Reads a 2-byte little-endian two's-complement integer.
     */
    int16_t readInt16LE(std::span<const uint8_t> bytes, int64_t offset);

    /**
     * @brief Reads a 4-byte little-endian unsigned integer.
     *
     * The full 0..4294967295 range is returned; a set top bit is never
     * treated as a sign.
     */
    uint32_t readUInt32LE(std::span<const uint8_t> bytes, int64_t offset);

    /**
     * @brief Reads a 4-byte little-endian two's-complement integer.
     */
    int32_t readInt32LE(std::span<const uint8_t> bytes, int64_t offset);

    /**
     * @brief Reads an 8-byte little-endian unsigned integer.
     */
    uint64_t readUInt64LE(std::span<const uint8_t> bytes, int64_t offset);

    /**
     * @brief Reads an 8-byte little-endian two's-complement integer.
     */
    int64_t readInt64LE(std::span<const uint8_t> bytes, int64_t offset);

} // namespace loopy
