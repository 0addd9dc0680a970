/**
 * @file ByteView.hpp
 * @brief Read-only view of a record buffer with offset-based field readers.
 *
 * ByteView wraps a std::span and forwards each read to the free
 * functions in LittleEndian.hpp. It is meant for structure parsers that
 * decode many fields out of one record: they keep the view and
 * accumulate offsets themselves. The view never owns the bytes, so the
 * caller must keep the underlying storage alive.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "loopy/LittleEndian.hpp"

namespace loopy
{
    class ByteView
    {
    public:
        ByteView() = default;

        /**
         * @brief Creates a view over a block of memory.
         * @param data A span of bytes to view.
         */
        explicit ByteView(std::span<const uint8_t> data) : m_span(data) {}

        size_t size() const { return m_span.size(); }
        bool empty() const { return m_span.empty(); }
        const uint8_t* data() const { return m_span.data(); }
        std::span<const uint8_t> span() const { return m_span; }

        // --- Field Readers ---

        uint8_t readUInt8(int64_t offset) const { return loopy::readUInt8(m_span, offset); }
        int8_t readInt8(int64_t offset) const { return loopy::readInt8(m_span, offset); }

        /**
         * @brief Reads a 2-byte little-endian unsigned value.
         * @param offset Byte offset from the start of this view.
         */
        uint16_t readUInt16(int64_t offset) const { return readUInt16LE(m_span, offset); }
        int16_t readInt16(int64_t offset) const { return readInt16LE(m_span, offset); }

        /**
         * @brief Reads a 4-byte little-endian unsigned value.
         * @param offset Byte offset from the start of this view.
         */
        uint32_t readUInt32(int64_t offset) const { return readUInt32LE(m_span, offset); }
        int32_t readInt32(int64_t offset) const { return readInt32LE(m_span, offset); }

        uint64_t readUInt64(int64_t offset) const { return readUInt64LE(m_span, offset); }
        int64_t readInt64(int64_t offset) const { return readInt64LE(m_span, offset); }

        /**
         * @brief Returns a view of `length` bytes starting at `offset`.
         *
         * Offsets passed to the returned view are relative to its own
         * start, and its reads cannot reach outside it.
         *
         * @throws loopy::OutOfBounds if the range does not fit this view.
         */
        ByteView subview(int64_t offset, size_t length) const;

    private:
        /// @brief A non-owning view of the caller's buffer.
        std::span<const uint8_t> m_span;
    };

} // namespace loopy
