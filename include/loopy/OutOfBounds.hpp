/**
 * @file OutOfBounds.hpp
 * @brief The error raised when a field read does not fit its buffer.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace loopy
{
    /**
     * @class OutOfBounds
     * @brief Thrown when `offset + width` exceeds the buffer, or the
     *        offset is negative.
     *
     * Derives from std::out_of_range so existing handlers for bad
     * offsets keep working.
     */
    class OutOfBounds : public std::out_of_range
    {
    public:
        OutOfBounds(int64_t offset, size_t width, size_t bufferSize)
            : std::out_of_range(
                  "Read offset " + std::to_string(offset) +
                  " with size " + std::to_string(width) +
                  " is out of bounds for buffer of size " +
                  std::to_string(bufferSize)),
              m_offset(offset),
              m_width(width),
              m_bufferSize(bufferSize)
        {
        }

        int64_t offset() const noexcept { return m_offset; }
        size_t width() const noexcept { return m_width; }
        size_t bufferSize() const noexcept { return m_bufferSize; }

    private:
        int64_t m_offset;
        size_t m_width;
        size_t m_bufferSize;
    };

} // namespace loopy
