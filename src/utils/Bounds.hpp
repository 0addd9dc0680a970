/**
 * @file Bounds.hpp
 * @brief Range validation shared by the readers and ByteView.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "loopy/OutOfBounds.hpp"

namespace loopy
{
namespace utils
{
    /**
     * @brief Checks that `[offset, offset + width)` lies inside a buffer.
     *
     * Written so that neither the offset nor the sum can overflow.
     *
     * @throws loopy::OutOfBounds if the range is invalid.
     */
    inline void checkBounds(int64_t offset, size_t width, size_t bufferSize)
    {
        if (offset < 0 ||
            static_cast<uint64_t>(offset) > bufferSize ||
            bufferSize - static_cast<size_t>(offset) < width)
        {
            throw OutOfBounds(offset, width, bufferSize);
        }
    }

} // namespace utils
} // namespace loopy
