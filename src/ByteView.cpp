/**
 * @file ByteView.cpp
 * @brief Implementation of ByteView::subview.
 */

#include "loopy/ByteView.hpp"
#include "utils/Bounds.hpp"

namespace loopy
{

ByteView ByteView::subview(int64_t offset, size_t length) const
{
    utils::checkBounds(offset, length, m_span.size());
    return ByteView(m_span.subspan(static_cast<size_t>(offset), length));
}

} // namespace loopy
