#include <gtest/gtest.h>
#include "loopy/ByteView.hpp"
#include <cstdint>
#include <limits>
#include <vector>

using namespace loopy;

namespace
{
    // A small directory-record-like layout:
    //   0  u8   record length
    //   1  i8   adjustment
    //   2  u16  flags
    //   4  u32  extent
    //   8  i32  delta
    //  12  u64  size
    //  20  i64  timestamp
    //  28  i16  zone
    std::vector<uint8_t> makeRecord()
    {
        return {
            0x1E,
            0xFE,
            0x02, 0x80,
            0x10, 0x00, 0x00, 0x00,
            0xF6, 0xFF, 0xFF, 0xFF,
            0x00, 0x10, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
            0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80,
            0xC4, 0xFF,
        };
    }
}

TEST(ByteView, DefaultIsEmpty) {
    ByteView view;
    EXPECT_TRUE(view.empty());
    EXPECT_EQ(view.size(), 0u);
    EXPECT_THROW(view.readUInt8(0), OutOfBounds);
}

TEST(ByteView, ReadsRecordFields) {
    auto bytes = makeRecord();
    ByteView view(bytes);

    EXPECT_EQ(view.size(), 30u);
    EXPECT_EQ(view.data(), bytes.data());

    EXPECT_EQ(view.readUInt8(0), 30);
    EXPECT_EQ(view.readInt8(1), -2);
    EXPECT_EQ(view.readUInt16(2), 0x8002);
    EXPECT_EQ(view.readUInt32(4), 16u);
    EXPECT_EQ(view.readInt32(8), -10);
    EXPECT_EQ(view.readUInt64(12), 0x0000000100001000ULL);
    EXPECT_EQ(view.readInt64(20), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(view.readInt16(28), -60);
}

TEST(ByteView, ReadsMatchFreeFunctions) {
    auto bytes = makeRecord();
    ByteView view(bytes);

    for (int64_t o = 0; o + 4 <= static_cast<int64_t>(bytes.size()); ++o) {
        EXPECT_EQ(view.readUInt32(o), readUInt32LE(bytes, o));
        EXPECT_EQ(view.readInt16(o), readInt16LE(bytes, o));
    }
}

TEST(ByteView, ReadsPastEndThrow) {
    auto bytes = makeRecord();
    ByteView view(bytes);

    EXPECT_NO_THROW(view.readInt16(28));
    EXPECT_THROW(view.readUInt32(28), OutOfBounds);
    EXPECT_THROW(view.readUInt64(23), OutOfBounds);
    EXPECT_THROW(view.readUInt8(30), OutOfBounds);
    EXPECT_THROW(view.readInt8(-1), OutOfBounds);
}

TEST(ByteView, SubviewOffsetsAreRelative) {
    auto bytes = makeRecord();
    ByteView view(bytes);

    ByteView extent = view.subview(4, 8);
    EXPECT_EQ(extent.size(), 8u);
    EXPECT_EQ(extent.readUInt32(0), 16u);
    EXPECT_EQ(extent.readInt32(4), -10);

    ByteView nested = extent.subview(4, 4);
    EXPECT_EQ(nested.readInt32(0), -10);
}

TEST(ByteView, SubviewCannotReachOutside) {
    auto bytes = makeRecord();
    ByteView extent = ByteView(bytes).subview(4, 8);

    // The parent buffer has more bytes, but the sub-view does not.
    EXPECT_THROW(extent.readUInt32(5), OutOfBounds);
    EXPECT_THROW(extent.readUInt8(8), OutOfBounds);
    EXPECT_THROW(extent.readUInt8(-1), OutOfBounds);
}

TEST(ByteView, SubviewBounds) {
    auto bytes = makeRecord();
    ByteView view(bytes);

    EXPECT_NO_THROW(view.subview(0, 30));
    EXPECT_TRUE(view.subview(30, 0).empty());

    EXPECT_THROW(view.subview(0, 31), OutOfBounds);
    EXPECT_THROW(view.subview(29, 2), OutOfBounds);
    EXPECT_THROW(view.subview(31, 0), OutOfBounds);
    EXPECT_THROW(view.subview(-1, 1), OutOfBounds);
    EXPECT_THROW(view.subview(2, std::numeric_limits<size_t>::max()), OutOfBounds);
}
