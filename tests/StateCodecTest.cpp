#include <gtest/gtest.h>
#include "Clipping/ClippingState.h"
#include "Clipping/StateCodec.h"

namespace
{
    VoxelMask patterned(const VolumeGeometry& g)
    {
        auto m = VoxelMask::filled(g, MaskVisible);
        for (std::uint64_t n = 0; n < m.voxelCount(); n += 3)
            m.data()[n] = MaskHidden;
        return m;
    }
}

TEST(StateCodec, RoundTripIsExact)
{
    const auto g = VolumeGeometry::fromDimensions(7, 5, 3, { 0.7, 0.7, 1.2 }, { -4.0, 2.0, 0.0 });
    const auto m = patterned(g);

    for (int level : { -1, 0, 1, 9 })
    {
        const QByteArray bytes = StateCodec::compress(m, level);
        const VoxelMask back = StateCodec::decompress(bytes, m.voxelCount(), g);
        EXPECT_EQ(back, m) << "level " << level;
    }
}

TEST(StateCodec, UniformMaskCompressesWell)
{
    const auto g = VolumeGeometry::fromDimensions(64, 64, 64);
    const auto m = VoxelMask::filled(g, MaskVisible);
    EXPECT_LT(StateCodec::compress(m).size(), 4096);
}

TEST(StateCodec, WrongExpectedCountThrows)
{
    const auto g = VolumeGeometry::fromDimensions(4, 4, 4);
    const QByteArray bytes = StateCodec::compress(patterned(g));
    EXPECT_THROW(StateCodec::decompress(bytes, 63, g), IntegrityError);
}

TEST(StateCodec, SnapshotFromAnotherVolumeThrows)
{
    const auto small = VolumeGeometry::fromDimensions(4, 4, 4);
    const auto big = VolumeGeometry::fromDimensions(4, 4, 5);
    const QByteArray bytes = StateCodec::compress(patterned(small));

    // заявлено 80, в потоке 64
    EXPECT_THROW(StateCodec::decompress(bytes, big.voxelCount(), big), IntegrityError);
}

TEST(StateCodec, CorruptStreamThrows)
{
    const auto g = VolumeGeometry::fromDimensions(4, 4, 4);
    QByteArray bytes = StateCodec::compress(patterned(g));
    bytes.truncate(bytes.size() / 2);
    EXPECT_THROW(StateCodec::decompress(bytes, g.voxelCount(), g), IntegrityError);

    // заголовок на 64 байта, дальше мусор вместо zlib
    const QByteArray garbage = QByteArray::fromHex("00000040") + QByteArray("not a zlib stream");
    EXPECT_THROW(StateCodec::decompress(garbage, g.voxelCount(), g), IntegrityError);
}

TEST(StateCodec, EmptyMaskCompressesToNothing)
{
    EXPECT_TRUE(StateCodec::compress(VoxelMask{}).isEmpty());
}

TEST(ClippingState, NullStateMaterializesAsAllVisible)
{
    const auto g = VolumeGeometry::fromDimensions(4, 4, 4);
    const ClippingState off;
    EXPECT_FALSE(off.enabled());
    EXPECT_EQ(off.materialize(g).hiddenCount(), 0u);

    const auto visible = ClippingState::capture(VoxelMask::filled(g, MaskVisible), -1);
    EXPECT_EQ(off, visible);
}

TEST(ClippingState, EqualityFollowsContent)
{
    const auto g = VolumeGeometry::fromDimensions(4, 4, 4);
    const auto a = ClippingState::capture(patterned(g), 1);
    const auto b = ClippingState::capture(patterned(g), 9);
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == ClippingState{});
    EXPECT_EQ(a.materialize(g), patterned(g));
}
