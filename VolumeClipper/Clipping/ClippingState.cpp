#include "ClippingState.h"
#include "MaskAccumulator.h"
#include "StateCodec.h"
#include <algorithm>

ClippingState ClippingState::capture(const VoxelMask& mask, int compressionLevel)
{
    ClippingState s;
    if (mask.isEmpty())
        return s;

    s.mVoxelCount = mask.voxelCount();
    s.mData = StateCodec::compress(mask, compressionLevel);
    return s;
}

VoxelMask ClippingState::materialize(const VolumeGeometry& geometry) const
{
    if (!enabled())
        return MaskAccumulator::resetToDefault(geometry);
    return StateCodec::decompress(mData, mVoxelCount, geometry);
}

bool ClippingState::operator==(const ClippingState& o) const
{
    if (enabled() && o.enabled())
    {
        if (mVoxelCount != o.mVoxelCount)
            return false;
        if (mData == o.mData)
            return true;
        return qUncompress(mData) == qUncompress(o.mData);
    }

    if (!enabled() && !o.enabled())
        return true;

    // Пустой снимок равен всё-видимому того же размера
    const ClippingState& full = enabled() ? *this : o;
    const ClippingState& null = enabled() ? o : *this;
    if (null.mVoxelCount != 0 && null.mVoxelCount != full.mVoxelCount)
        return false;
    const QByteArray raw = qUncompress(full.mData);
    return std::all_of(raw.cbegin(), raw.cend(), [](char c) { return c == char(MaskVisible); });
}
