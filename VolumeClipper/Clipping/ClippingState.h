#pragma once
#include <cstdint>
#include <QByteArray>
#include "VoxelMask.h"

// Неизменяемый снимок маски для истории. Пустой снимок - "отсечение выключено".
class ClippingState
{
public:
    ClippingState() = default;

    static ClippingState capture(const VoxelMask& mask, int compressionLevel = -1);

    bool enabled() const { return !mData.isEmpty(); }
    std::uint64_t voxelCount() const { return mVoxelCount; }
    qsizetype compressedSize() const { return mData.size(); }

    // Пустой снимок разворачивается во всё-видимую маску.
    // IntegrityError, если снимок снят с другого тома.
    VoxelMask materialize(const VolumeGeometry& geometry) const;

    bool operator==(const ClippingState& o) const;
    bool operator!=(const ClippingState& o) const { return !(*this == o); }

private:
    std::uint64_t mVoxelCount{ 0 };
    QByteArray mData;
};
