#pragma once
#include <array>
#include <cstdint>
#include <QString>
#include "ClipTypes.h"

class vtkImageData;

// Геометрия сетки тома: всё, что нужно маске, чтобы лечь воксель в воксель
struct VolumeGeometry
{
    std::array<int, 3> dims{ 0, 0, 0 };
    Vec3 spacing{ 1.0, 1.0, 1.0 };
    Vec3 origin{ 0.0, 0.0, 0.0 };
    std::array<int, 6> extent{ 0, -1, 0, -1, 0, -1 };

    bool isValid() const { return dims[0] > 0 && dims[1] > 0 && dims[2] > 0; }

    std::uint64_t voxelCount() const
    {
        if (!isValid()) return 0;
        return std::uint64_t(dims[0]) * std::uint64_t(dims[1]) * std::uint64_t(dims[2]);
    }

    // Центр bounds в мировых координатах (центр крайних вокселей, как у vtkImageData::GetCenter)
    Vec3 center() const;

    bool operator==(const VolumeGeometry& o) const;
    bool operator!=(const VolumeGeometry& o) const { return !(*this == o); }

    QString describe() const;

    static VolumeGeometry fromImage(vtkImageData* image);
    static VolumeGeometry fromDimensions(int nx, int ny, int nz,
        const Vec3& spacing = { 1.0, 1.0, 1.0 },
        const Vec3& origin = { 0.0, 0.0, 0.0 });
};
