#pragma once
#include <cstdint>
#include <vtkSmartPointer.h>
#include <vtkImageData.h>
#include "VolumeGeometry.h"

constexpr std::uint8_t MaskVisible = 0u;
constexpr std::uint8_t MaskHidden = 255u;

// Побайтовая маска видимости (0 - виден, 255 - скрыт), один байт на точку сетки тома.
// Хранилище - UCHAR x1 vtkImageData с той же структурой, что и у тома.
// После того как маску отдали сессии, её не правят на месте: любое изменение даёт новый буфер.
class VoxelMask
{
public:
    VoxelMask() = default;

    static VoxelMask filled(const VolumeGeometry& geometry, std::uint8_t value);

    bool isEmpty() const { return !mIm; }
    explicit operator bool() const { return !isEmpty(); }

    const VolumeGeometry& geometry() const { return mGeometry; }
    std::uint64_t voxelCount() const { return mGeometry.voxelCount(); }

    // Порядок точек как у VTK: x быстрее всех, затем y, затем z
    std::uint8_t* data();
    const std::uint8_t* data() const;

    std::uint8_t at(int i, int j, int k) const;
    bool isHidden(int i, int j, int k) const { return at(i, j, k) != MaskVisible; }
    std::uint64_t hiddenCount() const;

    bool sameGeometry(const VoxelMask& o) const { return mGeometry == o.mGeometry; }
    bool operator==(const VoxelMask& o) const;
    bool operator!=(const VoxelMask& o) const { return !(*this == o); }

    VoxelMask clone() const;

    // Для маски рендера: 255 - оставить, 0 - спрятать (vtkGPUVolumeRayCastMapper, binary mask)
    vtkSmartPointer<vtkImageData> toKeepImage() const;

    vtkImageData* raw() const { return mIm.GetPointer(); }

private:
    vtkSmartPointer<vtkImageData> mIm;
    VolumeGeometry mGeometry;

    static vtkSmartPointer<vtkImageData> makeLikeU8(const VolumeGeometry& geometry);
};
