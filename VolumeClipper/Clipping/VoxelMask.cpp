#include "VoxelMask.h"
#include <algorithm>
#include <cstring>

vtkSmartPointer<vtkImageData> VoxelMask::makeLikeU8(const VolumeGeometry& geometry)
{
    auto out = vtkSmartPointer<vtkImageData>::New();
    const auto& e = geometry.extent;
    out->SetExtent(e[0], e[1], e[2], e[3], e[4], e[5]);
    out->SetSpacing(geometry.spacing[0], geometry.spacing[1], geometry.spacing[2]);
    out->SetOrigin(geometry.origin[0], geometry.origin[1], geometry.origin[2]);
    out->AllocateScalars(VTK_UNSIGNED_CHAR, 1);
    return out;
}

VoxelMask VoxelMask::filled(const VolumeGeometry& geometry, std::uint8_t value)
{
    VoxelMask m;
    if (!geometry.isValid())
        return m;

    m.mGeometry = geometry;
    m.mIm = makeLikeU8(geometry);
    std::memset(m.data(), value, size_t(geometry.voxelCount()));
    return m;
}

std::uint8_t* VoxelMask::data()
{
    if (!mIm) return nullptr;
    return static_cast<std::uint8_t*>(mIm->GetScalarPointer());
}

const std::uint8_t* VoxelMask::data() const
{
    if (!mIm) return nullptr;
    return static_cast<const std::uint8_t*>(mIm->GetScalarPointer());
}

std::uint8_t VoxelMask::at(int i, int j, int k) const
{
    const auto& g = mGeometry;
    const size_t n = size_t(k - g.extent[4]) * size_t(g.dims[0]) * size_t(g.dims[1])
        + size_t(j - g.extent[2]) * size_t(g.dims[0])
        + size_t(i - g.extent[0]);
    return data()[n];
}

std::uint64_t VoxelMask::hiddenCount() const
{
    if (isEmpty()) return 0;
    const auto* p = data();
    return std::uint64_t(std::count_if(p, p + voxelCount(),
        [](std::uint8_t v) { return v != MaskVisible; }));
}

bool VoxelMask::operator==(const VoxelMask& o) const
{
    if (isEmpty() || o.isEmpty())
        return isEmpty() == o.isEmpty();
    if (!sameGeometry(o))
        return false;
    return std::memcmp(data(), o.data(), size_t(voxelCount())) == 0;
}

VoxelMask VoxelMask::clone() const
{
    VoxelMask c;
    if (isEmpty()) return c;
    c.mGeometry = mGeometry;
    c.mIm = vtkSmartPointer<vtkImageData>::New();
    c.mIm->DeepCopy(mIm);
    return c;
}

vtkSmartPointer<vtkImageData> VoxelMask::toKeepImage() const
{
    if (isEmpty()) return nullptr;

    constexpr std::uint8_t keepValue = 255u;
    constexpr std::uint8_t dropValue = 0u;

    auto keep = makeLikeU8(mGeometry);
    const auto* src = data();
    auto* dst = static_cast<std::uint8_t*>(keep->GetScalarPointer());
    const size_t n = size_t(voxelCount());
    for (size_t i = 0; i < n; ++i)
        dst[i] = (src[i] == MaskVisible) ? keepValue : dropValue;
    return keep;
}
