#include "VolumeGeometry.h"
#include <vtkImageData.h>
#include <algorithm>

Vec3 VolumeGeometry::center() const
{
    Vec3 c{};
    for (int a = 0; a < 3; ++a)
        c[a] = origin[a] + spacing[a] * 0.5 * double(extent[2 * a] + extent[2 * a + 1]);
    return c;
}

bool VolumeGeometry::operator==(const VolumeGeometry& o) const
{
    return dims == o.dims && spacing == o.spacing && origin == o.origin && extent == o.extent;
}

QString VolumeGeometry::describe() const
{
    return QStringLiteral("dims=%1x%2x%3 spacing=(%4, %5, %6) origin=(%7, %8, %9)")
        .arg(dims[0]).arg(dims[1]).arg(dims[2])
        .arg(spacing[0]).arg(spacing[1]).arg(spacing[2])
        .arg(origin[0]).arg(origin[1]).arg(origin[2]);
}

VolumeGeometry VolumeGeometry::fromImage(vtkImageData* image)
{
    VolumeGeometry g;
    if (!image) return g;

    int ext[6]; image->GetExtent(ext);
    double sp[3]; image->GetSpacing(sp);
    double org[3]; image->GetOrigin(org);

    for (int i = 0; i < 6; ++i) g.extent[i] = ext[i];
    for (int a = 0; a < 3; ++a)
    {
        g.dims[a] = std::max(0, ext[2 * a + 1] - ext[2 * a] + 1);
        g.spacing[a] = sp[a];
        g.origin[a] = org[a];
    }
    return g;
}

VolumeGeometry VolumeGeometry::fromDimensions(int nx, int ny, int nz, const Vec3& spacing, const Vec3& origin)
{
    VolumeGeometry g;
    g.dims = { nx, ny, nz };
    g.spacing = spacing;
    g.origin = origin;
    g.extent = { 0, nx - 1, 0, ny - 1, 0, nz - 1 };
    return g;
}
