#include "VtkSources.h"
#include <vtkCamera.h>

Vec3 RendererCameraSource::cameraPosition() const
{
    Vec3 p{ 0, 0, 0 };
    if (mRenderer)
        if (auto* cam = mRenderer->GetActiveCamera())
            cam->GetPosition(p.data());
    return p;
}

Vec3 RendererCameraSource::cameraFocalPoint() const
{
    Vec3 f{ 0, 0, 0 };
    if (mRenderer)
        if (auto* cam = mRenderer->GetActiveCamera())
            cam->GetFocalPoint(f.data());
    return f;
}

Vec3 RendererCameraSource::worldToDisplay(const Vec3& world) const
{
    Vec3 d{ 0, 0, 0 };
    if (!mRenderer) return d;

    mRenderer->SetWorldPoint(world[0], world[1], world[2], 1.0);
    mRenderer->WorldToDisplay();
    mRenderer->GetDisplayPoint(d.data());
    return d;
}

std::array<double, 4> RendererCameraSource::displayToWorld(double sx, double sy, double depth) const
{
    std::array<double, 4> w{ 0, 0, 0, 0 };
    if (!mRenderer) return w;

    mRenderer->SetDisplayPoint(sx, sy, depth);
    mRenderer->DisplayToWorld();
    mRenderer->GetWorldPoint(w.data());
    return w;
}

std::optional<VolumeGeometry> ImageGeometrySource::volumeGeometry() const
{
    if (!mImage) return std::nullopt;

    auto g = VolumeGeometry::fromImage(mImage);
    if (!g.isValid()) return std::nullopt;
    return g;
}
