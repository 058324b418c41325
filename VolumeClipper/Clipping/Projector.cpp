#include "Projector.h"
#include "ClipLogging.h"
#include <cmath>

namespace Projector
{
    std::optional<Vec3> viewDirection(const CameraSource& camera)
    {
        const Vec3 dir = VecMath::sub(camera.cameraFocalPoint(), camera.cameraPosition());
        const double len = VecMath::norm(dir);
        if (len == 0.0 || !std::isfinite(len))
        {
            qCWarning(lcProjection) << "camera-to-focal vector has zero length";
            return std::nullopt;
        }
        return Vec3{ dir[0] / len, dir[1] / len, dir[2] / len };
    }

    Vec3 referencePoint(const CameraSource& camera, const VolumeGeometrySource& volume)
    {
        if (const auto g = volume.volumeGeometry())
            return g->center();
        return camera.cameraFocalPoint();
    }

    std::vector<WorldPoint> project(const std::vector<DisplayPoint>& displayPoints,
        const CameraSource& camera,
        const Vec3& reference)
    {
        std::vector<WorldPoint> out;
        if (displayPoints.empty())
            return out;

        // глубина опорной точки на экране - общая для всех вершин
        const double depth = camera.worldToDisplay(reference)[2];

        out.reserve(displayPoints.size());
        for (const auto& p : displayPoints)
        {
            const auto w = camera.displayToWorld(p.x, p.y, depth);
            if (w[3] == 0.0)
            {
                qCDebug(lcProjection) << "degenerate unprojection at" << p.x << p.y;
                continue;
            }
            out.push_back({ w[0] / w[3], w[1] / w[3], w[2] / w[3] });
        }
        return out;
    }

    std::vector<WorldPoint> projectToReferencePlane(const std::vector<DisplayPoint>& displayPoints,
        const CameraSource& camera,
        const VolumeGeometrySource& volume)
    {
        if (!viewDirection(camera))
            return {};
        return project(displayPoints, camera, referencePoint(camera, volume));
    }
}
