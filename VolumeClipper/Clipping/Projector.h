#pragma once
#include <optional>
#include <vector>
#include "ClipCollaborators.h"

// Экран -> плоскость, перпендикулярная взгляду и проходящая через опорную точку.
// Все точки контура получают одну и ту же экранную глубину, поэтому 3D-полигон
// лежит в одной плоскости и совпадает с тем, что пользователь обвёл на экране.
namespace Projector
{
    // normalize(focal - position); пусто при нулевой длине
    std::optional<Vec3> viewDirection(const CameraSource& camera);

    // Центр тома; без тома - фокус камеры
    Vec3 referencePoint(const CameraSource& camera, const VolumeGeometrySource& volume);

    // Точки с w == 0 пропускаются; меньше трёх на выходе - вызывающий бросает контур
    std::vector<WorldPoint> project(const std::vector<DisplayPoint>& displayPoints,
        const CameraSource& camera,
        const Vec3& reference);

    // Полный путь: проверка направления взгляда + опорная точка + проекция.
    // Пусто, если камера вырождена.
    std::vector<WorldPoint> projectToReferencePlane(const std::vector<DisplayPoint>& displayPoints,
        const CameraSource& camera,
        const VolumeGeometrySource& volume);
}
