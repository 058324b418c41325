#pragma once
#include <array>
#include <optional>
#include <vector>
#include "ClipTypes.h"
#include "VolumeGeometry.h"

class VoxelMask;

// Всё, что ядро ножниц знает о камере. Реализация для vtkRenderer - VtkSources.h.
class CameraSource
{
public:
    virtual ~CameraSource() = default;

    virtual Vec3 cameraPosition() const = 0;
    virtual Vec3 cameraFocalPoint() const = 0;

    // world -> (sx, sy, depth)
    virtual Vec3 worldToDisplay(const Vec3& world) const = 0;
    // (sx, sy, depth) -> однородные (x, y, z, w); делит на w вызывающий
    virtual std::array<double, 4> displayToWorld(double sx, double sy, double depth) const = 0;
};

class VolumeGeometrySource
{
public:
    virtual ~VolumeGeometrySource() = default;

    // Пусто, если том не загружен
    virtual std::optional<VolumeGeometry> volumeGeometry() const = 0;
};

// Обратная сторона: куда ядро отдаёт результат
class ClipRenderTarget
{
public:
    virtual ~ClipRenderTarget() = default;

    virtual void onMaskUpdated(const VoxelMask& mask) = 0;
    virtual void onPreviewPolygon(const std::vector<WorldPoint>& polygon) = 0;
};

class RegionSelectionObserver
{
public:
    virtual ~RegionSelectionObserver() = default;

    virtual void onRegionClosed(const std::vector<DisplayPoint>& displayPoints,
        const std::vector<WorldPoint>& worldPoints) = 0;
};
