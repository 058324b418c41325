#pragma once
#include <optional>
#include <vtkSmartPointer.h>
#include <vtkImplicitSelectionLoop.h>
#include "ClipTypes.h"
#include "VoxelMask.h"

// Контур -> маска тома. Контур вытягивается вдоль взгляда в бесконечную призму,
// так что проверка "внутри" не зависит от глубины вокселя.
namespace MaskRasterizer
{
    // nullptr: меньше трёх точек, нулевая нормаль или все точки на одной прямой
    vtkSmartPointer<vtkImplicitSelectionLoop> buildSelectionLoop(const Region& region);

    // Маска на той же сетке, что и том: 255 там, где режим велит спрятать.
    // Пусто, если контур не построился.
    std::optional<VoxelMask> rasterize(const Region& region, const VolumeGeometry& geometry);
}
