#pragma once
#include "VoxelMask.h"

// Слияние масок. Скрытое остаётся скрытым: hidden = max(cumulative, region),
// порядок применения регионов на итог не влияет.
namespace MaskAccumulator
{
    // Всегда новый буфер; исходные маски не трогаются.
    // IntegrityError, если геометрии разные.
    VoxelMask accumulate(const VoxelMask& cumulative, const VoxelMask& region);

    // Всё видно
    VoxelMask resetToDefault(const VolumeGeometry& geometry);
}
