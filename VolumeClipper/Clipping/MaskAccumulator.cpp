#include "MaskAccumulator.h"
#include <algorithm>

namespace MaskAccumulator
{
    VoxelMask accumulate(const VoxelMask& cumulative, const VoxelMask& region)
    {
        if (cumulative.isEmpty() || region.isEmpty())
            throw IntegrityError("accumulate: empty mask");

        if (!cumulative.sameGeometry(region))
        {
            const QString msg = QStringLiteral("accumulate: geometry mismatch (%1 vs %2)")
                .arg(cumulative.geometry().describe(), region.geometry().describe());
            throw IntegrityError(msg.toStdString());
        }

        VoxelMask out = cumulative.clone();
        std::uint8_t* dst = out.data();
        const std::uint8_t* src = region.data();
        const std::uint64_t n = out.voxelCount();
        for (std::uint64_t i = 0; i < n; ++i)
            dst[i] = std::max(dst[i], src[i]);

        return out;
    }

    VoxelMask resetToDefault(const VolumeGeometry& geometry)
    {
        return VoxelMask::filled(geometry, MaskVisible);
    }
}
