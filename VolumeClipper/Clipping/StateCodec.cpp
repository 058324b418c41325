#include "StateCodec.h"
#include "ClipLogging.h"
#include <cstring>
#include <limits>

namespace StateCodec
{
    QByteArray compress(const VoxelMask& mask, int level)
    {
        if (mask.isEmpty())
            return {};

        const std::uint64_t n = mask.voxelCount();
        if (n > std::uint64_t(std::numeric_limits<int>::max()))
            throw ClipError("compress: mask too large for a single buffer");

        if (level < -1 || level > 9)
            level = -1;

        const auto* p = reinterpret_cast<const uchar*>(mask.data());
        return qCompress(p, int(n), level);
    }

    VoxelMask decompress(const QByteArray& bytes, std::uint64_t expectedVoxelCount, const VolumeGeometry& geometry)
    {
        if (expectedVoxelCount != geometry.voxelCount())
        {
            throw IntegrityError(QStringLiteral("snapshot holds %1 voxels, volume %2 has %3")
                .arg(expectedVoxelCount)
                .arg(geometry.describe())
                .arg(geometry.voxelCount())
                .toStdString());
        }

        const QByteArray raw = qUncompress(bytes);
        if (raw.isEmpty() && expectedVoxelCount != 0)
            throw IntegrityError("snapshot stream is corrupt");

        if (std::uint64_t(raw.size()) != expectedVoxelCount)
        {
            throw IntegrityError(QStringLiteral("decoded %1 bytes, expected %2")
                .arg(raw.size())
                .arg(expectedVoxelCount)
                .toStdString());
        }

        VoxelMask m = VoxelMask::filled(geometry, MaskVisible);
        std::memcpy(m.data(), raw.constData(), size_t(expectedVoxelCount));
        return m;
    }
}
