#pragma once
#include <cstdint>
#include <QByteArray>
#include "VoxelMask.h"

// Маска <-> сжатый буфер (zlib через qCompress, с 4-байтовым префиксом длины от Qt)
namespace StateCodec
{
    // level: -1 - по умолчанию zlib, 0..9 - явный уровень
    QByteArray compress(const VoxelMask& mask, int level = -1);

    // Бросает IntegrityError, если поток битый, длина не совпала с expectedVoxelCount
    // или expectedVoxelCount не соответствует geometry
    VoxelMask decompress(const QByteArray& bytes, std::uint64_t expectedVoxelCount, const VolumeGeometry& geometry);
}
