#include "ClipTypes.h"
#include <cmath>

QString toString(ClipMode mode)
{
    switch (mode)
    {
    case ClipMode::RemoveInside:  return QStringLiteral("RemoveInside");
    case ClipMode::RemoveOutside: return QStringLiteral("RemoveOutside");
    }
    return QStringLiteral("Unknown");
}

namespace VecMath
{
    double norm(const Vec3& v)
    {
        return std::sqrt(v[0] * v[0] + v[1] * v[1] + v[2] * v[2]);
    }

    Vec3 sub(const Vec3& a, const Vec3& b)
    {
        return { a[0] - b[0], a[1] - b[1], a[2] - b[2] };
    }

    Vec3 normalized(const Vec3& v)
    {
        const double len = norm(v);
        if (len <= 0.0)
            return v;
        return { v[0] / len, v[1] / len, v[2] / len };
    }
}
