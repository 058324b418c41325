#pragma once
#include <array>
#include <stdexcept>
#include <string>
#include <vector>
#include <QString>

using Vec3 = std::array<double, 3>;

// Точка в пикселях текущего вьюпорта (система координат VTK display: Y снизу вверх)
struct DisplayPoint
{
    double x{ 0.0 };
    double y{ 0.0 };

    bool operator==(const DisplayPoint& o) const { return x == o.x && y == o.y; }
    bool operator!=(const DisplayPoint& o) const { return !(*this == o); }
};

struct WorldPoint
{
    double x{ 0.0 };
    double y{ 0.0 };
    double z{ 0.0 };

    Vec3 toVec() const { return { x, y, z }; }
    static WorldPoint fromVec(const Vec3& v) { return { v[0], v[1], v[2] }; }
};

enum class ClipMode
{
    RemoveInside,   // ножницы: прячем то, что внутри контура
    RemoveOutside   // инверсные ножницы: прячем всё снаружи
};

QString toString(ClipMode mode);

// Один нарисованный контур. Живёт до растеризации, потом выбрасывается.
struct Region
{
    ClipMode mode{ ClipMode::RemoveInside };
    std::vector<WorldPoint> polygon;   // >= 3 точек, порядок задаёт рёбра
    Vec3 viewNormal{ 0.0, 0.0, 1.0 };  // единичный вектор взгляда
};

class ClipError : public std::runtime_error
{
public:
    explicit ClipError(const std::string& what) : std::runtime_error(what) {}
};

// Размер/геометрия снимка не совпадает с текущим томом
class IntegrityError : public ClipError
{
public:
    explicit IntegrityError(const std::string& what) : ClipError(what) {}
};

namespace VecMath
{
    inline double dot(const Vec3& a, const Vec3& b) { return a[0] * b[0] + a[1] * b[1] + a[2] * b[2]; }
    double norm(const Vec3& v);
    Vec3 sub(const Vec3& a, const Vec3& b);
    // Пустой результат не возвращаем: при нулевой длине вернётся исходный вектор, проверяйте norm() заранее
    Vec3 normalized(const Vec3& v);
}
