#include "MaskRasterizer.h"
#include "ClipLogging.h"
#include <cmath>
#include <vtkNew.h>
#include <vtkPoints.h>
#include <vtkPolygon.h>
#include <vtkImageStencilData.h>
#include <vtkImplicitFunctionToImageStencil.h>

namespace MaskRasterizer
{
    vtkSmartPointer<vtkImplicitSelectionLoop> buildSelectionLoop(const Region& region)
    {
        if (region.polygon.size() < 3)
        {
            qCWarning(lcRaster) << "selection loop needs 3 points, got" << region.polygon.size();
            return nullptr;
        }

        const double len = VecMath::norm(region.viewNormal);
        if (len == 0.0 || !std::isfinite(len))
        {
            qCWarning(lcRaster) << "view normal is degenerate";
            return nullptr;
        }
        const Vec3 n = VecMath::normalized(region.viewNormal);

        vtkNew<vtkPoints> loop;
        loop->SetNumberOfPoints(static_cast<vtkIdType>(region.polygon.size()));
        for (size_t i = 0; i < region.polygon.size(); ++i)
        {
            const auto& p = region.polygon[i];
            loop->SetPoint(static_cast<vtkIdType>(i), p.x, p.y, p.z);
        }

        // Нормаль самого полигона нулевая, если все точки на одной прямой
        double pn[3]{ 0, 0, 0 };
        vtkPolygon::ComputeNormal(loop, pn);
        if (pn[0] == 0.0 && pn[1] == 0.0 && pn[2] == 0.0)
        {
            qCWarning(lcRaster) << "polygon is collinear";
            return nullptr;
        }

        auto sel = vtkSmartPointer<vtkImplicitSelectionLoop>::New();
        sel->SetLoop(loop);
        sel->AutomaticNormalGenerationOff();
        sel->SetNormal(n[0], n[1], n[2]);
        return sel;
    }

    std::optional<VoxelMask> rasterize(const Region& region, const VolumeGeometry& geometry)
    {
        if (!geometry.isValid())
        {
            qCWarning(lcRaster) << "rasterize: invalid volume geometry";
            return std::nullopt;
        }

        auto loop = buildSelectionLoop(region);
        if (!loop)
            return std::nullopt;

        const auto& e = geometry.extent;

        // Внутри: значение функции <= 0 (у selection loop внутри отрицательно)
        vtkNew<vtkImplicitFunctionToImageStencil> f2s;
        f2s->SetInput(loop);
        f2s->SetThreshold(0.0);
        f2s->SetOutputOrigin(geometry.origin[0], geometry.origin[1], geometry.origin[2]);
        f2s->SetOutputSpacing(geometry.spacing[0], geometry.spacing[1], geometry.spacing[2]);
        f2s->SetOutputWholeExtent(e[0], e[1], e[2], e[3], e[4], e[5]);
        f2s->Update();

        vtkImageStencilData* stencil = f2s->GetOutput();
        if (!stencil)
        {
            qCWarning(lcRaster) << "stencil generation produced no output";
            return std::nullopt;
        }

        const bool hideInside = (region.mode == ClipMode::RemoveInside);
        const std::uint8_t insideValue = hideInside ? MaskHidden : MaskVisible;
        const std::uint8_t outsideValue = hideInside ? MaskVisible : MaskHidden;

        VoxelMask mask = VoxelMask::filled(geometry, outsideValue);
        std::uint8_t* dst = mask.data();

        const std::int64_t nx = geometry.dims[0];
        const std::int64_t ny = geometry.dims[1];
        std::uint64_t inside = 0;

        for (int z = e[4]; z <= e[5]; ++z)
        {
            for (int y = e[2]; y <= e[3]; ++y)
            {
                const std::int64_t row = (std::int64_t(z - e[4]) * ny + (y - e[2])) * nx;
                int iter = 0;
                int r1 = 0, r2 = 0;
                while (stencil->GetNextExtent(r1, r2, e[0], e[1], y, z, iter))
                {
                    for (int x = r1; x <= r2; ++x)
                        dst[row + (x - e[0])] = insideValue;
                    inside += std::uint64_t(r2 - r1 + 1);
                }
            }
        }

        qCDebug(lcRaster) << "rasterized" << toString(region.mode) << "region:"
                          << inside << "of" << geometry.voxelCount() << "voxels inside";
        return mask;
    }
}
