#pragma once
#include <vtkSmartPointer.h>
#include <vtkRenderer.h>
#include <vtkImageData.h>
#include "ClipCollaborators.h"

// Камера и преобразования берутся у живого vtkRenderer в момент вызова
class RendererCameraSource : public CameraSource
{
public:
    explicit RendererCameraSource(vtkRenderer* renderer = nullptr) : mRenderer(renderer) {}

    void setRenderer(vtkRenderer* renderer) { mRenderer = renderer; }

    Vec3 cameraPosition() const override;
    Vec3 cameraFocalPoint() const override;
    Vec3 worldToDisplay(const Vec3& world) const override;
    std::array<double, 4> displayToWorld(double sx, double sy, double depth) const override;

private:
    vtkSmartPointer<vtkRenderer> mRenderer;
};

class ImageGeometrySource : public VolumeGeometrySource
{
public:
    explicit ImageGeometrySource(vtkImageData* image = nullptr) : mImage(image) {}

    void setImage(vtkImageData* image) { mImage = image; }

    std::optional<VolumeGeometry> volumeGeometry() const override;

private:
    vtkSmartPointer<vtkImageData> mImage;
};
