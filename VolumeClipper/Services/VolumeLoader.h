#pragma once
#include <QString>
#include <vtkSmartPointer.h>
#include <vtkImageData.h>

// Чтение DICOM-серии с диска через vtk-dicom
namespace VolumeLoader
{
    struct Result
    {
        vtkSmartPointer<vtkImageData> image;
        QString seriesDescription;
        QString error;

        bool ok() const { return image.GetPointer() != nullptr && error.isEmpty(); }
    };

    // Папка: берётся самая длинная серия из найденных
    Result loadFolder(const QString& folder);
}
