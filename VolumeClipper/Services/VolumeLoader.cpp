#include "VolumeLoader.h"
#include "LogSetup.h"

#include <vtkCommand.h>
#include <vtkDICOMDirectory.h>
#include <vtkDICOMMetaData.h>
#include <vtkDICOMReader.h>
#include <vtkDICOMTag.h>
#include <vtkStringArray.h>

#include <string>

namespace {
    class VtkErrorCatcher : public vtkCommand {
    public:
        static VtkErrorCatcher* New() { return new VtkErrorCatcher; }
        void Execute(vtkObject*, unsigned long, void* callData) override {
            hasError = true;
            if (callData) message = static_cast<const char*>(callData);
        }
        bool hasError = false;
        std::string message;
    };

    VolumeLoader::Result readSeries(vtkStringArray* names)
    {
        VolumeLoader::Result res;

        auto reader = vtkSmartPointer<vtkDICOMReader>::New();
        auto err = vtkSmartPointer<VtkErrorCatcher>::New();
        reader->AddObserver(vtkCommand::ErrorEvent, err);
        reader->SetFileNames(names);
        reader->Update();

        if (err->hasError || !reader->GetOutput())
        {
            res.error = err->message.empty()
                ? QStringLiteral("DICOM read failed.")
                : QString::fromStdString(err->message);
            return res;
        }

        int dims[3]{ 0, 0, 0 };
        reader->GetOutput()->GetDimensions(dims);
        if (dims[0] <= 0 || dims[1] <= 0 || dims[2] <= 0)
        {
            res.error = QStringLiteral("DICOM series has no pixel data.");
            return res;
        }

        if (auto* md = reader->GetMetaData())
        {
            const vtkDICOMTag seriesDescription(0x0008, 0x103E);
            if (md->Has(seriesDescription))
                res.seriesDescription = QString::fromStdString(md->Get(seriesDescription).AsString());
        }

        res.image = vtkSmartPointer<vtkImageData>::New();
        res.image->ShallowCopy(reader->GetOutput());

        qCInfo(lcApp) << "loaded DICOM series" << res.seriesDescription
                      << dims[0] << "x" << dims[1] << "x" << dims[2];
        return res;
    }
}

namespace VolumeLoader
{
    Result loadFolder(const QString& folder)
    {
        Result res;

        auto dir = vtkSmartPointer<vtkDICOMDirectory>::New();
        auto err = vtkSmartPointer<VtkErrorCatcher>::New();
        dir->AddObserver(vtkCommand::ErrorEvent, err);
        dir->SetDirectoryName(folder.toUtf8().constData());
        dir->SetScanDepth(2);
        dir->Update();

        if (err->hasError || dir->GetNumberOfSeries() == 0)
        {
            res.error = QStringLiteral("No DICOM series found in %1").arg(folder);
            qCWarning(lcApp) << res.error;
            return res;
        }

        int best = 0;
        vtkIdType bestCount = 0;
        for (int s = 0; s < dir->GetNumberOfSeries(); ++s)
        {
            vtkStringArray* files = dir->GetFileNamesForSeries(s);
            if (files && files->GetNumberOfValues() > bestCount)
            {
                bestCount = files->GetNumberOfValues();
                best = s;
            }
        }

        qCDebug(lcApp) << "folder" << folder << "has" << dir->GetNumberOfSeries()
                       << "series, picked" << best << "with" << bestCount << "files";

        res = readSeries(dir->GetFileNamesForSeries(best));
        if (!res.ok())
            qCWarning(lcApp) << "series read failed:" << res.error;
        return res;
    }
}
