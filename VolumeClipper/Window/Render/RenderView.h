#pragma once
#include <QWidget>
#include <QVBoxLayout>
#include <QToolButton>
#include <memory>
#include <vector>
#include <vtkSmartPointer.h>
#include <vtkRenderer.h>
#include <vtkVolume.h>
#include <vtkImageData.h>
#include "Tools.h"
#include "ToolsScissors.h"
#include "Clipping/ClipSession.h"
#include "Clipping/VtkSources.h"

class QVTKOpenGLNativeWidget;
class vtkRenderWindow;
class vtkGPUVolumeRayCastMapper;
class vtkPolyData;
class vtkActor;
class QMenu;
struct AppConfig;

enum class ViewPreset { AP, PA, L, R };

// 3D-вид тома с ножницами. Маска отсечения уходит в маппер как binary mask,
// исходные воксели не трогаются.
class RenderView : public QWidget, public ClipRenderTarget
{
    Q_OBJECT
public:
    explicit RenderView(QWidget* parent = nullptr);
    ~RenderView() override;

    void setVolume(vtkSmartPointer<vtkImageData> image);
    void setViewPreset(ViewPreset v);
    void centerOnVolume();
    void applyConfig(const AppConfig& config);

    void onMaskUpdated(const VoxelMask& mask) override;
    void onPreviewPolygon(const std::vector<WorldPoint>& polygon) override;

signals:
    void showInfo(const QString& text);
    void showWarning(const QString& text);

protected:
    void resizeEvent(QResizeEvent* e) override;
    void showEvent(QShowEvent* e) override;

private slots:
    void onUndo();
    void onRedo();
    void onApply();
    void onCancel();
    void onResetClipping();

private:
    vtkSmartPointer<vtkImageData> mImage;
    QVTKOpenGLNativeWidget* mVtk{ nullptr };
    vtkSmartPointer<vtkRenderer> mRenderer;
    vtkSmartPointer<vtkRenderWindow> mWindow;
    vtkSmartPointer<vtkVolume> mVolume;
    vtkSmartPointer<vtkGPUVolumeRayCastMapper> mMapper;
    vtkSmartPointer<vtkImageData> mKeepMask;   // то, что сейчас в SetMaskInput

    RendererCameraSource mCameraSource;
    ImageGeometrySource mGeometrySource;
    std::unique_ptr<ClipSession> mSession;
    std::unique_ptr<ToolsScissors> mScissors;

    vtkSmartPointer<vtkPolyData> mPreviewPoly;
    vtkSmartPointer<vtkActor> mPreviewActor;

    QWidget* mRightOverlay{ nullptr };
    QWidget* mTopOverlay{ nullptr };

    QToolButton* mBtnAP{ nullptr };
    QToolButton* mBtnPA{ nullptr };
    QToolButton* mBtnL{ nullptr };
    QToolButton* mBtnR{ nullptr };

    QToolButton* mBtnTools{ nullptr };
    QMenu* mToolsMenu{ nullptr };
    QToolButton* mBtnApply{ nullptr };
    QToolButton* mBtnCancel{ nullptr };
    QToolButton* mBtnUndo{ nullptr };
    QToolButton* mBtnRedo{ nullptr };

    bool mOverlaysBuilt{ false };
    bool mToolActive{ false };
    Action mCurrentTool{};
    bool mRenderPending{ false };

    void buildOverlay();
    void buildPreviewActor();
    void repositionOverlay();
    bool ToolModeChanged(Action a);
    void setToolUiActive(bool on, Action a);
    void updateClipUi();
    void requestRender();
};
