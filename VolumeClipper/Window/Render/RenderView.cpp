#include "RenderView.h"
#include "MouseControl.h"
#include "Clipping/ClipLogging.h"
#include "Services/AppConfig.h"
#include "Services/LogSetup.h"
#include <QVTKOpenGLNativeWidget.h>
#include <QApplication>
#include <QMenu>
#include <QAction>
#include <QFrame>
#include <QHBoxLayout>
#include <QShortcut>
#include <QKeySequence>
#include <QTimer>
#include <vtkRenderWindow.h>
#include <vtkGenericOpenGLRenderWindow.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkGPUVolumeRayCastMapper.h>
#include <vtkVolumeProperty.h>
#include <vtkColorTransferFunction.h>
#include <vtkPiecewiseFunction.h>
#include <vtkCamera.h>
#include <vtkPointData.h>
#include <vtkDataArray.h>
#include <vtkPoints.h>
#include <vtkCellArray.h>
#include <vtkPolyData.h>
#include <vtkPolyDataMapper.h>
#include <vtkActor.h>
#include <vtkProperty.h>
#include <vtkAutoInit.h>

#include <algorithm>
#include <cmath>

VTK_MODULE_INIT(vtkRenderingOpenGL2);
VTK_MODULE_INIT(vtkRenderingVolumeOpenGL2);

static void applyMenuStyle(QMenu* m, int width = 180)
{
    m->setAttribute(Qt::WA_StyledBackground, true);
    m->setAttribute(Qt::WA_TranslucentBackground, false);
    m->setAutoFillBackground(true);
    m->setFixedWidth(width);

    m->setStyleSheet(
        "QMenu{"
        "  background:rgba(22,22,22,0.96);"
        "  border:1px solid rgba(255,255,255,0.18);"
        "  border-radius:10px;"
        "  padding:6px;"
        "}"
        "QMenu::separator{"
        "  height:1px; background:rgba(255,255,255,0.12);"
        "  margin:6px 8px;"
        "}"
        "QMenu::item{"
        "  color:#fff; padding:6px 10px;"
        "  border-radius:6px;"
        "}"
        "QMenu::item:selected{"
        "  background:rgba(255,255,255,0.12);"
        "}"
    );
}

static QWidget* makeNativeOverlay(QWidget* owner)
{
    auto* w = new QWidget(owner);
    w->setAttribute(Qt::WA_TranslucentBackground, true);
    w->setAttribute(Qt::WA_NoSystemBackground, true);
    w->setAttribute(Qt::WA_ShowWithoutActivating, true);
    w->setAttribute(Qt::WA_TransparentForMouseEvents, false);
    w->setFocusPolicy(Qt::NoFocus);
    w->setMouseTracking(true);
    return w;
}

static QToolButton* makeOverlayBtn(QWidget* parent, const QString& text, int width)
{
    auto* b = new QToolButton(parent);
    b->setText(text);
    b->setCursor(Qt::PointingHandCursor);
    b->setFocusPolicy(Qt::NoFocus);
    b->setFixedSize(width, 26);
    b->setStyleSheet(
        "QToolButton{ color:#fff; background:rgba(40,40,40,110);"
        " border:1px solid rgba(255,255,255,30); border-radius:6px; padding:0 8px; }"
        "QToolButton:hover{ background:rgba(255,255,255,40); }"
        "QToolButton:pressed{ background:rgba(255,255,255,70); }"
        "QToolButton:checked{ background:rgba(0,180,100,140); }"
        "QToolButton:disabled{ color:rgba(255,255,255,80); }"
    );
    return b;
}

RenderView::RenderView(QWidget* parent) : QWidget(parent)
{
    auto* lay = new QVBoxLayout(this);
    lay->setContentsMargins(0, 0, 0, 0);

    mVtk = new QVTKOpenGLNativeWidget(this);
    lay->addWidget(mVtk);

    mWindow = vtkSmartPointer<vtkGenericOpenGLRenderWindow>::New();
    mVtk->setRenderWindow(mWindow);

    mRenderer = vtkSmartPointer<vtkRenderer>::New();
    mWindow->AddRenderer(mRenderer);
    mRenderer->SetBackground(0.06, 0.06, 0.07);

    mCameraSource.setRenderer(mRenderer);
    mSession = std::make_unique<ClipSession>(mCameraSource, mGeometrySource, this);

    auto style = vtkSmartPointer<InteractorStyleClipNavigation>::New();
    style->setOnCameraMoved([this] { mSession->selector().onCameraChanged(); });
    mVtk->interactor()->SetInteractorStyle(style);

    auto sc = new QShortcut(QKeySequence(Qt::Key_F12), this);
    connect(sc, &QShortcut::activated, this, &RenderView::centerOnVolume);

    buildPreviewActor();
    buildOverlay();

    mScissors = std::make_unique<ToolsScissors>(this);
    mScissors->setAllowNavigation(true);
    mScissors->attach(mVtk, mSession.get());
    mScissors->setOnFinished([this] {
        setToolUiActive(false, mCurrentTool);
        updateClipUi();
        });
    mScissors->setOnRegionClosed([this] {
        updateClipUi();
        emit showInfo(tr("Region closed: Apply or Cancel"));
        });
}

RenderView::~RenderView()
{
    if (mScissors)
    {
        mScissors->setOnFinished(nullptr);
        mScissors->setOnRegionClosed(nullptr);
        mScissors->cancel();
    }
    mScissors.reset();
    if (mSession)
        mSession->setRenderTarget(nullptr);
}

void RenderView::applyConfig(const AppConfig& config)
{
    mSession->setMaxUndo(config.maxUndo);
    mSession->setCompressionLevel(config.compressionLevel);
    updateClipUi();
}

void RenderView::buildPreviewActor()
{
    mPreviewPoly = vtkSmartPointer<vtkPolyData>::New();
    mPreviewPoly->SetPoints(vtkSmartPointer<vtkPoints>::New());
    mPreviewPoly->SetLines(vtkSmartPointer<vtkCellArray>::New());

    auto mapper = vtkSmartPointer<vtkPolyDataMapper>::New();
    mapper->SetInputData(mPreviewPoly);

    mPreviewActor = vtkSmartPointer<vtkActor>::New();
    mPreviewActor->SetMapper(mapper);
    mPreviewActor->GetProperty()->SetColor(1.0, 0.85, 0.2);
    mPreviewActor->GetProperty()->SetLineWidth(2.0);
    mPreviewActor->GetProperty()->LightingOff();
    mPreviewActor->PickableOff();
    mPreviewActor->SetVisibility(false);
}

void RenderView::buildOverlay()
{
    // ---------- ПРАВАЯ ПАНЕЛЬ ----------
    mRightOverlay = makeNativeOverlay(this);

    auto* rightPanel = new QWidget(mRightOverlay);
    auto* rv = new QVBoxLayout(rightPanel);
    rv->setContentsMargins(0, 42, 12, 0);
    rv->setSpacing(6);

    mBtnAP = makeOverlayBtn(rightPanel, "AP", 62);
    mBtnPA = makeOverlayBtn(rightPanel, "PA", 62);
    mBtnL = makeOverlayBtn(rightPanel, "L", 62);
    mBtnR = makeOverlayBtn(rightPanel, "R", 62);
    for (auto* b : { mBtnAP, mBtnPA, mBtnL, mBtnR })
        rv->addWidget(b);
    rv->addStretch();

    rightPanel->adjustSize();
    mRightOverlay->resize(rightPanel->sizeHint());

    // ---------- ВЕРХНЯЯ ПАНЕЛЬ ----------
    mTopOverlay = makeNativeOverlay(this);

    auto* topPanel = new QWidget(mTopOverlay);
    auto* th = new QHBoxLayout(topPanel);
    th->setContentsMargins(12, 8, 0, 0);
    th->setSpacing(6);

    mBtnTools = makeOverlayBtn(topPanel, tr("Edit"), 146);
    mBtnTools->setCheckable(true);
    mToolsMenu = Tools::CreateMenu(mTopOverlay, [this](Action a) { ToolModeChanged(a); });
    applyMenuStyle(mToolsMenu, mBtnTools->width());

    connect(mToolsMenu, &QMenu::aboutToShow, this, [this] {
        if (!mToolActive) return;
        if (mScissors)
            mScissors->cancel();
        setToolUiActive(false, mCurrentTool);
        });

    mBtnTools->setMenu(mToolsMenu);
    mBtnTools->setPopupMode(QToolButton::InstantPopup);
    th->addWidget(mBtnTools);

    mBtnApply = makeOverlayBtn(topPanel, tr("Apply"), 62);
    mBtnCancel = makeOverlayBtn(topPanel, tr("Cancel"), 62);
    mBtnApply->setEnabled(false);
    mBtnCancel->setEnabled(false);
    th->addWidget(mBtnApply);
    th->addWidget(mBtnCancel);

    auto* line = new QFrame(topPanel);
    line->setFrameShape(QFrame::VLine);
    line->setStyleSheet("color: rgba(255,255,255,40);");
    th->addWidget(line);

    mBtnUndo = makeOverlayBtn(topPanel, tr("Undo"), 62);
    mBtnUndo->setToolTip(tr("Undo (Ctrl+Z)"));
    mBtnUndo->setEnabled(false);
    th->addWidget(mBtnUndo);

    mBtnRedo = makeOverlayBtn(topPanel, tr("Redo"), 62);
    mBtnRedo->setToolTip(tr("Redo (Ctrl+Y)"));
    mBtnRedo->setEnabled(false);
    th->addWidget(mBtnRedo);

    connect(mBtnApply, &QToolButton::clicked, this, &RenderView::onApply);
    connect(mBtnCancel, &QToolButton::clicked, this, &RenderView::onCancel);
    connect(mBtnUndo, &QToolButton::clicked, this, &RenderView::onUndo);
    connect(mBtnRedo, &QToolButton::clicked, this, &RenderView::onRedo);

    auto* scUndo = new QShortcut(QKeySequence::Undo, this);
    auto* scRedo = new QShortcut(QKeySequence::Redo, this);
    connect(scUndo, &QShortcut::activated, this, &RenderView::onUndo);
    connect(scRedo, &QShortcut::activated, this, &RenderView::onRedo);

    th->addStretch();
    topPanel->adjustSize();
    mTopOverlay->resize(topPanel->sizeHint());

    connect(mBtnAP, &QToolButton::clicked, this, [this] { setViewPreset(ViewPreset::AP); });
    connect(mBtnPA, &QToolButton::clicked, this, [this] { setViewPreset(ViewPreset::PA); });
    connect(mBtnL, &QToolButton::clicked, this, [this] { setViewPreset(ViewPreset::L); });
    connect(mBtnR, &QToolButton::clicked, this, [this] { setViewPreset(ViewPreset::R); });

    repositionOverlay();
    mOverlaysBuilt = true;
}

void RenderView::requestRender()
{
    if (mRenderPending) return;
    mRenderPending = true;
    QTimer::singleShot(0, this, [this] {
        mRenderPending = false;
        if (mVtk && mVtk->renderWindow())
            mVtk->renderWindow()->Render();
        });
}

void RenderView::onMaskUpdated(const VoxelMask& mask)
{
    if (!mMapper) return;

    // Пока ничего не спрятано - маппер без маски
    if (mask.isEmpty() || mask.hiddenCount() == 0)
    {
        mKeepMask = nullptr;
        mMapper->SetMaskInput(nullptr);
    }
    else
    {
        mKeepMask = mask.toKeepImage();
        mMapper->SetMaskTypeToBinary();
        mMapper->SetMaskInput(mKeepMask);
    }
    mMapper->Modified();
    updateClipUi();
    requestRender();
}

void RenderView::onPreviewPolygon(const std::vector<WorldPoint>& polygon)
{
    if (!mPreviewPoly) return;

    auto pts = vtkSmartPointer<vtkPoints>::New();
    auto lines = vtkSmartPointer<vtkCellArray>::New();

    if (polygon.size() >= 2)
    {
        pts->SetNumberOfPoints(static_cast<vtkIdType>(polygon.size()));
        for (size_t i = 0; i < polygon.size(); ++i)
            pts->SetPoint(static_cast<vtkIdType>(i), polygon[i].x, polygon[i].y, polygon[i].z);

        // замкнутая ломаная: последняя точка соединяется с первой
        const vtkIdType n = static_cast<vtkIdType>(polygon.size());
        lines->InsertNextCell(n + 1);
        for (vtkIdType i = 0; i < n; ++i)
            lines->InsertCellPoint(i);
        lines->InsertCellPoint(0);
    }

    mPreviewPoly->SetPoints(pts);
    mPreviewPoly->SetLines(lines);
    mPreviewPoly->Modified();
    mPreviewActor->SetVisibility(polygon.size() >= 2);
    requestRender();
}

void RenderView::updateClipUi()
{
    if (!mBtnUndo || !mBtnRedo) return;

    const bool pending = mSession->hasPendingRegion();
    mBtnApply->setEnabled(pending);
    mBtnCancel->setEnabled(pending || (mScissors && mScissors->isCollecting()));
    mBtnUndo->setEnabled(mSession->canUndo());
    mBtnRedo->setEnabled(mSession->canRedo());
}

void RenderView::onApply()
{
    try
    {
        const auto st = mSession->applyPending();
        if (st != ClipSession::ApplyStatus::Applied)
            emit showWarning(tr("Nothing clipped: %1").arg(toString(st)));
        else
            emit showInfo(tr("Clipping applied"));
    }
    catch (const ClipError& e)
    {
        qCWarning(lcApp) << "apply failed:" << e.what();
        emit showWarning(tr("Clipping failed: %1").arg(QString::fromUtf8(e.what())));
    }
    updateClipUi();
}

void RenderView::onCancel()
{
    if (mScissors && mScissors->isCollecting())
        mScissors->cancel();
    mSession->cancel();
    updateClipUi();
}

void RenderView::onUndo()
{
    try
    {
        mSession->undo();
    }
    catch (const ClipError& e)
    {
        qCWarning(lcApp) << "undo failed:" << e.what();
        emit showWarning(tr("Undo failed: %1").arg(QString::fromUtf8(e.what())));
    }
    updateClipUi();
}

void RenderView::onRedo()
{
    try
    {
        mSession->redo();
    }
    catch (const ClipError& e)
    {
        qCWarning(lcApp) << "redo failed:" << e.what();
        emit showWarning(tr("Redo failed: %1").arg(QString::fromUtf8(e.what())));
    }
    updateClipUi();
}

void RenderView::onResetClipping()
{
    if (mSession->resetClipping())
        emit showInfo(tr("Clipping reset"));
    updateClipUi();
}

void RenderView::setToolUiActive(bool on, Action a)
{
    mToolActive = on;
    if (!mBtnTools) return;
    if (on)
    {
        mCurrentTool = a;
        mBtnTools->setText(Tools::ToDisplayName(a));
        mBtnTools->setChecked(true);
    }
    else
    {
        mBtnTools->setText(tr("Edit"));
        mBtnTools->setChecked(false);
    }
}

bool RenderView::ToolModeChanged(Action a)
{
    if (!mVolume) return false;

    if (mToolActive) {
        if (mScissors) mScissors->cancel();
        setToolUiActive(false, mCurrentTool);
    }

    if (a == Action::ResetClipping)
    {
        mSession->cancel();
        onResetClipping();
        return true;
    }

    if (mScissors && (a == Action::Scissors || a == Action::InverseScissors))
    {
        setToolUiActive(true, a);
        mScissors->handle(a);
        updateClipUi();
        return true;
    }

    return false;
}

void RenderView::resizeEvent(QResizeEvent* e)
{
    QWidget::resizeEvent(e);
    repositionOverlay();
}

void RenderView::showEvent(QShowEvent* e)
{
    QWidget::showEvent(e);

    if (!mOverlaysBuilt)
        buildOverlay();

    // Позиционирование - на следующем тике, когда геометрия уже валидна
    QTimer::singleShot(0, this, [this] {
        if (mRightOverlay) { mRightOverlay->show(); mRightOverlay->raise(); }
        if (mTopOverlay) { mTopOverlay->show(); mTopOverlay->raise(); }
        repositionOverlay();
        requestRender();
        });
}

void RenderView::repositionOverlay()
{
    if (!mVtk) return;

    const QRect r = mVtk->geometry();
    const int pad = 8;

    if (mScissors)
        mScissors->onViewResized();
    if (mRightOverlay) {
        const QSize sz = mRightOverlay->size();
        mRightOverlay->move(r.right() - sz.width() - pad, r.top() + pad);
        mRightOverlay->raise();
    }
    if (mTopOverlay) {
        mTopOverlay->move(r.left() + pad, r.top() + pad);
        mTopOverlay->raise();
    }
}

void RenderView::centerOnVolume()
{
    if (!mRenderer || !mVolume) return;

    double b[6]; mVolume->GetBounds(b);
    const double cx = 0.5 * (b[0] + b[1]);
    const double cy = 0.5 * (b[2] + b[3]);
    const double cz = 0.5 * (b[4] + b[5]);

    auto* cam = mRenderer->GetActiveCamera();
    if (!cam) return;

    // сохраняем текущую дистанцию и направление взгляда
    double oldPos[3], oldFoc[3];
    cam->GetPosition(oldPos);
    cam->GetFocalPoint(oldFoc);

    double dir[3]{ oldPos[0] - oldFoc[0], oldPos[1] - oldFoc[1], oldPos[2] - oldFoc[2] };
    double len = std::sqrt(dir[0] * dir[0] + dir[1] * dir[1] + dir[2] * dir[2]);
    if (len < 1e-9) len = 1.0;
    dir[0] /= len; dir[1] /= len; dir[2] /= len;

    cam->SetFocalPoint(cx, cy, cz);
    cam->SetPosition(cx + dir[0] * len, cy + dir[1] * len, cz + dir[2] * len);

    mRenderer->ResetCameraClippingRange();
    mSession->selector().onCameraChanged();
    requestRender();
}

void RenderView::setViewPreset(ViewPreset v)
{
    if (!mImage || !mRenderer) return;

    double b[6]; mImage->GetBounds(b);
    const double cx = 0.5 * (b[0] + b[1]);
    const double cy = 0.5 * (b[2] + b[3]);
    const double cz = 0.5 * (b[4] + b[5]);
    const double diag = std::sqrt((b[1] - b[0]) * (b[1] - b[0]) + (b[3] - b[2]) * (b[3] - b[2]) + (b[5] - b[4]) * (b[5] - b[4]));
    const double dist = std::max(diag * 1.5, 1.0);

    // оси LPS без учёта DirectionMatrix: маска строится в той же сетке
    double d[3]{ 0, 1, 0 };
    switch (v) {
    case ViewPreset::AP: d[0] = 0;  d[1] = 1;  d[2] = 0; break;   // взгляд к Posterior
    case ViewPreset::PA: d[0] = 0;  d[1] = -1; d[2] = 0; break;
    case ViewPreset::L:  d[0] = 1;  d[1] = 0;  d[2] = 0; break;
    case ViewPreset::R:  d[0] = -1; d[1] = 0;  d[2] = 0; break;
    }

    auto* cam = mRenderer->GetActiveCamera();
    cam->SetFocalPoint(cx, cy, cz);
    cam->SetPosition(cx - d[0] * dist, cy - d[1] * dist, cz - d[2] * dist);
    cam->SetViewUp(0, 0, 1);
    cam->OrthogonalizeViewUp();
    mRenderer->ResetCameraClippingRange();
    mSession->selector().onCameraChanged();
    requestRender();
}

void RenderView::setVolume(vtkSmartPointer<vtkImageData> image)
{
    if (mScissors) mScissors->cancel();
    setToolUiActive(false, mCurrentTool);

    if (!image) {
        emit showInfo(tr("No image"));
        return;
    }

    int ext[6]; image->GetExtent(ext);
    auto* scal = image->GetPointData() ? image->GetPointData()->GetScalars() : nullptr;
    if (ext[1] < ext[0] || ext[3] < ext[2] || ext[5] < ext[4] || !scal) {
        emit showWarning(tr("Invalid image: empty extent or no scalars."));
        return;
    }

    double range[2]{ 0, 1 };
    scal->GetRange(range, 0);
    if (range[1] <= range[0]) range[1] = range[0] + 1.0;

    mMapper = vtkSmartPointer<vtkGPUVolumeRayCastMapper>::New();
    mMapper->SetInputData(image);
    mMapper->SetBlendModeToComposite();
    mMapper->SetAutoAdjustSampleDistances(true);
    mMapper->SetUseJittering(true);

    auto ctf = vtkSmartPointer<vtkColorTransferFunction>::New();
    ctf->AddRGBPoint(range[0], 0, 0, 0);
    ctf->AddRGBPoint(range[1], 1, 1, 1);
    ctf->SetColorSpaceToLab();

    auto otf = vtkSmartPointer<vtkPiecewiseFunction>::New();
    otf->AddPoint(range[0], 0.00);
    otf->AddPoint(range[0] + 0.25 * (range[1] - range[0]), 0.00);
    otf->AddPoint(range[1], 0.80);

    auto prop = vtkSmartPointer<vtkVolumeProperty>::New();
    prop->SetIndependentComponents(true);
    prop->SetColor(0, ctf);
    prop->SetScalarOpacity(0, otf);
    prop->ShadeOn();
    prop->SetAmbient(0.05);
    prop->SetDiffuse(0.9);
    prop->SetSpecular(0.1);
    prop->SetInterpolationType(VTK_NEAREST_INTERPOLATION);

    double sp[3]{ 1,1,1 };
    image->GetSpacing(sp);
    const double smin = std::min({ sp[0],sp[1],sp[2] });
    prop->SetScalarOpacityUnitDistance(std::max(0.3 * smin, 1e-3));

    auto vol = vtkSmartPointer<vtkVolume>::New();
    vol->SetMapper(mMapper);
    vol->SetProperty(prop);

    mRenderer->RemoveAllViewProps();
    mRenderer->AddVolume(vol);
    mRenderer->AddActor(mPreviewActor);
    mRenderer->ResetCamera();

    mImage = image;
    mVolume = vol;
    mKeepMask = nullptr;
    mGeometrySource.setImage(mImage);

    setViewPreset(ViewPreset::AP);

    // новая маска "всё видно" и пустая история; маппер получит её через onMaskUpdated
    mSession->onVolumeLoaded();
    updateClipUi();

    emit showInfo(tr("Volume %1 x %2 x %3")
        .arg(ext[1] - ext[0] + 1).arg(ext[3] - ext[2] + 1).arg(ext[5] - ext[4] + 1));
    requestRender();
}
