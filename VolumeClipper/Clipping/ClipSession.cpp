#include "ClipSession.h"
#include "ClipLogging.h"
#include "MaskAccumulator.h"
#include "MaskRasterizer.h"
#include "Projector.h"
#include <utility>

ClipSession::ClipSession(const CameraSource& camera,
    const VolumeGeometrySource& volume,
    ClipRenderTarget* target)
    : mCamera(camera)
    , mVolume(volume)
    , mTarget(target)
    , mSelector(camera, volume, *this, target)
{
}

void ClipSession::setRenderTarget(ClipRenderTarget* target)
{
    mTarget = target;
    mSelector.setPreviewTarget(target);
}

void ClipSession::setCompressionLevel(int level)
{
    mCompressionLevel = (level < -1 || level > 9) ? -1 : level;
}

void ClipSession::onVolumeLoaded()
{
    mSelector.disable();
    mPending.reset();
    mHistory.clear();
    mState = ClippingState{};

    const auto geometry = mVolume.volumeGeometry();
    if (!geometry)
    {
        mMask = VoxelMask{};
        qCInfo(lcSession) << "volume unloaded";
        return;
    }

    mMask = MaskAccumulator::resetToDefault(*geometry);
    qCInfo(lcSession) << "volume loaded:" << geometry->describe();
    if (mTarget)
        mTarget->onMaskUpdated(mMask);
}

void ClipSession::beginSelection(ClipMode mode)
{
    mPending.reset();
    mMode = mode;
    // Closed -> новый контур
    mSelector.disable();
    mSelector.enable();
    qCInfo(lcSession) << "selection started:" << toString(mode);
}

void ClipSession::cancel()
{
    const bool had = mPending.has_value() || mSelector.state() != RegionSelector::State::Idle;
    mPending.reset();
    mSelector.cancel();
    if (had)
        qCInfo(lcSession) << "selection cancelled";
}

void ClipSession::onRegionClosed(const std::vector<DisplayPoint>& displayPoints,
    const std::vector<WorldPoint>& worldPoints)
{
    Q_UNUSED(displayPoints);

    const auto dir = Projector::viewDirection(mCamera);
    if (!dir)
    {
        qCWarning(lcSession) << "region dropped: camera has no view direction";
        mPending.reset();
        return;
    }

    Region r;
    r.mode = mMode;
    r.polygon = worldPoints;
    r.viewNormal = *dir;
    mPending = std::move(r);
    qCInfo(lcSession) << "region pending with" << worldPoints.size() << "points";
}

ClipSession::ApplyStatus ClipSession::apply(const Region& region)
{
    const auto geometry = mVolume.volumeGeometry();
    if (!geometry)
    {
        qCInfo(lcSession) << "apply ignored: no volume";
        return ApplyStatus::NoVolume;
    }
    if (region.polygon.size() < 3)
    {
        qCInfo(lcSession) << "apply ignored: region has" << region.polygon.size() << "points";
        return ApplyStatus::NoRegion;
    }

    auto regionMask = MaskRasterizer::rasterize(region, *geometry);
    if (!regionMask)
    {
        qCWarning(lcSession) << "apply aborted: degenerate region geometry";
        return ApplyStatus::DegenerateGeometry;
    }

    const VoxelMask base = mMask.isEmpty() ? MaskAccumulator::resetToDefault(*geometry) : mMask;
    VoxelMask next = MaskAccumulator::accumulate(base, *regionMask);

    Command<ClippingState> cmd{ mState, ClippingState::capture(next, mCompressionLevel) };
    qCDebug(lcSession) << "snapshot" << cmd.after.compressedSize() << "bytes for"
                       << cmd.after.voxelCount() << "voxels";

    mHistory.doCommand(cmd, [this, &next](const ClippingState& s) {
        commit(std::move(next), s);
    });

    qCInfo(lcSession) << "applied" << toString(region.mode) << "region, hidden voxels:" << mMask.hiddenCount();
    return ApplyStatus::Applied;
}

ClipSession::ApplyStatus ClipSession::applyPending()
{
    if (!mPending)
        return ApplyStatus::NoRegion;

    const Region region = *mPending;
    const ApplyStatus st = apply(region);
    if (st == ApplyStatus::Applied || st == ApplyStatus::DegenerateGeometry)
    {
        mPending.reset();
        mSelector.disable();
    }
    return st;
}

bool ClipSession::undo()
{
    return mHistory.undo([this](const ClippingState& s) { applyState(s); });
}

bool ClipSession::redo()
{
    return mHistory.redo([this](const ClippingState& s) { applyState(s); });
}

bool ClipSession::resetClipping()
{
    if (!mState.enabled())
        return false;

    const auto geometry = mVolume.volumeGeometry();
    if (!geometry)
        return false;

    Command<ClippingState> cmd{ mState, ClippingState{} };
    mHistory.doCommand(cmd, [this, &geometry](const ClippingState& s) {
        commit(MaskAccumulator::resetToDefault(*geometry), s);
    });
    qCInfo(lcSession) << "clipping reset";
    return true;
}

void ClipSession::applyState(const ClippingState& state)
{
    const auto geometry = mVolume.volumeGeometry();
    if (!geometry)
        throw IntegrityError("cannot restore clipping state: no volume loaded");

    // Распаковка до замены: при ошибке текущая маска остаётся
    VoxelMask m = state.materialize(*geometry);
    commit(std::move(m), state);
}

void ClipSession::commit(VoxelMask mask, const ClippingState& state)
{
    mMask = std::move(mask);
    mState = state;
    if (mTarget)
        mTarget->onMaskUpdated(mMask);
}

QString toString(ClipSession::ApplyStatus status)
{
    switch (status)
    {
    case ClipSession::ApplyStatus::Applied: return QStringLiteral("applied");
    case ClipSession::ApplyStatus::NoVolume: return QStringLiteral("no volume");
    case ClipSession::ApplyStatus::NoRegion: return QStringLiteral("no region");
    case ClipSession::ApplyStatus::DegenerateGeometry: return QStringLiteral("degenerate geometry");
    }
    return {};
}
