#include "RegionSelector.h"
#include "ClipLogging.h"
#include "Projector.h"

RegionSelector::RegionSelector(const CameraSource& camera,
    const VolumeGeometrySource& volume,
    RegionSelectionObserver& observer,
    ClipRenderTarget* preview)
    : mCamera(camera)
    , mVolume(volume)
    , mObserver(observer)
    , mPreview(preview)
{
}

void RegionSelector::enable()
{
    if (mState == State::Selecting)
        return;

    reset();
    mState = State::Selecting;
    qCInfo(lcSelection) << "region selection enabled";
}

void RegionSelector::disable()
{
    if (mState == State::Idle)
        return;

    const bool hadPoints = !mDisplay.empty();
    reset();
    mState = State::Idle;
    refreshPreview();
    qCInfo(lcSelection) << "region selection disabled" << (hadPoints ? "(partial polygon discarded)" : "");
}

bool RegionSelector::addPoint(const DisplayPoint& display)
{
    if (mState != State::Selecting)
        return false;

    if (!mDisplay.empty() && mDisplay.back() == display)
    {
        qCDebug(lcSelection) << "duplicate point ignored" << display.x << display.y;
        return false;
    }

    mDisplay.push_back(display);
    invalidateProjection();
    refreshPreview();
    return true;
}

bool RegionSelector::removeLastPoint()
{
    if (mState != State::Selecting || mDisplay.empty())
        return false;

    mDisplay.pop_back();
    invalidateProjection();
    refreshPreview();
    return true;
}

bool RegionSelector::complete()
{
    if (mState != State::Selecting)
    {
        qCInfo(lcSelection) << "complete ignored: selection is"
                            << (mState == State::Closed ? "already closed" : "not active");
        return false;
    }
    if (mDisplay.size() < 3)
    {
        qCInfo(lcSelection) << "complete ignored: need at least 3 points, have" << mDisplay.size();
        return false;
    }

    // камера могла уйти без onCameraChanged: проецируем заново
    reproject();
    const auto& world = mWorld;
    if (world.size() < 3)
    {
        qCWarning(lcSelection) << "projection degenerate:" << world.size() << "of" << mDisplay.size()
                               << "points projected, selection discarded";
        reset();
        mState = State::Idle;
        refreshPreview();
        return false;
    }

    mState = State::Closed;
    const auto display = mDisplay;
    const auto projected = world;
    qCInfo(lcSelection) << "region closed with" << display.size() << "points";
    mObserver.onRegionClosed(display, projected);
    return true;
}

void RegionSelector::onCameraChanged()
{
    if (mState != State::Selecting || mDisplay.empty())
        return;

    reproject();
    refreshPreview();
}

const std::vector<WorldPoint>& RegionSelector::worldPoints()
{
    if (!mWorldValid)
        reproject();
    return mWorld;
}

void RegionSelector::reset()
{
    mDisplay.clear();
    invalidateProjection();
}

void RegionSelector::invalidateProjection()
{
    mWorld.clear();
    mWorldValid = false;
}

void RegionSelector::reproject()
{
    mWorld = Projector::projectToReferencePlane(mDisplay, mCamera, mVolume);
    mWorldValid = true;
}

void RegionSelector::refreshPreview()
{
    if (!mPreview)
        return;
    if (mState == State::Selecting && !mDisplay.empty())
        mPreview->onPreviewPolygon(worldPoints());
    else
        mPreview->onPreviewPolygon({});
}
