#pragma once
#include <vector>
#include "ClipCollaborators.h"

// Сбор вершин одного контура. Idle -> Selecting -> {Idle | Closed}.
// Closed - конечное состояние, новый контур начинается с enable().
class RegionSelector
{
public:
    enum class State { Idle, Selecting, Closed };

    RegionSelector(const CameraSource& camera,
        const VolumeGeometrySource& volume,
        RegionSelectionObserver& observer,
        ClipRenderTarget* preview = nullptr);

    void setPreviewTarget(ClipRenderTarget* preview) { mPreview = preview; }

    void enable();
    void disable();
    void cancel() { disable(); }

    // false, если точка не принята (выключено или дубль предыдущей)
    bool addPoint(const DisplayPoint& display);
    bool removeLastPoint();

    // true, если контур закрыт и наблюдатель получил точки
    bool complete();

    // Камеру покрутили: перепроецируем уже снятые точки, не трогая сами клики
    void onCameraChanged();

    State state() const { return mState; }

    const std::vector<DisplayPoint>& displayPoints() const { return mDisplay; }
    const std::vector<WorldPoint>& worldPoints();

private:
    const CameraSource& mCamera;
    const VolumeGeometrySource& mVolume;
    RegionSelectionObserver& mObserver;
    ClipRenderTarget* mPreview{ nullptr };

    State mState{ State::Idle };
    std::vector<DisplayPoint> mDisplay;
    std::vector<WorldPoint> mWorld;   // кэш проекции
    bool mWorldValid{ false };

    void reset();
    void invalidateProjection();
    void reproject();
    void refreshPreview();
};
