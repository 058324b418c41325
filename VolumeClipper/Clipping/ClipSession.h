#pragma once
#include <optional>
#include <vector>
#include "ClipCollaborators.h"
#include "ClippingState.h"
#include "HistoryManager.h"
#include "RegionSelector.h"
#include "VoxelMask.h"

// Сессия отсечения одного тома: накопленная маска, история, выбор контура.
// Всё синхронно, в потоке UI.
class ClipSession : public RegionSelectionObserver
{
public:
    enum class ApplyStatus
    {
        Applied,
        NoVolume,
        NoRegion,
        DegenerateGeometry
    };

    ClipSession(const CameraSource& camera,
        const VolumeGeometrySource& volume,
        ClipRenderTarget* target = nullptr);
    ~ClipSession() override = default;

    ClipSession(const ClipSession&) = delete;
    ClipSession& operator=(const ClipSession&) = delete;

    void setRenderTarget(ClipRenderTarget* target);

    // Новый том: всё видно, история пуста, выбор сброшен
    void onVolumeLoaded();

    void beginSelection(ClipMode mode);
    // Бросает выбор и незаприменённый контур; маску и историю не трогает
    void cancel();

    RegionSelector& selector() { return mSelector; }

    bool hasPendingRegion() const { return mPending.has_value(); }
    const std::optional<Region>& pendingRegion() const { return mPending; }

    ApplyStatus apply(const Region& region);
    ApplyStatus applyPending();

    // IntegrityError уходит наверх, стеки истории при этом не меняются
    bool undo();
    bool redo();
    bool canUndo() const { return mHistory.canUndo(); }
    bool canRedo() const { return mHistory.canRedo(); }

    // Отменяемый переход в "отсечение выключено"; false, если и так выключено
    bool resetClipping();

    const VoxelMask& mask() const { return mMask; }
    const ClippingState& state() const { return mState; }
    const HistoryManager<ClippingState>& history() const { return mHistory; }

    void setMaxUndo(int n) { mHistory.setMaxUndo(n); }
    int compressionLevel() const { return mCompressionLevel; }
    void setCompressionLevel(int level);

    void onRegionClosed(const std::vector<DisplayPoint>& displayPoints,
        const std::vector<WorldPoint>& worldPoints) override;

private:
    const CameraSource& mCamera;
    const VolumeGeometrySource& mVolume;
    ClipRenderTarget* mTarget{ nullptr };

    VoxelMask mMask;
    ClippingState mState;
    HistoryManager<ClippingState> mHistory;
    int mCompressionLevel{ -1 };

    ClipMode mMode{ ClipMode::RemoveInside };
    std::optional<Region> mPending;
    RegionSelector mSelector;

    void applyState(const ClippingState& state);
    void commit(VoxelMask mask, const ClippingState& state);
};

QString toString(ClipSession::ApplyStatus status);
