#include <gtest/gtest.h>
#include "ClipTestStubs.h"
#include "Clipping/ClipSession.h"
#include "Clipping/MaskAccumulator.h"

class ClipSessionTest : public ::testing::Test
{
protected:
    StubCamera camera;
    FixedVolume volume;
    RecordingTarget target;
    ClipSession session{ camera, volume, &target };

    void SetUp() override { session.onVolumeLoaded(); }

    void drawSquare()
    {
        for (const auto& p : squareOverFirstTwoColumns())
            session.selector().addPoint(p);
    }
};

TEST_F(ClipSessionTest, LoadedVolumeStartsFullyVisible)
{
    EXPECT_EQ(session.mask().geometry(), *volume.geometry);
    EXPECT_EQ(session.mask().hiddenCount(), 0u);
    EXPECT_FALSE(session.state().enabled());
    EXPECT_FALSE(session.canUndo());
    EXPECT_EQ(target.maskUpdates, 1);
}

TEST_F(ClipSessionTest, ApplyUndoRedo)
{
    ASSERT_EQ(session.apply(squareRegion(ClipMode::RemoveInside)), ClipSession::ApplyStatus::Applied);
    EXPECT_EQ(session.mask().hiddenCount(), 32u);
    EXPECT_TRUE(session.state().enabled());
    const VoxelMask applied = session.mask().clone();

    ASSERT_TRUE(session.undo());
    EXPECT_EQ(session.mask().hiddenCount(), 0u);
    EXPECT_FALSE(session.state().enabled());

    ASSERT_TRUE(session.redo());
    EXPECT_EQ(session.mask(), applied);
    EXPECT_EQ(target.lastMask, applied);
}

TEST_F(ClipSessionTest, UndoRedoWalkThroughSeveralApplies)
{
    std::vector<VoxelMask> steps{ session.mask().clone() };
    const Region regions[] = {
        squareRegion(ClipMode::RemoveInside),
        squareRegion(ClipMode::RemoveInside, 1.5, 3.5, -0.5, 0.5),
        squareRegion(ClipMode::RemoveOutside, -0.5, 3.5, -0.5, 2.5),
    };
    for (const auto& r : regions)
    {
        ASSERT_EQ(session.apply(r), ClipSession::ApplyStatus::Applied);
        steps.push_back(session.mask().clone());
    }
    ASSERT_EQ(steps.back().hiddenCount(), 32u + 8u + 8u);

    for (int i = int(steps.size()) - 2; i >= 0; --i)
    {
        ASSERT_TRUE(session.undo());
        EXPECT_EQ(session.mask(), steps[size_t(i)]) << "after undo to step " << i;
    }
    EXPECT_FALSE(session.canUndo());

    for (size_t i = 1; i < steps.size(); ++i)
    {
        ASSERT_TRUE(session.redo());
        EXPECT_EQ(session.mask(), steps[i]) << "after redo to step " << i;
    }
    EXPECT_FALSE(session.canRedo());
}

TEST_F(ClipSessionTest, SelectionFlowThroughPendingRegion)
{
    session.beginSelection(ClipMode::RemoveInside);
    drawSquare();
    ASSERT_TRUE(session.selector().complete());

    ASSERT_TRUE(session.hasPendingRegion());
    EXPECT_EQ(session.pendingRegion()->polygon.size(), 4u);
    EXPECT_NEAR(session.pendingRegion()->viewNormal[2], -1.0, 1e-12);
    EXPECT_EQ(session.mask().hiddenCount(), 0u);

    EXPECT_EQ(session.applyPending(), ClipSession::ApplyStatus::Applied);
    EXPECT_FALSE(session.hasPendingRegion());
    EXPECT_EQ(session.selector().state(), RegionSelector::State::Idle);
    EXPECT_EQ(session.mask().hiddenCount(), 32u);
    for (int k = 0; k < 4; ++k)
        for (int j = 0; j < 4; ++j)
            EXPECT_TRUE(session.mask().isHidden(1, j, k) && !session.mask().isHidden(2, j, k));
}

TEST_F(ClipSessionTest, InverseModeKeepsInsideOfContour)
{
    session.beginSelection(ClipMode::RemoveOutside);
    drawSquare();
    ASSERT_TRUE(session.selector().complete());
    ASSERT_EQ(session.applyPending(), ClipSession::ApplyStatus::Applied);

    EXPECT_EQ(session.mask().hiddenCount(), 32u);
    EXPECT_FALSE(session.mask().isHidden(0, 0, 0));
    EXPECT_TRUE(session.mask().isHidden(3, 0, 0));
}

TEST_F(ClipSessionTest, TwoPointSelectionChangesNothing)
{
    session.beginSelection(ClipMode::RemoveInside);
    session.selector().addPoint({ 0.0, 0.0 });
    session.selector().addPoint({ 1.0, 1.0 });

    EXPECT_FALSE(session.selector().complete());
    EXPECT_FALSE(session.hasPendingRegion());
    EXPECT_EQ(session.applyPending(), ClipSession::ApplyStatus::NoRegion);
    EXPECT_EQ(session.mask().hiddenCount(), 0u);
    EXPECT_FALSE(session.canUndo());
}

TEST_F(ClipSessionTest, CancelKeepsMaskAndHistory)
{
    ASSERT_EQ(session.apply(squareRegion(ClipMode::RemoveInside)), ClipSession::ApplyStatus::Applied);

    session.beginSelection(ClipMode::RemoveInside);
    drawSquare();
    ASSERT_TRUE(session.selector().complete());
    session.cancel();

    EXPECT_FALSE(session.hasPendingRegion());
    EXPECT_EQ(session.selector().state(), RegionSelector::State::Idle);
    EXPECT_EQ(session.mask().hiddenCount(), 32u);
    EXPECT_EQ(session.history().undoCount(), 1);
}

TEST_F(ClipSessionTest, NewApplyAfterUndoClearsRedo)
{
    session.apply(squareRegion(ClipMode::RemoveInside));
    session.apply(squareRegion(ClipMode::RemoveInside, 1.5, 3.5, -0.5, 0.5));
    ASSERT_TRUE(session.undo());
    ASSERT_TRUE(session.canRedo());

    session.apply(squareRegion(ClipMode::RemoveInside, 1.5, 3.5, 2.5, 3.5));
    EXPECT_FALSE(session.canRedo());
    EXPECT_FALSE(session.redo());
}

TEST_F(ClipSessionTest, ResetIsUndoable)
{
    EXPECT_FALSE(session.resetClipping());

    session.apply(squareRegion(ClipMode::RemoveInside));
    const VoxelMask applied = session.mask().clone();

    ASSERT_TRUE(session.resetClipping());
    EXPECT_EQ(session.mask().hiddenCount(), 0u);
    EXPECT_FALSE(session.state().enabled());

    ASSERT_TRUE(session.undo());
    EXPECT_EQ(session.mask(), applied);
}

TEST_F(ClipSessionTest, UndoDepthIsBounded)
{
    session.setMaxUndo(2);
    for (int i = 0; i < 4; ++i)
        session.apply(squareRegion(ClipMode::RemoveInside, i - 0.5, i + 0.5, -0.5, 0.5));

    EXPECT_TRUE(session.undo());
    EXPECT_TRUE(session.undo());
    EXPECT_FALSE(session.undo());
    // первые два вырезания уже не отменить
    EXPECT_EQ(session.mask().hiddenCount(), 8u);
}

TEST_F(ClipSessionTest, NoVolumeIsReported)
{
    volume.geometry.reset();
    session.onVolumeLoaded();

    EXPECT_EQ(session.apply(squareRegion(ClipMode::RemoveInside)), ClipSession::ApplyStatus::NoVolume);
    EXPECT_TRUE(session.mask().isEmpty());
    EXPECT_FALSE(session.canUndo());
}

TEST_F(ClipSessionTest, DegenerateRegionIsReported)
{
    Region r = squareRegion(ClipMode::RemoveInside);
    r.viewNormal = { 0.0, 0.0, 0.0 };
    EXPECT_EQ(session.apply(r), ClipSession::ApplyStatus::DegenerateGeometry);
    EXPECT_FALSE(session.canUndo());
    EXPECT_EQ(session.mask().hiddenCount(), 0u);
}

TEST_F(ClipSessionTest, UndoAgainstChangedVolumeThrowsAndKeepsHistory)
{
    session.apply(squareRegion(ClipMode::RemoveInside));
    session.apply(squareRegion(ClipMode::RemoveInside, 1.5, 3.5, -0.5, 0.5));
    const VoxelMask current = session.mask().clone();

    // том подменили без onVolumeLoaded
    volume.geometry = VolumeGeometry::fromDimensions(4, 4, 5);

    EXPECT_THROW(session.undo(), IntegrityError);
    EXPECT_EQ(session.history().undoCount(), 2);
    EXPECT_EQ(session.history().redoCount(), 0);
    EXPECT_EQ(session.mask(), current);
}

TEST_F(ClipSessionTest, NewVolumeDropsHistory)
{
    session.apply(squareRegion(ClipMode::RemoveInside));
    volume.geometry = VolumeGeometry::fromDimensions(8, 8, 8);
    session.onVolumeLoaded();

    EXPECT_FALSE(session.canUndo());
    EXPECT_EQ(session.mask().geometry(), *volume.geometry);
    EXPECT_EQ(session.mask().hiddenCount(), 0u);
}

TEST_F(ClipSessionTest, TargetSeesEveryChange)
{
    const int before = target.maskUpdates;
    session.apply(squareRegion(ClipMode::RemoveInside));
    session.undo();
    session.redo();
    EXPECT_EQ(target.maskUpdates, before + 3);
    EXPECT_EQ(target.lastMask.hiddenCount(), 32u);
}

TEST_F(ClipSessionTest, InvalidCompressionLevelFallsBackToDefault)
{
    session.setCompressionLevel(42);
    EXPECT_EQ(session.compressionLevel(), -1);
    session.setCompressionLevel(9);
    EXPECT_EQ(session.compressionLevel(), 9);
}
