#include <gtest/gtest.h>
#include "ClipTestStubs.h"
#include "Clipping/RegionSelector.h"

class RegionSelectorTest : public ::testing::Test
{
protected:
    StubCamera cam;
    FixedVolume vol;
    RecordingObserver observer;
    RecordingTarget preview;
    RegionSelector sel{ cam, vol, observer, &preview };

    void addSquare()
    {
        for (const auto& p : squareOverFirstTwoColumns())
            ASSERT_TRUE(sel.addPoint(p));
    }
};

TEST_F(RegionSelectorTest, StartsIdleAndIgnoresPoints)
{
    EXPECT_EQ(sel.state(), RegionSelector::State::Idle);
    EXPECT_FALSE(sel.addPoint({ 1.0, 1.0 }));
    EXPECT_TRUE(sel.displayPoints().empty());
}

TEST_F(RegionSelectorTest, EnableIsIdempotentWhileSelecting)
{
    sel.enable();
    sel.addPoint({ 0.0, 0.0 });
    sel.enable();
    EXPECT_EQ(sel.state(), RegionSelector::State::Selecting);
    EXPECT_EQ(sel.displayPoints().size(), 1u);
}

TEST_F(RegionSelectorTest, ConsecutiveDuplicatesAreDropped)
{
    sel.enable();
    EXPECT_TRUE(sel.addPoint({ 1.0, 2.0 }));
    EXPECT_FALSE(sel.addPoint({ 1.0, 2.0 }));
    EXPECT_TRUE(sel.addPoint({ 2.0, 2.0 }));
    EXPECT_TRUE(sel.addPoint({ 1.0, 2.0 }));
    EXPECT_EQ(sel.displayPoints().size(), 3u);
}

TEST_F(RegionSelectorTest, CompleteWithTwoPointsIsNoOp)
{
    sel.enable();
    sel.addPoint({ 0.0, 0.0 });
    sel.addPoint({ 1.0, 0.0 });

    EXPECT_FALSE(sel.complete());
    EXPECT_EQ(sel.state(), RegionSelector::State::Selecting);
    EXPECT_EQ(sel.displayPoints().size(), 2u);
    EXPECT_EQ(observer.closed, 0);
}

TEST_F(RegionSelectorTest, CompleteNotifiesObserverAndCloses)
{
    sel.enable();
    addSquare();

    EXPECT_TRUE(sel.complete());
    EXPECT_EQ(sel.state(), RegionSelector::State::Closed);
    ASSERT_EQ(observer.closed, 1);
    ASSERT_EQ(observer.display.size(), 4u);
    ASSERT_EQ(observer.world.size(), 4u);
    EXPECT_EQ(observer.display[2], (DisplayPoint{ 1.5, 3.5 }));
    EXPECT_DOUBLE_EQ(observer.world[2].z, 1.5);

    // Closed - терминальное: точки больше не принимаются
    EXPECT_FALSE(sel.addPoint({ 9.0, 9.0 }));
    EXPECT_FALSE(sel.complete());
    EXPECT_EQ(observer.closed, 1);
}

TEST_F(RegionSelectorTest, CompleteOutsideSelectionLeavesStateAlone)
{
    EXPECT_FALSE(sel.complete());
    EXPECT_EQ(sel.state(), RegionSelector::State::Idle);

    sel.enable();
    addSquare();
    ASSERT_TRUE(sel.complete());

    // повторное закрытие не трогает собранный контур
    EXPECT_FALSE(sel.complete());
    EXPECT_EQ(sel.state(), RegionSelector::State::Closed);
    EXPECT_EQ(sel.displayPoints().size(), 4u);
    EXPECT_EQ(observer.closed, 1);
}

TEST_F(RegionSelectorTest, EnableAfterCloseStartsFresh)
{
    sel.enable();
    addSquare();
    ASSERT_TRUE(sel.complete());

    sel.enable();
    EXPECT_EQ(sel.state(), RegionSelector::State::Selecting);
    EXPECT_TRUE(sel.displayPoints().empty());
}

TEST_F(RegionSelectorTest, DisableDiscardsPartialPolygon)
{
    sel.enable();
    sel.addPoint({ 0.0, 0.0 });
    sel.addPoint({ 1.0, 0.0 });
    sel.cancel();

    EXPECT_EQ(sel.state(), RegionSelector::State::Idle);
    EXPECT_TRUE(sel.displayPoints().empty());
    ASSERT_FALSE(preview.previews.empty());
    EXPECT_TRUE(preview.previews.back().empty());
}

TEST_F(RegionSelectorTest, RemoveLastPoint)
{
    sel.enable();
    sel.addPoint({ 0.0, 0.0 });
    sel.addPoint({ 1.0, 0.0 });
    EXPECT_TRUE(sel.removeLastPoint());
    ASSERT_EQ(sel.displayPoints().size(), 1u);
    EXPECT_EQ(sel.displayPoints()[0], (DisplayPoint{ 0.0, 0.0 }));
    EXPECT_TRUE(sel.removeLastPoint());
    EXPECT_FALSE(sel.removeLastPoint());
}

TEST_F(RegionSelectorTest, AddPointRefreshesPreview)
{
    sel.enable();
    sel.addPoint({ 0.0, 0.0 });
    sel.addPoint({ 1.0, 0.0 });

    ASSERT_EQ(preview.previews.size(), 2u);
    EXPECT_EQ(preview.previews.back().size(), 2u);
    EXPECT_DOUBLE_EQ(preview.previews.back()[1].x, 1.0);
}

TEST_F(RegionSelectorTest, CameraChangeReprojectsCapturedPoints)
{
    sel.enable();
    addSquare();
    EXPECT_DOUBLE_EQ(sel.worldPoints()[0].z, 1.5);

    // Том сдвинулся по глубине: те же клики ложатся на новую плоскость
    vol.geometry = VolumeGeometry::fromDimensions(4, 4, 4, { 1.0, 1.0, 1.0 }, { 0.0, 0.0, 2.0 });
    sel.onCameraChanged();

    ASSERT_EQ(sel.worldPoints().size(), 4u);
    EXPECT_DOUBLE_EQ(sel.worldPoints()[0].z, 3.5);
    EXPECT_EQ(sel.displayPoints().size(), 4u);
    EXPECT_DOUBLE_EQ(preview.previews.back()[0].z, 3.5);
}

TEST_F(RegionSelectorTest, DegenerateProjectionAbortsToIdle)
{
    sel.enable();
    addSquare();
    cam.w = 0.0;

    EXPECT_FALSE(sel.complete());
    EXPECT_EQ(sel.state(), RegionSelector::State::Idle);
    EXPECT_EQ(observer.closed, 0);
}

TEST_F(RegionSelectorTest, ZeroLengthViewVectorAbortsToIdle)
{
    sel.enable();
    addSquare();
    cam.position = cam.focal;

    EXPECT_FALSE(sel.complete());
    EXPECT_EQ(sel.state(), RegionSelector::State::Idle);
    EXPECT_EQ(observer.closed, 0);
}
