#include <gtest/gtest.h>
#include <stdexcept>
#include "Clipping/HistoryManager.h"

namespace
{
    struct Applied
    {
        int value = 0;
        int calls = 0;
        HistoryManager<int>::ApplyState fn()
        {
            return [this](const int& v) { value = v; ++calls; };
        }
    };
}

TEST(HistoryManager, DoUndoRedo)
{
    HistoryManager<int> h;
    Applied a;

    h.doCommand({ 0, 1 }, a.fn());
    h.doCommand({ 1, 2 }, a.fn());
    EXPECT_EQ(a.value, 2);
    EXPECT_EQ(h.undoCount(), 2);

    EXPECT_TRUE(h.undo(a.fn()));
    EXPECT_EQ(a.value, 1);
    EXPECT_TRUE(h.canRedo());

    EXPECT_TRUE(h.redo(a.fn()));
    EXPECT_EQ(a.value, 2);
    EXPECT_FALSE(h.canRedo());
}

TEST(HistoryManager, EmptyStacksAreNoOps)
{
    HistoryManager<int> h;
    Applied a;
    EXPECT_FALSE(h.undo(a.fn()));
    EXPECT_FALSE(h.redo(a.fn()));
    EXPECT_EQ(a.calls, 0);
}

TEST(HistoryManager, NewCommandClearsRedo)
{
    HistoryManager<int> h;
    Applied a;
    h.doCommand({ 0, 1 }, a.fn());
    h.doCommand({ 1, 2 }, a.fn());
    h.undo(a.fn());
    ASSERT_TRUE(h.canRedo());

    h.doCommand({ 1, 5 }, a.fn());
    EXPECT_FALSE(h.canRedo());
    EXPECT_FALSE(h.redo(a.fn()));
    EXPECT_EQ(a.value, 5);
}

TEST(HistoryManager, OldestCommandFallsOffPastMaxUndo)
{
    HistoryManager<int> h(3);
    Applied a;
    for (int i = 0; i < 5; ++i)
        h.doCommand({ i, i + 1 }, a.fn());

    EXPECT_EQ(h.undoCount(), 3);
    EXPECT_TRUE(h.canUndo());

    int undone = 0;
    while (h.undo(a.fn()))
        ++undone;
    EXPECT_EQ(undone, 3);
    // самый ранний сохранённый before - состояние 2, а не 0
    EXPECT_EQ(a.value, 2);
}

TEST(HistoryManager, SetMaxUndoTrims)
{
    HistoryManager<int> h(10);
    Applied a;
    for (int i = 0; i < 6; ++i)
        h.doCommand({ i, i + 1 }, a.fn());

    h.setMaxUndo(2);
    EXPECT_EQ(h.maxUndo(), 2);
    EXPECT_EQ(h.undoCount(), 2);

    h.setMaxUndo(0);
    EXPECT_EQ(h.maxUndo(), 1);
}

TEST(HistoryManager, FailingApplyLeavesStacksUnchanged)
{
    HistoryManager<int> h;
    Applied a;
    h.doCommand({ 0, 1 }, a.fn());
    h.doCommand({ 1, 2 }, a.fn());
    h.undo(a.fn());

    const auto boom = [](const int&) { throw std::runtime_error("apply failed"); };

    EXPECT_THROW(h.doCommand({ 1, 9 }, boom), std::runtime_error);
    EXPECT_EQ(h.undoCount(), 1);
    EXPECT_EQ(h.redoCount(), 1);

    EXPECT_THROW(h.undo(boom), std::runtime_error);
    EXPECT_EQ(h.undoCount(), 1);
    EXPECT_EQ(h.redoCount(), 1);

    EXPECT_THROW(h.redo(boom), std::runtime_error);
    EXPECT_EQ(h.undoCount(), 1);
    EXPECT_EQ(h.redoCount(), 1);

    // после сбоя история работает как прежде
    EXPECT_TRUE(h.redo(a.fn()));
    EXPECT_EQ(a.value, 2);
}

TEST(HistoryManager, ClearDropsEverything)
{
    HistoryManager<int> h;
    Applied a;
    h.doCommand({ 0, 1 }, a.fn());
    h.undo(a.fn());
    h.clear();
    EXPECT_FALSE(h.canUndo());
    EXPECT_FALSE(h.canRedo());
}
