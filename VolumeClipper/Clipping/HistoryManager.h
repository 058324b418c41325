#pragma once
#include <QVector>
#include <functional>
#include "ClipLogging.h"

template <typename T>
struct Command
{
    T before;
    T after;
};

// Undo/redo над снимками. applyState вызывается до изменения стеков:
// если он бросил исключение, стеки остаются как были.
template <typename T>
class HistoryManager
{
public:
    using ApplyState = std::function<void(const T&)>;

    explicit HistoryManager(int maxUndo = 10) : mMaxUndo(maxUndo < 1 ? 1 : maxUndo) {}

    void doCommand(const Command<T>& cmd, const ApplyState& applyState)
    {
        applyState(cmd.after);

        mUndo.push_back(cmd);
        mRedo.clear();
        trim();
        qCDebug(lcHistory) << "do: undo" << mUndo.size() << "redo" << mRedo.size();
    }

    // false, если отменять нечего
    bool undo(const ApplyState& applyState)
    {
        if (mUndo.isEmpty())
            return false;

        applyState(mUndo.back().before);

        mRedo.push_back(mUndo.takeLast());
        qCDebug(lcHistory) << "undo: undo" << mUndo.size() << "redo" << mRedo.size();
        return true;
    }

    bool redo(const ApplyState& applyState)
    {
        if (mRedo.isEmpty())
            return false;

        applyState(mRedo.back().after);

        mUndo.push_back(mRedo.takeLast());
        trim();
        qCDebug(lcHistory) << "redo: undo" << mUndo.size() << "redo" << mRedo.size();
        return true;
    }

    bool canUndo() const { return !mUndo.isEmpty(); }
    bool canRedo() const { return !mRedo.isEmpty(); }
    int undoCount() const { return int(mUndo.size()); }
    int redoCount() const { return int(mRedo.size()); }

    void clear()
    {
        mUndo.clear();
        mRedo.clear();
    }

    int maxUndo() const { return mMaxUndo; }
    void setMaxUndo(int n)
    {
        mMaxUndo = n < 1 ? 1 : n;
        trim();
    }

private:
    QVector<Command<T>> mUndo;
    QVector<Command<T>> mRedo;
    int mMaxUndo{ 10 };

    void trim()
    {
        while (mUndo.size() > mMaxUndo)
        {
            mUndo.removeFirst();
            qCDebug(lcHistory) << "oldest command dropped";
        }
    }
};
