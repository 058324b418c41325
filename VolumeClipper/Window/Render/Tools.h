#pragma once
#include <QMenu>
#include <functional>
#include "Clipping/ClipTypes.h"

class QWidget;
class QMenu;

enum class Action 
{
    Scissors,
    InverseScissors,
    ResetClipping
};

namespace Tools {

    QMenu* CreateMenu(QWidget* parent,
        std::function<void(Action)> onAction);

    QString ToDisplayName(Action a);

    // Scissors -> RemoveInside, InverseScissors -> RemoveOutside
    bool ToClipMode(Action a, ClipMode& mode);
}
