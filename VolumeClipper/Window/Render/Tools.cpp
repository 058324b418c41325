#include "Tools.h"
#include <QAction>
#include <QWidget>

namespace Tools 
{

    QMenu* CreateMenu(QWidget* parent, std::function<void(Action)> onAction)
    {
        auto* menu = new QMenu(parent);

        QObject::connect(menu->addAction(QObject::tr("Scissors")), &QAction::triggered, [onAction] { onAction(Action::Scissors); });
        QObject::connect(menu->addAction(QObject::tr("Inverse scissors")), &QAction::triggered, [onAction] { onAction(Action::InverseScissors); });
        menu->addSeparator();
        QObject::connect(menu->addAction(QObject::tr("Reset clipping")), &QAction::triggered, [onAction] { onAction(Action::ResetClipping); });

        return menu;
    }

    QString ToDisplayName(Action a)
    {
        switch (a) 
        {
        case Action::Scissors:        return QObject::tr("Scissors");
        case Action::InverseScissors: return QObject::tr("Inverse scissors");
        case Action::ResetClipping:   return QObject::tr("Reset clipping");
        }
        return QObject::tr("Edit");
    }

    bool ToClipMode(Action a, ClipMode& mode)
    {
        switch (a)
        {
        case Action::Scissors:        mode = ClipMode::RemoveInside;  return true;
        case Action::InverseScissors: mode = ClipMode::RemoveOutside; return true;
        default: break;
        }
        return false;
    }
}
