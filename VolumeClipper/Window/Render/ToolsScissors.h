#pragma once
#include <QWidget>
#include <QVector>
#include <QPoint>
#include <functional>
#include "Clipping/ClipTypes.h"

class QVTKOpenGLNativeWidget;
class ClipSession;

enum class Action; // из Tools.h

// Инструмент "ножницы": прозрачный оверлей над VTK собирает клики и отдаёт их
// в RegionSelector сессии. Сам ничего не вырезает: замкнутый контур ждёт Apply.
class ToolsScissors : public QObject
{
    Q_OBJECT
public:
    explicit ToolsScissors(QWidget* hostParent);
    ~ToolsScissors() override = default;

    // Привязка актуальных указателей из RenderView (без геттеров и «дружбы»)
    void attach(QVTKOpenGLNativeWidget* vtk, ClipSession* session);

    // Обработка выбора из меню Tools (Scissors / InverseScissors)
    bool handle(Action a);

    // Перестройка геометрии оверлея (зови из RenderView::repositionOverlay)
    void onViewResized();

    // Сбор точек закончен (контур замкнут или отменён)
    void setOnFinished(std::function<void()> cb) { m_onFinished = std::move(cb); }
    // Контур замкнут и ждёт Apply/Cancel
    void setOnRegionClosed(std::function<void()> cb) { m_onRegionClosed = std::move(cb); }

    // Разрешить навигацию мышью при активных ножницах
    void setAllowNavigation(bool on) { m_allowNav = on; }
    void cancel();

    bool isCollecting() const { return m_state == State::Collecting; }

    // Qt (логические пиксели, Y вниз) -> VTK display (физические пиксели, Y вверх)
    DisplayPoint toDisplay(const QPoint& p) const;

protected:
    bool eventFilter(QObject* obj, QEvent* ev) override;

private:
    enum class State { Off, Collecting };
    State m_state{ State::Off };
    ClipMode m_mode{ ClipMode::RemoveInside };

    QWidget* m_host{ nullptr };       // родитель (обычно RenderView)
    QWidget* m_overlay{ nullptr };    // прозрачный слой над VTK
    QVector<QPoint> m_pts;            // 2D-точки в координатах overlay

    QPoint m_cursorPos{};
    bool   m_hasCursor{ false };

    QVTKOpenGLNativeWidget* m_vtk{ nullptr };
    ClipSession* m_session{ nullptr };

    std::function<void()> m_onFinished;
    std::function<void()> m_onRegionClosed;

    void start(ClipMode mode);
    void finish();
    void stop();
    void redraw();

    bool addPoint(const QPoint& p);
    void removeLastPoint();

    void paintOverlay(QPainter& p);

    bool m_allowNav{ true }; // по умолчанию - включено
    void forwardMouseToVtk(QEvent* e); // проброс в QVTK
};
