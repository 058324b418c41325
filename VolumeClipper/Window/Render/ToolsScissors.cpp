#include "ToolsScissors.h"
#include "Tools.h"
#include "Clipping/ClipSession.h"
#include <QVTKOpenGLNativeWidget.h>
#include <QPainter>
#include <QPainterPath>
#include <QMouseEvent>
#include <QKeyEvent>
#include <QApplication>
#include <QWheelEvent>
#include <QWidget>

#include <vtkRenderWindow.h>

ToolsScissors::ToolsScissors(QWidget* hostParent)
    : QObject(nullptr)
    , m_host(hostParent)
{
    m_overlay = new QWidget(hostParent);
    m_overlay->setAttribute(Qt::WA_TransparentForMouseEvents, false);
    m_overlay->setAttribute(Qt::WA_NoSystemBackground, true);
    m_overlay->setAttribute(Qt::WA_TranslucentBackground, true);
    m_overlay->hide();
    m_overlay->installEventFilter(this);
    m_overlay->setMouseTracking(true);
    m_overlay->setFocusPolicy(Qt::StrongFocus);
}

void ToolsScissors::attach(QVTKOpenGLNativeWidget* vtk, ClipSession* session)
{
    m_vtk = vtk;
    m_session = session;
    onViewResized();
}

DisplayPoint ToolsScissors::toDisplay(const QPoint& p) const
{
    const double dpr = m_vtk ? m_vtk->devicePixelRatioF() : 1.0;
    int rwH = 0;
    if (auto* rw = m_vtk ? m_vtk->renderWindow() : nullptr)
        rwH = rw->GetSize()[1];
    else if (m_vtk)
        rwH = int(m_vtk->height() * dpr);

    DisplayPoint d;
    d.x = p.x() * dpr;
    d.y = (rwH - 1) - p.y() * dpr; // инверсия Y
    return d;
}

void ToolsScissors::forwardMouseToVtk(QEvent* e)
{
    if (!m_vtk) return;

    switch (e->type()) {
    case QEvent::MouseButtonPress:
    case QEvent::MouseButtonRelease:
    case QEvent::MouseMove: {
        auto* me = static_cast<QMouseEvent*>(e);
        const QPointF screenPos = me->globalPosition();
        const QPointF localPos = m_vtk->mapFromGlobal(screenPos.toPoint());

        QMouseEvent copy(
            me->type(),
            localPos,   // pos в координатах m_vtk
            localPos,
            screenPos,
            me->button(),
            me->buttons(),
            me->modifiers(),
            me->source()
        );
        QCoreApplication::sendEvent(m_vtk, &copy);
        break;
    }
    case QEvent::Wheel: {
        auto* we = static_cast<QWheelEvent*>(e);
        const QPointF screenPos = we->globalPosition();
        const QPointF localPos = m_vtk->mapFromGlobal(screenPos.toPoint());

        QWheelEvent copy(
            localPos,
            screenPos,
            we->pixelDelta(),
            we->angleDelta(),
            we->buttons(),
            we->modifiers(),
            we->phase(),
            we->inverted(),
            we->source()
        );
        QCoreApplication::sendEvent(m_vtk, &copy);
        break;
    }
    default: break;
    }

    // камера могла сдвинуться: точки те же, плоскость новая
    if (m_session)
        m_session->selector().onCameraChanged();
}

bool ToolsScissors::eventFilter(QObject* obj, QEvent* ev)
{
    if (obj != m_overlay || m_state != State::Collecting)
        return QObject::eventFilter(obj, ev);

    if (ev->type() == QEvent::MouseButtonPress) {
        auto* me = static_cast<QMouseEvent*>(ev);
        const QPoint  screenPt = me->globalPosition().toPoint();
        QWidget* target = QApplication::widgetAt(screenPt);

        // Клик по кнопкам поверх VTK - выходим из режима
        const bool isUiTarget =
            target &&
            target != m_overlay &&
            !(m_vtk && (target == m_vtk || m_vtk->isAncestorOf(target)));

        if (isUiTarget) 
        {
            cancel();
            return false;
        }
    }

    if (m_allowNav) {
        if (ev->type() == QEvent::Wheel) {
            forwardMouseToVtk(ev);
            return true;
        }
        if (ev->type() == QEvent::MouseMove ||
            ev->type() == QEvent::MouseButtonPress ||
            ev->type() == QEvent::MouseButtonRelease) {
            auto* me = static_cast<QMouseEvent*>(ev);
            const bool isMMB = (me->buttons() & Qt::MiddleButton) ||
                (me->button() == Qt::MiddleButton);
            const bool ctrlL = (me->modifiers() & Qt::ControlModifier) &&
                ((me->buttons() & Qt::LeftButton) || me->button() == Qt::LeftButton);

            if (isMMB || ctrlL) {
                forwardMouseToVtk(ev);
                return true;
            }
        }
    }

    switch (ev->type())
    {
    case QEvent::MouseMove:
    {
        auto* me = static_cast<QMouseEvent*>(ev);
        m_cursorPos = me->pos();
        m_hasCursor = true;
        redraw();
        return true;
    }
    case QEvent::MouseButtonPress:
    {
        auto* me = static_cast<QMouseEvent*>(ev);
        if (me->button() == Qt::LeftButton) {
            addPoint(me->pos());
            return true;
        }
        else if (me->button() == Qt::RightButton)
        {
            addPoint(me->pos());
            if (m_pts.size() >= 3)
                finish();
            else
                cancel();
            return true;
        }
        break;
    }
    case QEvent::KeyPress: {
        auto* ke = static_cast<QKeyEvent*>(ev);
        if (ke->key() == Qt::Key_Return || ke->key() == Qt::Key_Enter) { finish(); return true; }
        if (ke->key() == Qt::Key_Escape) { cancel(); return true; }
        if (ke->key() == Qt::Key_Backspace) { removeLastPoint(); return true; }
        break;
    }
    case QEvent::Paint: {
        QPainter p(m_overlay);
        p.fillRect(m_overlay->rect(), QColor(0, 0, 0, 0));
        paintOverlay(p);
        return true;
    }
    default: break;
    }

    return QObject::eventFilter(obj, ev);
}

bool ToolsScissors::handle(Action a)
{
    ClipMode mode;
    if (!Tools::ToClipMode(a, mode))
        return false;
    start(mode);
    return true;
}

void ToolsScissors::onViewResized()
{
    if (!m_vtk || !m_overlay) return;
    // Геометрия оверлея = геометрия области VTK внутри host
    m_overlay->setGeometry(m_vtk->geometry());
}

void ToolsScissors::cancel()
{
    if (m_state == State::Off)
        return;

    if (m_session)
        m_session->cancel();
    stop();
}

void ToolsScissors::stop()
{
    m_pts.clear();
    m_hasCursor = false;
    m_state = State::Off;
    if (m_overlay) {
        m_overlay->unsetCursor();
        m_overlay->hide();
    }
    if (m_onFinished) m_onFinished();
}

void ToolsScissors::start(ClipMode mode)
{
    if (!m_vtk || !m_session)
        return;

    m_mode = mode;
    m_pts.clear();
    m_hasCursor = false;
    m_state = State::Collecting;
    m_session->beginSelection(mode);

    onViewResized();

    m_overlay->setAttribute(Qt::WA_TransparentForMouseEvents, false);
    m_overlay->setMouseTracking(true);
    m_overlay->setCursor(Qt::CrossCursor);
    m_overlay->raise();
    m_overlay->setFocus(Qt::OtherFocusReason);
    m_overlay->show();

    redraw();
}

bool ToolsScissors::addPoint(const QPoint& p)
{
    if (!m_session)
        return false;

    // дубли отсекает сам selector; здесь держим только копию для отрисовки
    if (!m_session->selector().addPoint(toDisplay(p)))
        return false;

    m_pts.push_back(p);
    redraw();
    return true;
}

void ToolsScissors::removeLastPoint()
{
    if (!m_session || m_pts.isEmpty())
        return;
    if (m_session->selector().removeLastPoint())
        m_pts.removeLast();
    redraw();
}

void ToolsScissors::finish()
{
    if (!m_session)
        return;

    auto& sel = m_session->selector();
    if (!sel.complete())
    {
        // меньше трёх точек - продолжаем собирать; вырожденная проекция - выходим
        if (sel.state() == RegionSelector::State::Idle)
            stop();
        return;
    }

    stop();
    if (m_onRegionClosed)
        m_onRegionClosed();
}

void ToolsScissors::redraw()
{
    if (m_overlay) m_overlay->update();
}

void ToolsScissors::paintOverlay(QPainter& p)
{
    if (m_pts.isEmpty()) return;

    p.setRenderHint(QPainter::Antialiasing, true);

    QPolygon poly;
    poly.reserve(m_pts.size() + 1);
    for (const auto& q : m_pts) poly << q;
    if (m_hasCursor) poly << m_cursorPos;

    if (poly.size() >= 3) {
        QPainterPath path;
        path.addPolygon(poly);
        path.closeSubpath();

        QColor fill = (m_mode == ClipMode::RemoveInside) ? QColor(0, 180, 100, 60)
            : QColor(220, 70, 70, 60);
        p.setBrush(fill);
        p.setPen(Qt::NoPen);
        p.drawPath(path);
    }

    QPen pen(Qt::white);
    pen.setWidth(2);
    p.setPen(pen);
    for (int i = 1; i < m_pts.size(); ++i)
        p.drawLine(m_pts[i - 1], m_pts[i]);
    if (m_hasCursor)
        p.drawLine(m_pts.back(), m_cursorPos);
    if (m_pts.size() >= 2)
        p.drawLine(m_hasCursor ? m_cursorPos : m_pts.back(), m_pts.front());

    p.setBrush(Qt::white);
    for (const auto& q : m_pts)
        p.drawEllipse(q, 3, 3);
    if (m_hasCursor)
        p.drawEllipse(m_cursorPos, 2, 2);
}
