#include "graphicsview.h"

#include <QKeyEvent>
#include <QMouseEvent>
#include <QScrollBar>
#include <QWheelEvent>
#include <QtMath>

#include <cmath>

constexpr double GraphicsView::MIN_ZOOM;
constexpr double GraphicsView::MAX_ZOOM;
constexpr double GraphicsView::ROTATION_STEP;
const int GraphicsView::ZOOM_SLIDER_MAX;

GraphicsView::GraphicsView(QWidget *parent)
    : QGraphicsView(parent)
    , m_mode(EditorState::DrawingMode::Select)
    , m_zoom(1.0)
    , m_rotation(0.0)
    , m_middlePanning(false)
{
    setRenderHint(QPainter::Antialiasing);
    setTransformationAnchor(QGraphicsView::AnchorUnderMouse);
    setResizeAnchor(QGraphicsView::AnchorViewCenter);
    setViewportUpdateMode(QGraphicsView::FullViewportUpdate);
    setMouseTracking(true);
    setDragMode(QGraphicsView::RubberBandDrag);
    setFocusPolicy(Qt::StrongFocus);
}

double GraphicsView::sliderValueToZoom(int value)
{
    const double t = qBound(0, value, ZOOM_SLIDER_MAX) / double(ZOOM_SLIDER_MAX);
    const double logMin = qLn(MIN_ZOOM);
    const double logMax = qLn(MAX_ZOOM);
    return qExp(logMin + t * (logMax - logMin));
}

int GraphicsView::zoomToSliderValue(double zoom)
{
    const double clamped = qBound(MIN_ZOOM, zoom, MAX_ZOOM);
    const double logMin = qLn(MIN_ZOOM);
    const double logMax = qLn(MAX_ZOOM);
    return qRound((qLn(clamped) - logMin) / (logMax - logMin) * ZOOM_SLIDER_MAX);
}

bool GraphicsView::isDrawingMode() const
{
    return m_mode != EditorState::DrawingMode::Select && m_mode != EditorState::DrawingMode::Pan;
}

void GraphicsView::setDrawingMode(EditorState::DrawingMode mode)
{
    m_mode = mode;
    switch (mode) {
    case EditorState::DrawingMode::Select:
        setDragMode(QGraphicsView::RubberBandDrag);
        viewport()->unsetCursor();
        break;
    case EditorState::DrawingMode::Pan:
        setDragMode(QGraphicsView::ScrollHandDrag);
        break;
    default:
        setDragMode(QGraphicsView::NoDrag);
        viewport()->setCursor(Qt::CrossCursor);
        break;
    }
}

void GraphicsView::setZoom(double factor)
{
    const double clamped = qBound(MIN_ZOOM, factor, MAX_ZOOM);
    if (qFuzzyCompare(clamped, m_zoom))
        return;
    const double ratio = clamped / m_zoom;
    scale(ratio, ratio);
    m_zoom = clamped;
    emit zoomChanged(m_zoom);
}

void GraphicsView::rotateView(double degrees)
{
    rotate(degrees);
    m_rotation = std::fmod(m_rotation + degrees, 360.0);
    emit rotationChanged(m_rotation);
}

void GraphicsView::resetView()
{
    resetTransform();
    m_zoom = 1.0;
    m_rotation = 0.0;
    centerOn(0.0, 0.0);
    emit zoomChanged(m_zoom);
    emit rotationChanged(m_rotation);
}

void GraphicsView::wheelEvent(QWheelEvent *event)
{
    const int delta = event->angleDelta().y();
    if (delta == 0) {
        QGraphicsView::wheelEvent(event);
        return;
    }
    const double factor = 1.0 + 0.1 * (delta / 120.0);
    if (factor > 0.0)
        setZoom(m_zoom * factor);
    event->accept();
}

void GraphicsView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() == Qt::MiddleButton) {
        m_middlePanning = true;
        m_lastPanPos = event->pos();
        viewport()->setCursor(Qt::ClosedHandCursor);
        event->accept();
        return;
    }

    if (event->button() == Qt::RightButton) {
        emit sceneRightClicked(mapToScene(event->pos()));
        event->accept();
        return;
    }

    if (event->button() == Qt::LeftButton && isDrawingMode()) {
        emit sceneLeftClicked(mapToScene(event->pos()));
        event->accept();
        return;
    }

    QGraphicsView::mousePressEvent(event);
}

void GraphicsView::mouseMoveEvent(QMouseEvent *event)
{
    if (m_middlePanning) {
        const QPoint delta = event->pos() - m_lastPanPos;
        m_lastPanPos = event->pos();
        horizontalScrollBar()->setValue(horizontalScrollBar()->value() - delta.x());
        verticalScrollBar()->setValue(verticalScrollBar()->value() - delta.y());
        event->accept();
        return;
    }

    emit sceneMouseMoved(mapToScene(event->pos()));
    QGraphicsView::mouseMoveEvent(event);
}

void GraphicsView::mouseReleaseEvent(QMouseEvent *event)
{
    if (event->button() == Qt::MiddleButton && m_middlePanning) {
        m_middlePanning = false;
        setDrawingMode(m_mode);
        event->accept();
        return;
    }
    QGraphicsView::mouseReleaseEvent(event);
}

void GraphicsView::keyPressEvent(QKeyEvent *event)
{
    if (event->key() == Qt::Key_Delete || event->key() == Qt::Key_Backspace) {
        emit deleteRequested();
        event->accept();
        return;
    }
    if (event->modifiers() & Qt::ShiftModifier) {
        if (event->key() == Qt::Key_Left) {
            rotateView(-ROTATION_STEP);
            event->accept();
            return;
        }
        if (event->key() == Qt::Key_Right) {
            rotateView(ROTATION_STEP);
            event->accept();
            return;
        }
    }
    QGraphicsView::keyPressEvent(event);
}
