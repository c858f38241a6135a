#include "drawingcontroller.h"
#include "beziercurve.h"
#include "bsplinecurve.h"
#include "geometry.h"
#include "sceneline.h"
#include "scenepoint.h"
#include "scenepolygon.h"

#include <QGraphicsLineItem>
#include <QGraphicsPathItem>
#include <QGraphicsScene>
#include <QPainterPath>
#include <QPen>

const int DrawingController::PREVIEW_Z_VALUE;

DrawingController::DrawingController(QGraphicsScene *scene, EditorState *state, QObject *parent)
    : QObject(parent)
    , m_scene(scene)
    , m_state(state)
    , m_hasLineStart(false)
    , m_polygonOpen(false)
    , m_polygonFilled(false)
    , m_hasPendingPolygonPoint(false)
    , m_previewLine(nullptr)
    , m_previewPath(nullptr)
{
    // Switching tools always drops the object under construction.
    connect(m_state, &EditorState::drawingModeChanged, this, &DrawingController::cancelDrawing);
}

bool DrawingController::isDrawing() const
{
    return m_hasLineStart || m_hasPendingPolygonPoint || !m_polygonPoints.isEmpty()
        || !m_curvePoints.isEmpty();
}

int DrawingController::pendingPointCount() const
{
    return (m_hasLineStart ? 1 : 0) + m_polygonPoints.size() + m_curvePoints.size();
}

void DrawingController::handleLeftClick(const QPointF &scenePos)
{
    const QColor color = m_state->drawColor();

    switch (m_state->drawingMode()) {
    case EditorState::DrawingMode::Point:
        emit objectReady(GraphicsObjectPtr(new ScenePoint(scenePos, color)));
        break;

    case EditorState::DrawingMode::Line:
        if (!m_hasLineStart) {
            m_hasLineStart = true;
            m_lineStart = scenePos;
            updatePreview(scenePos);
            emit statusMessage(tr("Line: click the end point."), 0);
        } else {
            const QSharedPointer<SceneLine> line = SceneLine::create(m_lineStart, scenePos, color);
            if (!line) {
                emit statusMessage(tr("End point equals the start point. Click somewhere else."), 2000);
                return;
            }
            emit objectReady(line);
            finishDrawing(true);
        }
        break;

    case EditorState::DrawingMode::Polygon:
        if (m_hasPendingPolygonPoint) {
            emit statusMessage(tr("Waiting for the polygon type."), 2000);
            return;
        }
        if (m_polygonPoints.isEmpty()) {
            m_hasPendingPolygonPoint = true;
            m_pendingPolygonPoint = scenePos;
            emit polygonPropertiesRequested();
            return;
        }
        if (fuzzyEqual(scenePos, m_polygonPoints.last())) {
            emit statusMessage(tr("Duplicate point ignored."), 1500);
            return;
        }
        m_polygonPoints << scenePos;
        updatePreview(scenePos);
        emit statusMessage(tr("Polygon: %1 %2 added. Right click to finish.")
                               .arg(m_polygonPoints.size())
                               .arg(m_polygonOpen ? tr("polyline vertices") : tr("polygon vertices")),
                           0);
        break;

    case EditorState::DrawingMode::Bezier:
        m_curvePoints << scenePos;
        updatePreview(scenePos);
        updateBezierStatus();
        break;

    case EditorState::DrawingMode::BSpline:
        m_curvePoints << scenePos;
        updatePreview(scenePos);
        emit statusMessage(tr("B-spline: %1 control point(s) added. Right click to finish.")
                               .arg(m_curvePoints.size()),
                           0);
        break;

    case EditorState::DrawingMode::Select:
    case EditorState::DrawingMode::Pan:
        break;
    }
}

void DrawingController::handleRightClick(const QPointF &scenePos)
{
    Q_UNUSED(scenePos);

    switch (m_state->drawingMode()) {
    case EditorState::DrawingMode::Polygon:
    case EditorState::DrawingMode::Bezier:
    case EditorState::DrawingMode::BSpline:
        finishDrawing(true);
        break;
    default:
        break;
    }
}

void DrawingController::handleMouseMove(const QPointF &scenePos)
{
    if (m_hasLineStart || !m_polygonPoints.isEmpty() || !m_curvePoints.isEmpty())
        updatePreview(scenePos);
}

void DrawingController::setPendingPolygonProperties(bool isOpen, bool isFilled, bool cancelled)
{
    if (cancelled || !m_hasPendingPolygonPoint) {
        resetDrawing();
        emit statusMessage(tr("Polygon drawing cancelled."), 2000);
        return;
    }

    m_polygonOpen = isOpen;
    m_polygonFilled = isFilled && !isOpen;
    m_hasPendingPolygonPoint = false;
    m_polygonPoints << m_pendingPolygonPoint;
    updatePreview(m_pendingPolygonPoint);

    emit statusMessage(tr("Polygon: click the %1. Right click to finish.")
                           .arg(m_polygonOpen ? tr("polyline vertices") : tr("polygon vertices")),
                       0);
}

void DrawingController::cancelDrawing()
{
    const bool wasDrawing = isDrawing();
    resetDrawing();
    if (wasDrawing)
        emit statusMessage(tr("Drawing cancelled."), 1000);
}

void DrawingController::finishDrawing(bool commit)
{
    const QColor color = m_state->drawColor();
    QString error;

    if (commit) {
        switch (m_state->drawingMode()) {
        case EditorState::DrawingMode::Polygon:
            if (!m_polygonPoints.isEmpty()) {
                const QSharedPointer<ScenePolygon> polygon =
                    ScenePolygon::create(m_polygonPoints, m_polygonOpen, m_polygonFilled, color, &error);
                if (!polygon) {
                    emit drawingRejected(tr("Not enough points"), error + tr(" Drawing not finished."));
                    return;
                }
                emit objectReady(polygon);
            }
            break;

        case EditorState::DrawingMode::Bezier:
            if (!m_curvePoints.isEmpty()) {
                const QSharedPointer<BezierCurve> curve = BezierCurve::create(m_curvePoints, color, &error);
                if (!curve) {
                    const int count = m_curvePoints.size();
                    const int needed = count < 4 ? 4 - count : 3 - (count - 4) % 3;
                    emit drawingRejected(tr("Invalid points"),
                                         tr("Cannot finish the Bezier curve. It needs %1 more point(s).")
                                             .arg(needed));
                    return;
                }
                emit objectReady(curve);
            }
            break;

        case EditorState::DrawingMode::BSpline:
            if (!m_curvePoints.isEmpty()) {
                const QSharedPointer<BSplineCurve> curve =
                    BSplineCurve::create(m_curvePoints, color, BSplineCurve::DEFAULT_DEGREE,
                                         QVector<double>(), &error);
                if (!curve) {
                    emit drawingRejected(tr("Not enough points"), error + tr(" Drawing not finished."));
                    return;
                }
                emit objectReady(curve);
            }
            break;

        default:
            break;
        }
    }

    const bool wasDrawing = isDrawing();
    resetDrawing();
    if (wasDrawing)
        emit statusMessage(tr("Ready."), 1000);
}

void DrawingController::resetDrawing()
{
    removePreview();
    m_hasLineStart = false;
    m_polygonPoints.clear();
    m_polygonOpen = false;
    m_polygonFilled = false;
    m_hasPendingPolygonPoint = false;
    m_curvePoints.clear();
}

void DrawingController::updatePreview(const QPointF &cursor)
{
    const QPen pen(Qt::black, 2);

    if (m_hasLineStart) {
        if (!m_previewLine) {
            m_previewLine = new QGraphicsLineItem();
            m_previewLine->setPen(pen);
            m_previewLine->setZValue(PREVIEW_Z_VALUE);
            m_scene->addItem(m_previewLine);
        }
        m_previewLine->setLine(QLineF(m_lineStart, cursor));
        return;
    }

    const QVector<QPointF> &points = m_polygonPoints.isEmpty() ? m_curvePoints : m_polygonPoints;
    if (points.isEmpty())
        return;

    QPainterPath path;
    if (m_state->drawingMode() == EditorState::DrawingMode::BSpline && points.size() >= 2) {
        const QSharedPointer<BSplineCurve> curve = BSplineCurve::create(points);
        const QVector<QPointF> samples = curve->sample();
        path.moveTo(samples.first());
        for (int i = 1; i < samples.size(); ++i)
            path.lineTo(samples[i]);
    } else {
        path.moveTo(points.first());
        for (int i = 1; i < points.size(); ++i)
            path.lineTo(points[i]);
    }
    path.lineTo(cursor);

    if (!m_previewPath) {
        m_previewPath = new QGraphicsPathItem();
        m_previewPath->setPen(pen);
        m_previewPath->setZValue(PREVIEW_Z_VALUE);
        m_scene->addItem(m_previewPath);
    }
    m_previewPath->setPath(path);
}

void DrawingController::removePreview()
{
    if (m_previewLine) {
        m_scene->removeItem(m_previewLine);
        delete m_previewLine;
        m_previewLine = nullptr;
    }
    if (m_previewPath) {
        m_scene->removeItem(m_previewPath);
        delete m_previewPath;
        m_previewPath = nullptr;
    }
}

void DrawingController::updateBezierStatus()
{
    const int count = m_curvePoints.size();
    QString status = tr("Bezier: point %1 added.").arg(count);

    if (count < 4) {
        status += tr(" Add %1 more point(s) for the first segment.").arg(4 - count);
    } else if (BezierCurve::isValidPointCount(count)) {
        status += tr(" Segment %1 complete. Add 3 more for the next segment, or right click to finish.")
                      .arg((count - 1) / 3);
    } else {
        status += tr(" Add %1 more point(s) to complete segment %2.")
                      .arg(3 - (count - 4) % 3)
                      .arg((count - 1) / 3 + 1);
    }
    emit statusMessage(status, 0);
}
