#include "scenepolygon.h"

#include <QBrush>
#include <QGraphicsPolygonItem>
#include <QPainterPath>
#include <QPen>
#include <QPolygonF>

const int ScenePolygon::PEN_WIDTH;
constexpr double ScenePolygon::FILL_ALPHA;

ScenePolygon::ScenePolygon(const QVector<QPointF> &points, bool isOpen, bool isFilled,
                           const QColor &color)
    : Shape2D(color)
    , m_points(points)
    , m_open(isOpen)
    , m_filled(isFilled && !isOpen)
{
}

QSharedPointer<ScenePolygon> ScenePolygon::create(const QVector<QPointF> &points, bool isOpen,
                                                  bool isFilled, const QColor &color,
                                                  QString *errorMessage)
{
    const int needed = minimumPointCount(isOpen);
    if (points.size() < needed) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 requires at least %2 points (got %3).")
                                .arg(isOpen ? QStringLiteral("An open polyline")
                                            : QStringLiteral("A closed polygon"))
                                .arg(needed)
                                .arg(points.size());
        }
        return QSharedPointer<ScenePolygon>();
    }
    return QSharedPointer<ScenePolygon>(new ScenePolygon(points, isOpen, isFilled, color));
}

GraphicsObjectPtr ScenePolygon::clone() const
{
    return GraphicsObjectPtr(new ScenePolygon(m_points, m_open, m_filled, m_color));
}

bool ScenePolygon::setCoordinates(const QVector<QPointF> &points, QString *errorMessage)
{
    if (points.size() < minimumPointCount(m_open)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Not enough vertices: %1.").arg(points.size());
        return false;
    }
    m_points = points;
    return true;
}

QGraphicsItem *ScenePolygon::createGraphicsItem() const
{
    if (m_open) {
        QPainterPath path;
        path.moveTo(m_points.first());
        for (int i = 1; i < m_points.size(); ++i)
            path.lineTo(m_points[i]);
        return createPathItem(path, objectPen(m_color, PEN_WIDTH, true));
    }

    auto item = new QGraphicsPolygonItem(QPolygonF(m_points));
    item->setPen(objectPen(m_color, PEN_WIDTH));
    if (m_filled) {
        QColor fill = m_color;
        fill.setAlphaF(FILL_ALPHA);
        item->setBrush(QBrush(fill));
    } else {
        item->setBrush(Qt::NoBrush);
    }
    return item;
}
