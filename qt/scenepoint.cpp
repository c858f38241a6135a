#include "scenepoint.h"

#include <QBrush>
#include <QGraphicsEllipseItem>
#include <QPen>

const int ScenePoint::DRAW_SIZE;

ScenePoint::ScenePoint(const QPointF &position, const QColor &color)
    : Shape2D(color)
    , m_position(position)
{
}

GraphicsObjectPtr ScenePoint::clone() const
{
    return GraphicsObjectPtr(new ScenePoint(m_position, m_color));
}

QVector<QPointF> ScenePoint::coordinates() const
{
    return QVector<QPointF>() << m_position;
}

bool ScenePoint::setCoordinates(const QVector<QPointF> &points, QString *errorMessage)
{
    if (points.size() != 1) {
        if (errorMessage)
            *errorMessage = QStringLiteral("A point takes exactly one coordinate, got %1.").arg(points.size());
        return false;
    }
    m_position = points.first();
    return true;
}

QGraphicsItem *ScenePoint::createGraphicsItem() const
{
    const double radius = DRAW_SIZE / 2.0;
    auto item = new QGraphicsEllipseItem(m_position.x() - radius, m_position.y() - radius,
                                         DRAW_SIZE, DRAW_SIZE);
    item->setPen(Qt::NoPen);
    item->setBrush(QBrush(m_color));
    return item;
}
