#include "graphicsobject.h"

#include <QGraphicsPathItem>
#include <QPainterPath>
#include <QPen>

GraphicsObject::GraphicsObject(const QColor &color)
    : m_color(color.isValid() ? color : QColor(Qt::black))
{
}

GraphicsObject::~GraphicsObject()
{
}

void GraphicsObject::setColor(const QColor &color)
{
    if (color.isValid())
        m_color = color;
}

Shape2D::Shape2D(const QColor &color)
    : GraphicsObject(color)
{
}

QPointF Shape2D::center() const
{
    return centroid(coordinates());
}

QPointF centroid(const QVector<QPointF> &points)
{
    if (points.isEmpty())
        return QPointF();

    double sumX = 0.0;
    double sumY = 0.0;
    for (const QPointF &p : points) {
        sumX += p.x();
        sumY += p.y();
    }
    return QPointF(sumX / points.size(), sumY / points.size());
}

QPen objectPen(const QColor &color, double width, bool dashed)
{
    QPen pen(color, width);
    pen.setCapStyle(Qt::RoundCap);
    pen.setJoinStyle(Qt::RoundJoin);
    if (dashed)
        pen.setStyle(Qt::DashLine);
    return pen;
}

QGraphicsItem *createPathItem(const QPainterPath &path, const QPen &pen)
{
    auto item = new QGraphicsPathItem(path);
    item->setPen(pen);
    item->setBrush(Qt::NoBrush);
    return item;
}
