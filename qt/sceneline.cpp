#include "sceneline.h"
#include "geometry.h"

#include <QGraphicsLineItem>
#include <QPen>

const int SceneLine::PEN_WIDTH;

SceneLine::SceneLine(const QPointF &start, const QPointF &end, const QColor &color)
    : Shape2D(color)
    , m_start(start)
    , m_end(end)
{
}

QSharedPointer<SceneLine> SceneLine::create(const QPointF &start, const QPointF &end,
                                            const QColor &color, QString *errorMessage)
{
    if (fuzzyEqual(start, end)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("A line needs two distinct endpoints.");
        return QSharedPointer<SceneLine>();
    }
    return QSharedPointer<SceneLine>(new SceneLine(start, end, color));
}

GraphicsObjectPtr SceneLine::clone() const
{
    return GraphicsObjectPtr(new SceneLine(m_start, m_end, m_color));
}

QVector<QPointF> SceneLine::coordinates() const
{
    return QVector<QPointF>() << m_start << m_end;
}

bool SceneLine::setCoordinates(const QVector<QPointF> &points, QString *errorMessage)
{
    if (points.size() != 2) {
        if (errorMessage)
            *errorMessage = QStringLiteral("A line takes exactly two coordinates, got %1.").arg(points.size());
        return false;
    }
    if (fuzzyEqual(points[0], points[1])) {
        if (errorMessage)
            *errorMessage = QStringLiteral("A line needs two distinct endpoints.");
        return false;
    }
    m_start = points[0];
    m_end = points[1];
    return true;
}

QGraphicsItem *SceneLine::createGraphicsItem() const
{
    auto item = new QGraphicsLineItem(line());
    item->setPen(objectPen(m_color, PEN_WIDTH));
    return item;
}
