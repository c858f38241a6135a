#include "beziercurve.h"
#include "geometry.h"

#include <QPainterPath>
#include <QPen>

const int BezierCurve::PEN_WIDTH;
const int BezierCurve::DEFAULT_SAMPLES_PER_SEGMENT;

BezierCurve::BezierCurve(const QVector<QPointF> &controlPoints, const QColor &color)
    : Shape2D(color)
    , m_controlPoints(controlPoints)
{
}

bool BezierCurve::isValidPointCount(int count)
{
    return count >= 4 && (count - 4) % 3 == 0;
}

QSharedPointer<BezierCurve> BezierCurve::create(const QVector<QPointF> &controlPoints,
                                                const QColor &color, QString *errorMessage)
{
    if (!isValidPointCount(controlPoints.size())) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid number of Bezier control points (%1). "
                                           "Use 4, 7, 10, ...")
                                .arg(controlPoints.size());
        }
        return QSharedPointer<BezierCurve>();
    }
    return QSharedPointer<BezierCurve>(new BezierCurve(controlPoints, color));
}

GraphicsObjectPtr BezierCurve::clone() const
{
    return GraphicsObjectPtr(new BezierCurve(m_controlPoints, m_color));
}

QPointF BezierCurve::pointAt(int segment, double t) const
{
    if (segment < 0 || segment >= segmentCount())
        return QPointF();

    t = qBound(0.0, t, 1.0);
    const double u = 1.0 - t;
    const double b0 = u * u * u;
    const double b1 = 3.0 * u * u * t;
    const double b2 = 3.0 * u * t * t;
    const double b3 = t * t * t;

    const int i = segment * 3;
    const QPointF &p0 = m_controlPoints[i];
    const QPointF &p1 = m_controlPoints[i + 1];
    const QPointF &p2 = m_controlPoints[i + 2];
    const QPointF &p3 = m_controlPoints[i + 3];
    return p0 * b0 + p1 * b1 + p2 * b2 + p3 * b3;
}

QVector<QPointF> BezierCurve::sample(int samplesPerSegment) const
{
    samplesPerSegment = qMax(2, samplesPerSegment);

    QVector<QPointF> points;
    if (m_controlPoints.isEmpty())
        return points;

    points << m_controlPoints.first();
    for (int segment = 0; segment < segmentCount(); ++segment) {
        for (int j = 1; j <= samplesPerSegment; ++j) {
            const QPointF p = pointAt(segment, double(j) / samplesPerSegment);
            if (!fuzzyEqual(p, points.last()))
                points << p;
        }
    }
    return points;
}

bool BezierCurve::setCoordinates(const QVector<QPointF> &points, QString *errorMessage)
{
    if (!isValidPointCount(points.size())) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Invalid number of Bezier control points (%1).").arg(points.size());
        return false;
    }
    m_controlPoints = points;
    return true;
}

QGraphicsItem *BezierCurve::createGraphicsItem() const
{
    QPainterPath path;
    path.moveTo(m_controlPoints.first());
    for (int segment = 0; segment < segmentCount(); ++segment) {
        const int i = segment * 3;
        path.cubicTo(m_controlPoints[i + 1], m_controlPoints[i + 2], m_controlPoints[i + 3]);
    }
    return createPathItem(path, objectPen(m_color, PEN_WIDTH));
}
