#include "transformations.h"
#include "editorlogging.h"
#include "geometry.h"

#include <QtMath>

namespace Transform2D {

QTransform translation(double dx, double dy)
{
    return QTransform(1.0, 0.0, 0.0,
                      0.0, 1.0, 0.0,
                      dx, dy, 1.0);
}

QTransform scaling(double sx, double sy)
{
    if (isNearZero(sx) || isNearZero(sy)) {
        qCWarning(lcScene) << "Ignoring scale with a zero factor:" << sx << sy;
        return QTransform();
    }
    return QTransform(sx, 0.0, 0.0,
                      0.0, sy, 0.0,
                      0.0, 0.0, 1.0);
}

QTransform rotation(double degrees)
{
    const double rad = qDegreesToRadians(degrees);
    const double c = qCos(rad);
    const double s = qSin(rad);
    return QTransform(c, s, 0.0,
                      -s, c, 0.0,
                      0.0, 0.0, 1.0);
}

QTransform scalingAround(double sx, double sy, const QPointF &center)
{
    return translation(-center.x(), -center.y()) * scaling(sx, sy)
        * translation(center.x(), center.y());
}

QTransform rotationAround(double degrees, const QPointF &pivot)
{
    return translation(-pivot.x(), -pivot.y()) * rotation(degrees)
        * translation(pivot.x(), pivot.y());
}

QVector<QPointF> apply(const QVector<QPointF> &points, const QTransform &matrix)
{
    QVector<QPointF> result;
    result.reserve(points.size());
    for (const QPointF &p : points) {
        const double x = matrix.m11() * p.x() + matrix.m21() * p.y() + matrix.m31();
        const double y = matrix.m12() * p.x() + matrix.m22() * p.y() + matrix.m32();
        double w = matrix.m13() * p.x() + matrix.m23() * p.y() + matrix.m33();
        if (isNearZero(w))
            w = 1.0;
        result << QPointF(x / w, y / w);
    }
    return result;
}

} // namespace Transform2D
