#ifndef GEOMETRY_H
#define GEOMETRY_H

#include <QPointF>
#include <QVector3D>
#include <QtMath>

const double GEOMETRY_EPSILON = 1e-9;

inline bool isNearZero(double value)
{
    return qAbs(value) < GEOMETRY_EPSILON;
}

inline bool fuzzyEqual(const QPointF &a, const QPointF &b)
{
    return isNearZero(a.x() - b.x()) && isNearZero(a.y() - b.y());
}

inline bool fuzzyEqual(const QVector3D &a, const QVector3D &b)
{
    return isNearZero(a.x() - b.x()) && isNearZero(a.y() - b.y()) && isNearZero(a.z() - b.z());
}

#endif // GEOMETRY_H
