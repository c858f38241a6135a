#ifndef TRANSFORMATIONS_H
#define TRANSFORMATIONS_H

#include <QPointF>
#include <QTransform>
#include <QVector>

// 2D homogeneous transforms. QTransform uses the row vector convention,
// [x y 1] * M, so "a then b" composes as a * b.
namespace Transform2D {

QTransform translation(double dx, double dy);
// A near-zero factor yields the identity.
QTransform scaling(double sx, double sy);
// Counter-clockwise rotation, in degrees.
QTransform rotation(double degrees);

QTransform scalingAround(double sx, double sy, const QPointF &center);
QTransform rotationAround(double degrees, const QPointF &pivot);

QVector<QPointF> apply(const QVector<QPointF> &points, const QTransform &matrix);

} // namespace Transform2D

#endif // TRANSFORMATIONS_H
