#ifndef TRANSFORMATIONS3D_H
#define TRANSFORMATIONS3D_H

#include <QMatrix4x4>
#include <QPointF>
#include <QVector>
#include <QVector3D>

// 3D homogeneous transforms in the column vector convention of QMatrix4x4,
// M * [x y z 1]^T, so "a then b" composes as b * a.
namespace Transform3D {

QMatrix4x4 translation(const QVector3D &offset);
// A near-zero factor yields the identity.
QMatrix4x4 scaling(const QVector3D &factors);
QMatrix4x4 scalingAround(const QVector3D &factors, const QVector3D &center);
QMatrix4x4 rotationX(double degrees);
QMatrix4x4 rotationY(double degrees);
QMatrix4x4 rotationZ(double degrees);
// Rotation about the line through axisPoint along axisDirection.
QMatrix4x4 rotationAroundAxis(double degrees, const QVector3D &axisPoint,
                              const QVector3D &axisDirection);

QMatrix4x4 viewMatrix(const QVector3D &vrp, const QVector3D &target, const QVector3D &vup);
QMatrix4x4 orthographic(double left, double right, double bottom, double top,
                        double nearPlane, double farPlane);
QMatrix4x4 perspective(double fovYDegrees, double aspect, double nearPlane, double farPlane);
// Maps NDC to the window, flipping y so that +y points up on screen.
QMatrix4x4 viewport(double x0, double y0, double width, double height);

QVector<QVector3D> apply(const QVector<QVector3D> &points, const QMatrix4x4 &matrix);

// Runs model -> view -> projection -> viewport. Returns false when w vanishes
// or the point falls outside the NDC cube.
bool projectPoint(const QVector3D &point, const QMatrix4x4 &model, const QMatrix4x4 &view,
                  const QMatrix4x4 &projection, const QMatrix4x4 &viewportMatrix,
                  QPointF *projected);

} // namespace Transform3D

#endif // TRANSFORMATIONS3D_H
