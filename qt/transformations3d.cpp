#include "transformations3d.h"
#include "editorlogging.h"
#include "geometry.h"

#include <QQuaternion>
#include <QVector4D>
#include <QtMath>

namespace Transform3D {

namespace {

// QMatrix4x4 stores floats, points on the NDC boundary need more slack than
// the double precision epsilon.
const double NDC_TOLERANCE = 1e-5;

bool insideNdc(double value)
{
    return value >= -1.0 - NDC_TOLERANCE && value <= 1.0 + NDC_TOLERANCE;
}

} // namespace

QMatrix4x4 translation(const QVector3D &offset)
{
    return QMatrix4x4(1, 0, 0, offset.x(),
                      0, 1, 0, offset.y(),
                      0, 0, 1, offset.z(),
                      0, 0, 0, 1);
}

QMatrix4x4 scaling(const QVector3D &factors)
{
    if (isNearZero(factors.x()) || isNearZero(factors.y()) || isNearZero(factors.z())) {
        qCWarning(lcScene) << "Ignoring 3D scale with a zero factor:" << factors;
        return QMatrix4x4();
    }
    return QMatrix4x4(factors.x(), 0, 0, 0,
                      0, factors.y(), 0, 0,
                      0, 0, factors.z(), 0,
                      0, 0, 0, 1);
}

QMatrix4x4 scalingAround(const QVector3D &factors, const QVector3D &center)
{
    return translation(center) * scaling(factors) * translation(-center);
}

QMatrix4x4 rotationX(double degrees)
{
    const float c = qCos(qDegreesToRadians(degrees));
    const float s = qSin(qDegreesToRadians(degrees));
    return QMatrix4x4(1, 0, 0, 0,
                      0, c, -s, 0,
                      0, s, c, 0,
                      0, 0, 0, 1);
}

QMatrix4x4 rotationY(double degrees)
{
    const float c = qCos(qDegreesToRadians(degrees));
    const float s = qSin(qDegreesToRadians(degrees));
    return QMatrix4x4(c, 0, s, 0,
                      0, 1, 0, 0,
                      -s, 0, c, 0,
                      0, 0, 0, 1);
}

QMatrix4x4 rotationZ(double degrees)
{
    const float c = qCos(qDegreesToRadians(degrees));
    const float s = qSin(qDegreesToRadians(degrees));
    return QMatrix4x4(c, -s, 0, 0,
                      s, c, 0, 0,
                      0, 0, 1, 0,
                      0, 0, 0, 1);
}

QMatrix4x4 rotationAroundAxis(double degrees, const QVector3D &axisPoint,
                              const QVector3D &axisDirection)
{
    if (isNearZero(axisDirection.length())) {
        qCWarning(lcScene) << "Rotation axis has zero length, ignoring rotation";
        return QMatrix4x4();
    }

    QMatrix4x4 rotation;
    rotation.rotate(QQuaternion::fromAxisAndAngle(axisDirection.normalized(), float(degrees)));
    return translation(axisPoint) * rotation * translation(-axisPoint);
}

QMatrix4x4 viewMatrix(const QVector3D &vrp, const QVector3D &target, const QVector3D &vup)
{
    const QVector3D forward = vrp - target;
    if (isNearZero(forward.length())) {
        qCWarning(lcScene) << "Camera position equals its target, using identity view";
        return QMatrix4x4();
    }
    const QVector3D zAxis = forward.normalized();
    const QVector3D xCross = QVector3D::crossProduct(vup, zAxis);
    if (isNearZero(xCross.length())) {
        qCWarning(lcScene) << "View up vector is parallel to the view direction, using identity view";
        return QMatrix4x4();
    }
    const QVector3D xAxis = xCross.normalized();
    const QVector3D yAxis = QVector3D::crossProduct(zAxis, xAxis);

    const QMatrix4x4 rotation(xAxis.x(), xAxis.y(), xAxis.z(), 0,
                              yAxis.x(), yAxis.y(), yAxis.z(), 0,
                              zAxis.x(), zAxis.y(), zAxis.z(), 0,
                              0, 0, 0, 1);
    return rotation * translation(-vrp);
}

QMatrix4x4 orthographic(double left, double right, double bottom, double top,
                        double nearPlane, double farPlane)
{
    const double width = right - left;
    const double height = top - bottom;
    const double depth = farPlane - nearPlane;
    if (isNearZero(width) || isNearZero(height) || isNearZero(depth)) {
        qCWarning(lcScene) << "Degenerate orthographic volume, using identity projection";
        return QMatrix4x4();
    }
    return QMatrix4x4(2.0 / width, 0, 0, -(right + left) / width,
                      0, 2.0 / height, 0, -(top + bottom) / height,
                      0, 0, -2.0 / depth, -(farPlane + nearPlane) / depth,
                      0, 0, 0, 1);
}

QMatrix4x4 perspective(double fovYDegrees, double aspect, double nearPlane, double farPlane)
{
    if (fovYDegrees <= 0.0 || fovYDegrees >= 180.0 || aspect <= 0.0 || nearPlane <= 0.0
        || farPlane <= nearPlane) {
        qCWarning(lcScene) << "Invalid perspective parameters" << fovYDegrees << aspect
                           << nearPlane << farPlane << "- using identity projection";
        return QMatrix4x4();
    }
    const double tanHalf = qTan(qDegreesToRadians(fovYDegrees) / 2.0);
    const double depth = farPlane - nearPlane;
    return QMatrix4x4(1.0 / (aspect * tanHalf), 0, 0, 0,
                      0, 1.0 / tanHalf, 0, 0,
                      0, 0, -(farPlane + nearPlane) / depth, -2.0 * farPlane * nearPlane / depth,
                      0, 0, -1, 0);
}

QMatrix4x4 viewport(double x0, double y0, double width, double height)
{
    const double sx = width / 2.0;
    const double sy = -height / 2.0;
    return QMatrix4x4(sx, 0, 0, x0 + width / 2.0,
                      0, sy, 0, y0 + height / 2.0,
                      0, 0, 0.5, 0.5,
                      0, 0, 0, 1);
}

QVector<QVector3D> apply(const QVector<QVector3D> &points, const QMatrix4x4 &matrix)
{
    QVector<QVector3D> result;
    result.reserve(points.size());
    for (const QVector3D &p : points) {
        const QVector4D h = matrix * QVector4D(p, 1.0f);
        const float w = isNearZero(h.w()) ? 1.0f : h.w();
        result << QVector3D(h.x() / w, h.y() / w, h.z() / w);
    }
    return result;
}

bool projectPoint(const QVector3D &point, const QMatrix4x4 &model, const QMatrix4x4 &view,
                  const QMatrix4x4 &projection, const QMatrix4x4 &viewportMatrix,
                  QPointF *projected)
{
    const QVector4D clip = projection * view * model * QVector4D(point, 1.0f);
    if (isNearZero(clip.w()))
        return false;

    const QVector3D ndc = clip.toVector3D() / clip.w();
    if (!insideNdc(ndc.x()) || !insideNdc(ndc.y()) || !insideNdc(ndc.z()))
        return false;

    const QVector4D screen = viewportMatrix * QVector4D(ndc, 1.0f);
    if (projected)
        *projected = QPointF(screen.x(), screen.y());
    return true;
}

} // namespace Transform3D
