#include "camera.h"
#include "geometry.h"
#include "transformations3d.h"

namespace {
const double ORTHO_NEAR = -10000.0;
const double ORTHO_FAR = 10000.0;
const double PERSPECTIVE_NEAR = 1.0;
const double PERSPECTIVE_FAR = 10000.0;
}

QMatrix4x4 Camera::viewMatrix() const
{
    return Transform3D::viewMatrix(vrp, target, vup);
}

QMatrix4x4 Camera::projectionMatrix(const QRectF &window) const
{
    if (projection == Projection::Perspective) {
        const double aspect = window.height() > 0.0 ? window.width() / window.height() : 1.0;
        return Transform3D::perspective(fieldOfView, aspect, PERSPECTIVE_NEAR, PERSPECTIVE_FAR);
    }
    const double halfWidth = window.width() / 2.0;
    const double halfHeight = window.height() / 2.0;
    return Transform3D::orthographic(-halfWidth, halfWidth, -halfHeight, halfHeight,
                                     ORTHO_NEAR, ORTHO_FAR);
}

QMatrix4x4 Camera::viewportMatrix(const QRectF &window) const
{
    return Transform3D::viewport(window.left(), window.top(), window.width(), window.height());
}

bool Camera::project(const QVector3D &point, const QRectF &window, QPointF *projected) const
{
    return Transform3D::projectPoint(point, QMatrix4x4(), viewMatrix(), projectionMatrix(window),
                                     viewportMatrix(window), projected);
}

bool Camera::validate(const QVector3D &vrp, const QVector3D &target, const QVector3D &vup,
                      QString *errorMessage)
{
    const QVector3D direction = target - vrp;
    if (isNearZero(direction.length())) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Camera position (VRP) and target must be different.");
        return false;
    }
    if (isNearZero(vup.length())) {
        if (errorMessage)
            *errorMessage = QStringLiteral("View up vector (VUP) must not be zero.");
        return false;
    }
    const double alignment = QVector3D::dotProduct(direction.normalized(), vup.normalized());
    if (qAbs(alignment) > 0.9999) {
        if (errorMessage)
            *errorMessage = QStringLiteral("View up vector (VUP) must not be parallel to the view direction.");
        return false;
    }
    return true;
}

bool Camera::operator==(const Camera &other) const
{
    return fuzzyEqual(vrp, other.vrp) && fuzzyEqual(target, other.target)
        && fuzzyEqual(vup, other.vup) && projection == other.projection
        && qFuzzyCompare(fieldOfView, other.fieldOfView);
}
