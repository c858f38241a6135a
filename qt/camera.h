#ifndef CAMERA_H
#define CAMERA_H

#include <QMatrix4x4>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector3D>

struct Camera
{
    enum class Projection {
        Orthographic,
        Perspective
    };

    QVector3D vrp = QVector3D(0.0f, 0.0f, 500.0f);
    QVector3D target = QVector3D(0.0f, 0.0f, 0.0f);
    QVector3D vup = QVector3D(0.0f, 1.0f, 0.0f);
    Projection projection = Projection::Orthographic;
    double fieldOfView = 60.0;

    QMatrix4x4 viewMatrix() const;
    // The orthographic volume and the perspective aspect follow the window.
    QMatrix4x4 projectionMatrix(const QRectF &window) const;
    QMatrix4x4 viewportMatrix(const QRectF &window) const;

    // Projects a world point onto the window. False when it is not visible.
    bool project(const QVector3D &point, const QRectF &window, QPointF *projected) const;

    // Rejects a camera whose direction or up vector cannot span a view basis.
    static bool validate(const QVector3D &vrp, const QVector3D &target, const QVector3D &vup,
                         QString *errorMessage);

    bool operator==(const Camera &other) const;
    bool operator!=(const Camera &other) const { return !(*this == other); }
};

#endif // CAMERA_H
