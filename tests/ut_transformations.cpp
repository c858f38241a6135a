#include "camera.h"
#include "transformations.h"
#include "transformations3d.h"
#include "testbase.h"

#include <QtMath>

namespace Tests {

class UtTransformations : public TestBase
{
    Q_OBJECT

private slots:
    void testTransform2D_data();
    void testTransform2D();
    void testComposition2D();
    void testZeroScale();
    void testTransform3D_data();
    void testTransform3D();
    void testDegenerate3D();
    void testViewMatrix();
    void testViewport();
    void testOrthographicProjection();
    void testPerspectiveProjection();
    void testCameraValidate_data();
    void testCameraValidate();

private:
    static QVector3D apply(const QMatrix4x4 &matrix, const QVector3D &point);
    static QRectF window() { return QRectF(-500.0, -400.0, 1000.0, 800.0); }
};

} // namespace Tests

using namespace Tests;

/*
 * \class Tests::UtTransformations
 */

QVector3D UtTransformations::apply(const QMatrix4x4 &matrix, const QVector3D &point)
{
    return Transform3D::apply(QVector<QVector3D>() << point, matrix).first();
}

void UtTransformations::testTransform2D_data()
{
    QTest::addColumn<QTransform>("matrix");
    QTest::addColumn<QPointF>("point");
    QTest::addColumn<QPointF>("expected");

    QTest::newRow("translation")
        << Transform2D::translation(3.0, 4.0) << QPointF(1.0, 2.0) << QPointF(4.0, 6.0);
    QTest::newRow("scaling")
        << Transform2D::scaling(2.0, 3.0) << QPointF(1.0, 1.0) << QPointF(2.0, 3.0);
    QTest::newRow("rotation 90")
        << Transform2D::rotation(90.0) << QPointF(1.0, 0.0) << QPointF(0.0, 1.0);
    QTest::newRow("rotation -90")
        << Transform2D::rotation(-90.0) << QPointF(1.0, 0.0) << QPointF(0.0, -1.0);
    QTest::newRow("rotation 180")
        << Transform2D::rotation(180.0) << QPointF(2.0, 1.0) << QPointF(-2.0, -1.0);
    QTest::newRow("scaling around center")
        << Transform2D::scalingAround(2.0, 2.0, QPointF(1.0, 1.0)) << QPointF(2.0, 2.0) << QPointF(3.0, 3.0);
    QTest::newRow("center is fixed")
        << Transform2D::scalingAround(4.0, 0.5, QPointF(7.0, -3.0)) << QPointF(7.0, -3.0) << QPointF(7.0, -3.0);
    QTest::newRow("rotation around pivot")
        << Transform2D::rotationAround(90.0, QPointF(1.0, 1.0)) << QPointF(2.0, 1.0) << QPointF(1.0, 2.0);
}

void UtTransformations::testTransform2D()
{
    QFETCH(QTransform, matrix);
    QFETCH(QPointF, point);
    QFETCH(QPointF, expected);

    const QVector<QPointF> result = Transform2D::apply(QVector<QPointF>() << point, matrix);
    QCOMPARE(result.size(), 1);
    COMPARE_POINT(result.first(), expected);
}

void UtTransformations::testComposition2D()
{
    // Translate first, then rotate about the origin.
    const QTransform matrix = Transform2D::translation(1.0, 0.0) * Transform2D::rotation(90.0);
    const QVector<QPointF> result = Transform2D::apply(QVector<QPointF>() << QPointF(0.0, 0.0), matrix);
    COMPARE_POINT(result.first(), QPointF(0.0, 1.0));

    QVERIFY(Transform2D::apply(QVector<QPointF>(), matrix).isEmpty());
}

void UtTransformations::testZeroScale()
{
    QVERIFY(Transform2D::scaling(0.0, 1.0).isIdentity());
    QVERIFY(Transform2D::scaling(2.0, 1e-12).isIdentity());
    QVERIFY(Transform3D::scaling(QVector3D(1.0f, 0.0f, 1.0f)).isIdentity());

    const QVector<QPointF> result = Transform2D::apply(QVector<QPointF>() << QPointF(3.0, 4.0),
                                                       Transform2D::scalingAround(0.0, 0.0, QPointF(1.0, 1.0)));
    COMPARE_POINT(result.first(), QPointF(3.0, 4.0));
}

void UtTransformations::testTransform3D_data()
{
    QTest::addColumn<QMatrix4x4>("matrix");
    QTest::addColumn<QVector3D>("point");
    QTest::addColumn<QVector3D>("expected");

    QTest::newRow("translation")
        << Transform3D::translation(QVector3D(1.0f, 2.0f, 3.0f))
        << QVector3D(0.0f, 0.0f, 0.0f) << QVector3D(1.0f, 2.0f, 3.0f);
    QTest::newRow("scaling")
        << Transform3D::scaling(QVector3D(2.0f, 3.0f, 4.0f))
        << QVector3D(1.0f, 1.0f, 1.0f) << QVector3D(2.0f, 3.0f, 4.0f);
    QTest::newRow("scaling around center")
        << Transform3D::scalingAround(QVector3D(2.0f, 2.0f, 2.0f), QVector3D(1.0f, 1.0f, 1.0f))
        << QVector3D(2.0f, 2.0f, 2.0f) << QVector3D(3.0f, 3.0f, 3.0f);
    QTest::newRow("rotation x")
        << Transform3D::rotationX(90.0) << QVector3D(0.0f, 1.0f, 0.0f) << QVector3D(0.0f, 0.0f, 1.0f);
    QTest::newRow("rotation y")
        << Transform3D::rotationY(90.0) << QVector3D(0.0f, 0.0f, 1.0f) << QVector3D(1.0f, 0.0f, 0.0f);
    QTest::newRow("rotation z")
        << Transform3D::rotationZ(90.0) << QVector3D(1.0f, 0.0f, 0.0f) << QVector3D(0.0f, 1.0f, 0.0f);
    QTest::newRow("rotation around axis")
        << Transform3D::rotationAroundAxis(90.0, QVector3D(1.0f, 0.0f, 0.0f), QVector3D(0.0f, 0.0f, 2.0f))
        << QVector3D(2.0f, 0.0f, 0.0f) << QVector3D(1.0f, 1.0f, 0.0f);
    QTest::newRow("point on the axis")
        << Transform3D::rotationAroundAxis(45.0, QVector3D(1.0f, 1.0f, 1.0f), QVector3D(1.0f, 1.0f, 1.0f))
        << QVector3D(3.0f, 3.0f, 3.0f) << QVector3D(3.0f, 3.0f, 3.0f);
}

void UtTransformations::testTransform3D()
{
    QFETCH(QMatrix4x4, matrix);
    QFETCH(QVector3D, point);
    QFETCH(QVector3D, expected);

    const QVector3D result = apply(matrix, point);
    QVERIFY2(samePoint(result, expected),
            qPrintable(QString("Actual (%1, %2, %3)").arg(result.x()).arg(result.y()).arg(result.z())));
}

void UtTransformations::testDegenerate3D()
{
    QVERIFY(Transform3D::rotationAroundAxis(30.0, QVector3D(1.0f, 2.0f, 3.0f), QVector3D()).isIdentity());
    QVERIFY(Transform3D::orthographic(0.0, 0.0, -1.0, 1.0, -1.0, 1.0).isIdentity());
    QVERIFY(Transform3D::perspective(0.0, 1.0, 1.0, 100.0).isIdentity());
    QVERIFY(Transform3D::perspective(60.0, 1.0, 10.0, 5.0).isIdentity());
}

void UtTransformations::testViewMatrix()
{
    const QMatrix4x4 view = Transform3D::viewMatrix(QVector3D(0.0f, 0.0f, 500.0f), QVector3D(),
                                                    QVector3D(0.0f, 1.0f, 0.0f));
    QVERIFY(samePoint(apply(view, QVector3D()), QVector3D(0.0f, 0.0f, -500.0f)));
    QVERIFY(samePoint(apply(view, QVector3D(10.0f, 20.0f, 0.0f)), QVector3D(10.0f, 20.0f, -500.0f)));

    // Looking down the x axis from +x puts world -z on the camera's +x.
    const QMatrix4x4 side = Transform3D::viewMatrix(QVector3D(100.0f, 0.0f, 0.0f), QVector3D(),
                                                    QVector3D(0.0f, 1.0f, 0.0f));
    QVERIFY(samePoint(apply(side, QVector3D(0.0f, 0.0f, -10.0f)), QVector3D(10.0f, 0.0f, -100.0f)));

    QVERIFY(Transform3D::viewMatrix(QVector3D(1.0f, 1.0f, 1.0f), QVector3D(1.0f, 1.0f, 1.0f),
                                    QVector3D(0.0f, 1.0f, 0.0f)).isIdentity());
    QVERIFY(Transform3D::viewMatrix(QVector3D(0.0f, 10.0f, 0.0f), QVector3D(),
                                    QVector3D(0.0f, 1.0f, 0.0f)).isIdentity());
}

void UtTransformations::testViewport()
{
    const QMatrix4x4 viewport = Transform3D::viewport(0.0, 0.0, 200.0, 100.0);

    const QVector3D topRight = apply(viewport, QVector3D(1.0f, 1.0f, 0.0f));
    QVERIFY(samePoint(topRight, QVector3D(200.0f, 0.0f, 0.5f)));

    const QVector3D bottomLeft = apply(viewport, QVector3D(-1.0f, -1.0f, 0.0f));
    QVERIFY(samePoint(bottomLeft, QVector3D(0.0f, 100.0f, 0.5f)));
}

void UtTransformations::testOrthographicProjection()
{
    const Camera camera = Camera();
    QVERIFY(camera.projection == Camera::Projection::Orthographic);

    QPointF projected;
    QVERIFY(camera.project(QVector3D(), window(), &projected));
    COMPARE_POINT(projected, QPointF(0.0, 0.0));

    // World +y points up, scene y grows downwards.
    QVERIFY(camera.project(QVector3D(100.0f, 50.0f, 0.0f), window(), &projected));
    COMPARE_POINT(projected, QPointF(100.0, -50.0));

    QVERIFY(camera.project(QVector3D(500.0f, 400.0f, 0.0f), window(), &projected));
    COMPARE_POINT(projected, QPointF(500.0, -400.0));

    QVERIFY(!camera.project(QVector3D(1000.0f, 0.0f, 0.0f), window(), &projected));

    // The same pipeline, spelled out.
    QVERIFY(Transform3D::projectPoint(QVector3D(0.0f, 0.0f, 0.0f),
                                      Transform3D::translation(QVector3D(-20.0f, 0.0f, 0.0f)),
                                      camera.viewMatrix(), camera.projectionMatrix(window()),
                                      camera.viewportMatrix(window()), &projected));
    COMPARE_POINT(projected, QPointF(-20.0, 0.0));
}

void UtTransformations::testPerspectiveProjection()
{
    Camera camera;
    camera.projection = Camera::Projection::Perspective;

    QPointF projected;
    QVERIFY(camera.project(QVector3D(), window(), &projected));
    COMPARE_POINT(projected, QPointF(0.0, 0.0));

    // fov 60, aspect 1.25, distance 500: x_ndc = 100 / (1.25 * tan(30) * 500)
    const double expectedX = 100.0 / (1.25 * qTan(qDegreesToRadians(30.0)) * 500.0) * 500.0;
    QVERIFY(camera.project(QVector3D(100.0f, 0.0f, 0.0f), window(), &projected));
    QVERIFY2(qAbs(projected.x() - expectedX) < 0.01, describe(projected).constData());
    QVERIFY(qAbs(projected.y()) < 0.01);

    // Behind the camera.
    QVERIFY(!camera.project(QVector3D(0.0f, 0.0f, 600.0f), window(), &projected));
}

void UtTransformations::testCameraValidate_data()
{
    QTest::addColumn<QVector3D>("vrp");
    QTest::addColumn<QVector3D>("target");
    QTest::addColumn<QVector3D>("vup");
    QTest::addColumn<QString>("error");

    QTest::newRow("default")
        << QVector3D(0.0f, 0.0f, 500.0f) << QVector3D() << QVector3D(0.0f, 1.0f, 0.0f) << QString();
    QTest::newRow("same position")
        << QVector3D(1.0f, 2.0f, 3.0f) << QVector3D(1.0f, 2.0f, 3.0f) << QVector3D(0.0f, 1.0f, 0.0f)
        << QString("Camera position (VRP) and target must be different.");
    QTest::newRow("zero vup")
        << QVector3D(0.0f, 0.0f, 500.0f) << QVector3D() << QVector3D()
        << QString("View up vector (VUP) must not be zero.");
    QTest::newRow("parallel vup")
        << QVector3D(0.0f, 0.0f, 500.0f) << QVector3D() << QVector3D(0.0f, 0.0f, -3.0f)
        << QString("View up vector (VUP) must not be parallel to the view direction.");
}

void UtTransformations::testCameraValidate()
{
    QFETCH(QVector3D, vrp);
    QFETCH(QVector3D, target);
    QFETCH(QVector3D, vup);
    QFETCH(QString, error);

    QString message;
    QCOMPARE(Camera::validate(vrp, target, vup, &message), error.isEmpty());
    QCOMPARE(message, error);
}

QTEST_MAIN(UtTransformations)

#include "ut_transformations.moc"
