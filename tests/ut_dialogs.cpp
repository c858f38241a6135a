#include "beziercurve.h"
#include "bsplinecurve.h"
#include "cameradialog.h"
#include "coordinateinputdialog.h"
#include "sceneline.h"
#include "scenepoint.h"
#include "scenepolygon.h"
#include "transformationdialog.h"
#include "testbase.h"

#include <QtWidgets/QTableWidget>

namespace Tests {

class UtDialogs : public TestBase
{
    Q_OBJECT

private slots:
    void testCoordinatePoint();
    void testCoordinateLine();
    void testCoordinatePolygon();
    void testCoordinateOpenPolyline();
    void testCoordinateBezier();
    void testCoordinateBSpline();
    void testCoordinateBadCell();
    void testCoordinateFixedRows();
    void testCoordinateAccept();

    void testTransformationParameters2D();
    void testTransformationParameters3D();
    void testTransformationValidate_data();
    void testTransformationValidate();

    void testCameraRoundTrip();

private:
    static QVector<QPointF> square();
};

} // namespace Tests

Q_DECLARE_METATYPE(TransformParameters)

using namespace Tests;

/*
 * \class Tests::UtDialogs
 */

QVector<QPointF> UtDialogs::square()
{
    return QVector<QPointF>()
        << QPointF(0.0, 0.0) << QPointF(10.0, 0.0) << QPointF(10.0, 10.0) << QPointF(0.0, 10.0);
}

void UtDialogs::testCoordinatePoint()
{
    CoordinateInputDialog dialog;
    dialog.setMode(CoordinateInputDialog::Mode::Point);
    dialog.setColor(Qt::green);
    dialog.setPoints(QVector<QPointF>() << QPointF(3.5, -7.25));

    QString error;
    const GraphicsObjectPtr object = dialog.buildObject(&error);
    QVERIFY2(object, qPrintable(error));
    QVERIFY(object->type() == GraphicsObject::Type::Point);
    QCOMPARE(object->color(), QColor(Qt::green));
    COMPARE_POINT(object.staticCast<ScenePoint>()->position(), QPointF(3.5, -7.25));
}

void UtDialogs::testCoordinateLine()
{
    CoordinateInputDialog dialog;
    dialog.setMode(CoordinateInputDialog::Mode::Line);
    dialog.setPoints(QVector<QPointF>() << QPointF(1.0, 2.0) << QPointF(30.0, 40.0));

    const GraphicsObjectPtr object = dialog.buildObject(nullptr);
    QVERIFY(object);
    QVERIFY(object->type() == GraphicsObject::Type::Line);
    COMPARE_POINT(object.staticCast<SceneLine>()->end(), QPointF(30.0, 40.0));

    QString error;
    dialog.setPoints(QVector<QPointF>() << QPointF(5.0, 5.0) << QPointF(5.0, 5.0));
    QVERIFY(!dialog.buildObject(&error));
    QCOMPARE(error, QString("A line needs two distinct endpoints."));
}

void UtDialogs::testCoordinatePolygon()
{
    CoordinateInputDialog dialog;
    dialog.setMode(CoordinateInputDialog::Mode::Polygon);
    dialog.setPolygonOptions(false, true);
    dialog.setPoints(square());

    const GraphicsObjectPtr object = dialog.buildObject(nullptr);
    QVERIFY(object);
    const QSharedPointer<ScenePolygon> polygon = object.staticCast<ScenePolygon>();
    QVERIFY(!polygon->isOpen());
    QVERIFY(polygon->isFilled());
    COMPARE_POINTS(polygon->coordinates(), square());
}

void UtDialogs::testCoordinateOpenPolyline()
{
    CoordinateInputDialog dialog;
    dialog.setMode(CoordinateInputDialog::Mode::Polygon);
    // Filled is dropped for an open polyline.
    dialog.setPolygonOptions(true, true);
    dialog.setPoints(QVector<QPointF>() << QPointF(0.0, 0.0) << QPointF(20.0, 5.0));
    QCOMPARE(dialog.points().size(), 2);

    const GraphicsObjectPtr object = dialog.buildObject(nullptr);
    QVERIFY(object);
    QVERIFY(object.staticCast<ScenePolygon>()->isOpen());
    QVERIFY(!object.staticCast<ScenePolygon>()->isFilled());
}

void UtDialogs::testCoordinateBezier()
{
    CoordinateInputDialog dialog;
    dialog.setMode(CoordinateInputDialog::Mode::Bezier);
    dialog.setPoints(square());

    QString error;
    const GraphicsObjectPtr object = dialog.buildObject(&error);
    QVERIFY2(object, qPrintable(error));
    QVERIFY(object->type() == GraphicsObject::Type::Bezier);
    QCOMPARE(object.staticCast<BezierCurve>()->segmentCount(), 1);

    dialog.setPoints(square() << QPointF(20.0, 20.0));
    QVERIFY(!dialog.buildObject(&error));
    QVERIFY2(error.contains("(5)"), qPrintable(error));
}

void UtDialogs::testCoordinateBSpline()
{
    CoordinateInputDialog dialog;
    dialog.setMode(CoordinateInputDialog::Mode::BSpline);
    dialog.setSplineDegree(3);
    dialog.setPoints(QVector<QPointF>() << QPointF(0.0, 0.0) << QPointF(10.0, 20.0) << QPointF(20.0, 0.0));

    const GraphicsObjectPtr object = dialog.buildObject(nullptr);
    QVERIFY(object);
    const QSharedPointer<BSplineCurve> curve = object.staticCast<BSplineCurve>();
    QCOMPARE(curve->controlPoints().size(), 3);
    QCOMPARE(curve->degree(), 2);
}

void UtDialogs::testCoordinateBadCell()
{
    CoordinateInputDialog dialog;
    dialog.setMode(CoordinateInputDialog::Mode::Line);
    dialog.setPoints(QVector<QPointF>() << QPointF(1.0, 2.0) << QPointF(30.0, 40.0));

    QTableWidget *table = dialog.findChild<QTableWidget *>();
    QVERIFY(table);
    table->item(1, 1)->setText("forty");

    QString error;
    QVERIFY(dialog.points(&error).isEmpty());
    QCOMPARE(error, QString("Point 2: Y is not a number."));

    error.clear();
    QVERIFY(!dialog.buildObject(&error));
    QCOMPARE(error, QString("Point 2: Y is not a number."));

    table->item(1, 1)->setText(" 40 ");
    QCOMPARE(dialog.points().size(), 2);
}

void UtDialogs::testCoordinateFixedRows()
{
    CoordinateInputDialog dialog;
    dialog.setMode(CoordinateInputDialog::Mode::Polygon);
    dialog.setPoints(square());
    QCOMPARE(dialog.points().size(), 4);

    dialog.setMode(CoordinateInputDialog::Mode::Line);
    QCOMPARE(dialog.points().size(), 2);

    dialog.setMode(CoordinateInputDialog::Mode::Point);
    dialog.setPoints(square());
    QCOMPARE(dialog.points().size(), 1);

    dialog.setMode(CoordinateInputDialog::Mode::Bezier);
    QCOMPARE(dialog.points().size(), 4);
}

void UtDialogs::testCoordinateAccept()
{
    CoordinateInputDialog dialog;
    QVERIFY(!dialog.createdObject());

    dialog.setMode(CoordinateInputDialog::Mode::Line);
    dialog.setPoints(QVector<QPointF>() << QPointF(0.0, 0.0) << QPointF(10.0, 10.0));
    dialog.accept();

    QCOMPARE(dialog.result(), int(QDialog::Accepted));
    QVERIFY(dialog.createdObject());
    QVERIFY(dialog.createdObject()->type() == GraphicsObject::Type::Line);
}

void UtDialogs::testTransformationParameters2D()
{
    TransformationDialog dialog(false);
    QVERIFY(!dialog.is3D());
    QVERIFY(dialog.kind() == TransformParameters::Kind::Translate2D);

    TransformParameters parameters;
    parameters.kind = TransformParameters::Kind::RotateArbitrary2D;
    parameters.offset = QVector3D(5.0f, 6.0f, 7.0f);
    parameters.factors = QVector3D(2.0f, 0.5f, 3.0f);
    parameters.angle = 45.0;
    parameters.pivot = QPointF(12.5, -4.0);
    dialog.setParameters(parameters);

    const TransformParameters result = dialog.parameters();
    QVERIFY(result.kind == TransformParameters::Kind::RotateArbitrary2D);
    QCOMPARE(result.angle, 45.0);
    COMPARE_POINT(result.pivot, QPointF(12.5, -4.0));
    QVERIFY(samePoint(result.offset, QVector3D(5.0f, 6.0f, 0.0f)));
    QVERIFY(samePoint(result.factors, QVector3D(2.0f, 0.5f, 1.0f)));

    // 3D kinds are not offered here.
    dialog.setKind(TransformParameters::Kind::RotateX3D);
    QVERIFY(dialog.kind() == TransformParameters::Kind::RotateArbitrary2D);
}

void UtDialogs::testTransformationParameters3D()
{
    TransformationDialog dialog(true);
    QVERIFY(dialog.is3D());
    QVERIFY(dialog.kind() == TransformParameters::Kind::Translate3D);

    TransformParameters parameters;
    parameters.kind = TransformParameters::Kind::RotateAxis3D;
    parameters.offset = QVector3D(1.0f, 2.0f, 3.0f);
    parameters.angle = -30.0;
    parameters.axisPoint = QVector3D(10.0f, 0.0f, -5.0f);
    parameters.axisDirection = QVector3D(0.0f, 1.0f, 1.0f);
    dialog.setParameters(parameters);

    const TransformParameters result = dialog.parameters();
    QVERIFY(result.kind == TransformParameters::Kind::RotateAxis3D);
    QVERIFY(result.is3D());
    QCOMPARE(result.angle, -30.0);
    QVERIFY(samePoint(result.offset, QVector3D(1.0f, 2.0f, 3.0f)));
    QVERIFY(samePoint(result.axisPoint, QVector3D(10.0f, 0.0f, -5.0f)));
    QVERIFY(samePoint(result.axisDirection, QVector3D(0.0f, 1.0f, 1.0f)));

    dialog.setKind(TransformParameters::Kind::Translate2D);
    QVERIFY(dialog.kind() == TransformParameters::Kind::RotateAxis3D);
}

void UtDialogs::testTransformationValidate_data()
{
    QTest::addColumn<TransformParameters>("parameters");
    QTest::addColumn<QString>("error");

    TransformParameters translate;
    QTest::newRow("translate") << translate << QString();

    TransformParameters scale;
    scale.kind = TransformParameters::Kind::ScaleCenter2D;
    scale.factors = QVector3D(2.0f, 0.0f, 1.0f);
    QTest::newRow("zero 2D factor") << scale << QString("Scale factors must not be zero.");

    // Z is not used by a 2D scale.
    scale.factors = QVector3D(2.0f, 3.0f, 0.0f);
    QTest::newRow("2D ignores z") << scale << QString();

    TransformParameters scale3D;
    scale3D.kind = TransformParameters::Kind::ScaleCenter3D;
    scale3D.factors = QVector3D(2.0f, 3.0f, 0.0f);
    QTest::newRow("zero 3D factor") << scale3D << QString("Scale factors must not be zero.");

    TransformParameters axis;
    axis.kind = TransformParameters::Kind::RotateAxis3D;
    axis.axisDirection = QVector3D();
    QTest::newRow("zero axis") << axis << QString("The rotation axis direction must not be the zero vector.");

    axis.axisDirection = QVector3D(1.0f, 1.0f, 0.0f);
    QTest::newRow("axis") << axis << QString();

    TransformParameters rotateX;
    rotateX.kind = TransformParameters::Kind::RotateX3D;
    rotateX.axisDirection = QVector3D();
    QTest::newRow("axis unused") << rotateX << QString();
}

void UtDialogs::testTransformationValidate()
{
    QFETCH(TransformParameters, parameters);
    QFETCH(QString, error);

    QString actual;
    QCOMPARE(TransformationDialog::validate(parameters, &actual), error.isEmpty());
    QCOMPARE(actual, error);
}

void UtDialogs::testCameraRoundTrip()
{
    CameraDialog dialog;
    QVERIFY(dialog.camera() == Camera());

    Camera camera;
    camera.vrp = QVector3D(10.0f, 20.0f, 30.0f);
    camera.target = QVector3D(-5.0f, 0.0f, 2.5f);
    camera.vup = QVector3D(0.0f, 0.0f, 1.0f);
    camera.projection = Camera::Projection::Perspective;
    camera.fieldOfView = 45.0;
    dialog.setCamera(camera);

    const Camera edited = dialog.camera();
    QVERIFY(edited == camera);
    QVERIFY(edited.projection == Camera::Projection::Perspective);

    dialog.accept();
    QCOMPARE(dialog.result(), int(QDialog::Accepted));
}

QTEST_MAIN(UtDialogs)

#include "ut_dialogs.moc"
