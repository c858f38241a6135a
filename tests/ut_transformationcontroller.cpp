#include "editorstate.h"
#include "scenecontroller.h"
#include "sceneline.h"
#include "scenepoint.h"
#include "scenepolygon.h"
#include "transformationcontroller.h"
#include "wireframe3d.h"
#include "testbase.h"

#include <QtWidgets/QGraphicsScene>

namespace Tests {

class UtTransformationController : public TestBase
{
    Q_OBJECT

private slots:
    void testTransform2D_data();
    void testTransform2D();
    void testOriginalUntouched();
    void testDimensionMismatch();
    void testTransform3D();
    void testRotateWireframeAroundCenter();
    void testTransformObjects();
    void testKindName();

private:
    static TransformParameters parameters(TransformParameters::Kind kind);
    static QSharedPointer<Wireframe3D> unitEdge();
};

} // namespace Tests

Q_DECLARE_METATYPE(TransformParameters)

using namespace Tests;

/*
 * \class Tests::UtTransformationController
 */

TransformParameters UtTransformationController::parameters(TransformParameters::Kind kind)
{
    TransformParameters result;
    result.kind = kind;
    return result;
}

QSharedPointer<Wireframe3D> UtTransformationController::unitEdge()
{
    return Wireframe3D::create("edge", QVector<Segment3D>()
            << Segment3D(QVector3D(0.0f, 0.0f, 0.0f), QVector3D(10.0f, 0.0f, 0.0f)));
}

void UtTransformationController::testTransform2D_data()
{
    QTest::addColumn<TransformParameters>("parameters");
    QTest::addColumn<QVector<QPointF>>("input");
    QTest::addColumn<QVector<QPointF>>("expected");

    const QVector<QPointF> square = QVector<QPointF>()
        << QPointF(0.0, 0.0) << QPointF(10.0, 0.0) << QPointF(10.0, 10.0) << QPointF(0.0, 10.0);

    TransformParameters translate = parameters(TransformParameters::Kind::Translate2D);
    translate.offset = QVector3D(5.0f, -5.0f, 0.0f);
    QTest::newRow("translate") << translate << square << (QVector<QPointF>()
        << QPointF(5.0, -5.0) << QPointF(15.0, -5.0) << QPointF(15.0, 5.0) << QPointF(5.0, 5.0));

    TransformParameters scale = parameters(TransformParameters::Kind::ScaleCenter2D);
    scale.factors = QVector3D(2.0f, 2.0f, 1.0f);
    QTest::newRow("scale about center") << scale << square << (QVector<QPointF>()
        << QPointF(-5.0, -5.0) << QPointF(15.0, -5.0) << QPointF(15.0, 15.0) << QPointF(-5.0, 15.0));

    TransformParameters rotateOrigin = parameters(TransformParameters::Kind::RotateOrigin2D);
    rotateOrigin.angle = 90.0;
    QTest::newRow("rotate about origin") << rotateOrigin
        << (QVector<QPointF>() << QPointF(10.0, 0.0)) << (QVector<QPointF>() << QPointF(0.0, 10.0));

    TransformParameters rotateCenter = parameters(TransformParameters::Kind::RotateCenter2D);
    rotateCenter.angle = 180.0;
    QTest::newRow("rotate about center") << rotateCenter
        << (QVector<QPointF>() << QPointF(0.0, 0.0) << QPointF(10.0, 0.0))
        << (QVector<QPointF>() << QPointF(10.0, 0.0) << QPointF(0.0, 0.0));

    TransformParameters rotatePivot = parameters(TransformParameters::Kind::RotateArbitrary2D);
    rotatePivot.angle = 90.0;
    rotatePivot.pivot = QPointF(10.0, 10.0);
    QTest::newRow("rotate about point") << rotatePivot
        << (QVector<QPointF>() << QPointF(20.0, 10.0)) << (QVector<QPointF>() << QPointF(10.0, 20.0));
}

void UtTransformationController::testTransform2D()
{
    QFETCH(TransformParameters, parameters);
    QFETCH(QVector<QPointF>, input);
    QFETCH(QVector<QPointF>, expected);

    GraphicsObjectPtr object;
    if (input.size() == 1) {
        object = GraphicsObjectPtr(new ScenePoint(input.first()));
    } else if (input.size() == 2) {
        object = SceneLine::create(input[0], input[1]);
    } else {
        object = ScenePolygon::create(input, false, false);
    }
    QVERIFY(object);

    QString error;
    const GraphicsObjectPtr result = TransformationController::transformed(object, parameters, &error);
    QVERIFY2(result, qPrintable(error));
    QVERIFY(result->type() == object->type());
    COMPARE_POINTS(result.staticCast<Shape2D>()->coordinates(), expected);
}

void UtTransformationController::testOriginalUntouched()
{
    const QSharedPointer<SceneLine> line = SceneLine::create(QPointF(0.0, 0.0), QPointF(10.0, 0.0), Qt::red);
    TransformParameters translate = parameters(TransformParameters::Kind::Translate2D);
    translate.offset = QVector3D(3.0f, 4.0f, 0.0f);

    const GraphicsObjectPtr result = TransformationController::transformed(line, translate);
    QVERIFY(result);
    QVERIFY(result.data() != line.data());
    QCOMPARE(result->color(), QColor(Qt::red));
    COMPARE_POINT(line->start(), QPointF(0.0, 0.0));
    COMPARE_POINT(result.staticCast<SceneLine>()->start(), QPointF(3.0, 4.0));

    // A near-zero factor leaves the object as it is.
    TransformParameters collapse = parameters(TransformParameters::Kind::ScaleCenter2D);
    collapse.factors = QVector3D(1e-12f, 1e-12f, 1.0f);
    const GraphicsObjectPtr unchanged = TransformationController::transformed(line, collapse);
    QVERIFY(unchanged);
    COMPARE_POINT(unchanged.staticCast<SceneLine>()->end(), QPointF(10.0, 0.0));

    QVERIFY(!TransformationController::transformed(GraphicsObjectPtr(), translate));
}

void UtTransformationController::testDimensionMismatch()
{
    QString error;
    const GraphicsObjectPtr point(new ScenePoint(QPointF(1.0, 1.0)));
    QVERIFY(!TransformationController::transformed(point, parameters(TransformParameters::Kind::RotateX3D), &error));
    QVERIFY2(error.contains("cannot be applied to Point"), qPrintable(error));

    QVERIFY(!TransformationController::transformed(unitEdge(), parameters(TransformParameters::Kind::Translate2D), &error));
    QVERIFY2(error.contains("Wireframe3D"), qPrintable(error));
}

void UtTransformationController::testTransform3D()
{
    TransformParameters translate = parameters(TransformParameters::Kind::Translate3D);
    translate.offset = QVector3D(1.0f, 2.0f, 3.0f);

    const GraphicsObjectPtr moved = TransformationController::transformed(unitEdge(), translate);
    QVERIFY(moved);
    const QVector<QVector3D> points = moved.staticCast<Wireframe3D>()->points();
    QCOMPARE(points.size(), 2);
    QVERIFY(samePoint(points[0], QVector3D(1.0f, 2.0f, 3.0f)));
    QVERIFY(samePoint(points[1], QVector3D(11.0f, 2.0f, 3.0f)));

    TransformParameters scale = parameters(TransformParameters::Kind::ScaleCenter3D);
    scale.factors = QVector3D(3.0f, 1.0f, 1.0f);
    const GraphicsObjectPtr scaled = TransformationController::transformed(unitEdge(), scale);
    QVERIFY(scaled);
    QVERIFY(samePoint(scaled.staticCast<Wireframe3D>()->points()[0], QVector3D(-10.0f, 0.0f, 0.0f)));
    QVERIFY(samePoint(scaled.staticCast<Wireframe3D>()->points()[1], QVector3D(20.0f, 0.0f, 0.0f)));

    TransformParameters axis = parameters(TransformParameters::Kind::RotateAxis3D);
    axis.angle = 90.0;
    axis.axisPoint = QVector3D();
    axis.axisDirection = QVector3D(0.0f, 1.0f, 0.0f);
    const GraphicsObjectPtr rotated = TransformationController::transformed(unitEdge(), axis);
    QVERIFY(rotated);
    QVERIFY(samePoint(rotated.staticCast<Wireframe3D>()->points()[1], QVector3D(0.0f, 0.0f, -10.0f)));
}

void UtTransformationController::testRotateWireframeAroundCenter()
{
    TransformParameters rotate = parameters(TransformParameters::Kind::RotateZ3D);
    rotate.angle = 90.0;

    const GraphicsObjectPtr rotated = TransformationController::transformed(unitEdge(), rotate);
    QVERIFY(rotated);
    const QSharedPointer<Wireframe3D> wireframe = rotated.staticCast<Wireframe3D>();
    QVERIFY(samePoint(wireframe->center(), QVector3D(5.0f, 0.0f, 0.0f)));
    QVERIFY(samePoint(wireframe->points()[0], QVector3D(5.0f, -5.0f, 0.0f)));
    QVERIFY(samePoint(wireframe->points()[1], QVector3D(5.0f, 5.0f, 0.0f)));
}

void UtTransformationController::testTransformObjects()
{
    QGraphicsScene scene;
    EditorState state;
    SceneController sceneController(&scene, &state);
    TransformationController controller(&sceneController);

    const GraphicsObjectPtr point(new ScenePoint(QPointF(1.0, 1.0)));
    const GraphicsObjectPtr line = SceneLine::create(QPointF(0.0, 0.0), QPointF(10.0, 0.0));
    const GraphicsObjectPtr wireframe = unitEdge();
    sceneController.addObjects(QVector<GraphicsObjectPtr>() << point << line << wireframe);

    QSignalSpy statusSpy(&controller, SIGNAL(statusMessage(QString,int)));
    QSignalSpy failedSpy(&controller, SIGNAL(transformationFailed(QString)));
    QSignalSpy modifiedSpy(&sceneController, SIGNAL(sceneModified()));

    TransformParameters translate = parameters(TransformParameters::Kind::Translate2D);
    translate.offset = QVector3D(10.0f, 0.0f, 0.0f);
    QCOMPARE(controller.transformObjects(QVector<GraphicsObjectPtr>() << point << line << wireframe, translate), 2);

    QCOMPARE(modifiedSpy.count(), 2);
    QCOMPARE(statusSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 1);
    QVERIFY(failedSpy.first().first().toString().startsWith("Wireframe3D:"));

    const QVector<GraphicsObjectPtr> objects = sceneController.objects();
    QCOMPARE(objects.size(), 3);
    QVERIFY(!objects.contains(point));
    QVERIFY(!objects.contains(line));
    QCOMPARE(objects[2], wireframe);
    COMPARE_POINT(objects[0].staticCast<ScenePoint>()->position(), QPointF(11.0, 1.0));
    COMPARE_POINT(objects[1].staticCast<SceneLine>()->end(), QPointF(20.0, 0.0));

    QCOMPARE(controller.transformObjects(QVector<GraphicsObjectPtr>(), translate), 0);
    QCOMPARE(statusSpy.count(), 1);
}

void UtTransformationController::testKindName()
{
    QCOMPARE(TransformParameters::kindName(TransformParameters::Kind::RotateAxis3D), QString("Rotate around axis"));
    QCOMPARE(TransformParameters::kindName(TransformParameters::Kind::ScaleCenter2D), QString("Scale about center"));
    QVERIFY(parameters(TransformParameters::Kind::RotateX3D).is3D());
    QVERIFY(!parameters(TransformParameters::Kind::RotateArbitrary2D).is3D());
}

QTEST_MAIN(UtTransformationController)

#include "ut_transformationcontroller.moc"
