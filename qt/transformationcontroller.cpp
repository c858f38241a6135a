#include "transformationcontroller.h"
#include "editorlogging.h"
#include "scenecontroller.h"
#include "transformations.h"
#include "transformations3d.h"
#include "wireframe3d.h"

#include <QStringList>

QString TransformParameters::kindName(Kind kind)
{
    switch (kind) {
    case Kind::Translate2D:
        return QObject::tr("Translate");
    case Kind::ScaleCenter2D:
        return QObject::tr("Scale about center");
    case Kind::RotateOrigin2D:
        return QObject::tr("Rotate about origin");
    case Kind::RotateCenter2D:
        return QObject::tr("Rotate about center");
    case Kind::RotateArbitrary2D:
        return QObject::tr("Rotate about point");
    case Kind::Translate3D:
        return QObject::tr("Translate (3D)");
    case Kind::ScaleCenter3D:
        return QObject::tr("Scale about center (3D)");
    case Kind::RotateX3D:
        return QObject::tr("Rotate around X");
    case Kind::RotateY3D:
        return QObject::tr("Rotate around Y");
    case Kind::RotateZ3D:
        return QObject::tr("Rotate around Z");
    case Kind::RotateAxis3D:
        return QObject::tr("Rotate around axis");
    }
    return QString();
}

TransformationController::TransformationController(SceneController *sceneController, QObject *parent)
    : QObject(parent)
    , m_sceneController(sceneController)
{
}

GraphicsObjectPtr TransformationController::transformed(const GraphicsObjectPtr &object,
                                                        const TransformParameters &parameters,
                                                        QString *errorMessage)
{
    if (!object)
        return GraphicsObjectPtr();

    if (object->is3D() != parameters.is3D()) {
        if (errorMessage)
            *errorMessage = tr("%1 cannot be applied to %2.")
                                .arg(TransformParameters::kindName(parameters.kind), object->typeName());
        return GraphicsObjectPtr();
    }

    const GraphicsObjectPtr copy = object->clone();

    if (copy->is3D()) {
        const QSharedPointer<Wireframe3D> wireframe = copy.staticCast<Wireframe3D>();
        const QVector3D center = wireframe->center();
        QMatrix4x4 matrix;
        switch (parameters.kind) {
        case TransformParameters::Kind::Translate3D:
            matrix = Transform3D::translation(parameters.offset);
            break;
        case TransformParameters::Kind::ScaleCenter3D:
            matrix = Transform3D::scalingAround(parameters.factors, center);
            break;
        case TransformParameters::Kind::RotateX3D:
            matrix = Transform3D::translation(center) * Transform3D::rotationX(parameters.angle)
                * Transform3D::translation(-center);
            break;
        case TransformParameters::Kind::RotateY3D:
            matrix = Transform3D::translation(center) * Transform3D::rotationY(parameters.angle)
                * Transform3D::translation(-center);
            break;
        case TransformParameters::Kind::RotateZ3D:
            matrix = Transform3D::translation(center) * Transform3D::rotationZ(parameters.angle)
                * Transform3D::translation(-center);
            break;
        case TransformParameters::Kind::RotateAxis3D:
            matrix = Transform3D::rotationAroundAxis(parameters.angle, parameters.axisPoint,
                                                     parameters.axisDirection);
            break;
        default:
            break;
        }
        if (!wireframe->setPoints(Transform3D::apply(wireframe->points(), matrix), errorMessage))
            return GraphicsObjectPtr();
        return copy;
    }

    const QSharedPointer<Shape2D> shape = copy.staticCast<Shape2D>();
    const QPointF center = shape->center();
    QTransform matrix;
    switch (parameters.kind) {
    case TransformParameters::Kind::Translate2D:
        matrix = Transform2D::translation(parameters.offset.x(), parameters.offset.y());
        break;
    case TransformParameters::Kind::ScaleCenter2D:
        matrix = Transform2D::scalingAround(parameters.factors.x(), parameters.factors.y(), center);
        break;
    case TransformParameters::Kind::RotateOrigin2D:
        matrix = Transform2D::rotation(parameters.angle);
        break;
    case TransformParameters::Kind::RotateCenter2D:
        matrix = Transform2D::rotationAround(parameters.angle, center);
        break;
    case TransformParameters::Kind::RotateArbitrary2D:
        matrix = Transform2D::rotationAround(parameters.angle, parameters.pivot);
        break;
    default:
        break;
    }
    if (!shape->setCoordinates(Transform2D::apply(shape->coordinates(), matrix), errorMessage))
        return GraphicsObjectPtr();
    return copy;
}

int TransformationController::transformObjects(const QVector<GraphicsObjectPtr> &objects,
                                               const TransformParameters &parameters)
{
    int changed = 0;
    QStringList errors;

    for (const GraphicsObjectPtr &object : objects) {
        QString error;
        const GraphicsObjectPtr result = transformed(object, parameters, &error);
        if (!result) {
            errors << QStringLiteral("%1: %2").arg(object ? object->typeName() : QStringLiteral("?"), error);
            continue;
        }
        if (m_sceneController->updateObject(object, result))
            ++changed;
    }

    if (!errors.isEmpty()) {
        qCWarning(lcScene) << "Transformation failed for" << errors.size() << "object(s):" << errors;
        emit transformationFailed(errors.join(QLatin1Char('\n')));
    }
    if (changed > 0)
        emit statusMessage(tr("%1 applied to %2 object(s).")
                               .arg(TransformParameters::kindName(parameters.kind))
                               .arg(changed),
                           3000);
    return changed;
}
