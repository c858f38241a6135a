#ifndef TRANSFORMATIONCONTROLLER_H
#define TRANSFORMATIONCONTROLLER_H

#include "graphicsobject.h"

#include <QObject>
#include <QPointF>
#include <QVector3D>

class SceneController;

struct TransformParameters
{
    enum class Kind {
        Translate2D,
        ScaleCenter2D,
        RotateOrigin2D,
        RotateCenter2D,
        RotateArbitrary2D,
        Translate3D,
        ScaleCenter3D,
        RotateX3D,
        RotateY3D,
        RotateZ3D,
        RotateAxis3D
    };

    Kind kind = Kind::Translate2D;
    QVector3D offset;
    QVector3D factors = QVector3D(1.0f, 1.0f, 1.0f);
    double angle = 0.0;
    QPointF pivot;
    QVector3D axisPoint;
    QVector3D axisDirection = QVector3D(0.0f, 0.0f, 1.0f);

    bool is3D() const { return kind >= Kind::Translate3D; }
    static QString kindName(Kind kind);
};

class TransformationController : public QObject
{
    Q_OBJECT

public:
    explicit TransformationController(SceneController *sceneController, QObject *parent = nullptr);

    // Returns a transformed copy, or a null pointer when the transformation
    // does not fit the object or breaks its invariants.
    static GraphicsObjectPtr transformed(const GraphicsObjectPtr &object,
                                         const TransformParameters &parameters,
                                         QString *errorMessage = nullptr);

    // Transforms the objects in place in the scene, returns how many changed.
    int transformObjects(const QVector<GraphicsObjectPtr> &objects,
                         const TransformParameters &parameters);

signals:
    void statusMessage(const QString &text, int timeout);
    void transformationFailed(const QString &text);

private:
    SceneController *m_sceneController;
};

#endif // TRANSFORMATIONCONTROLLER_H
