#ifndef GRAPHICSOBJECT_H
#define GRAPHICSOBJECT_H

#include <QColor>
#include <QMetaType>
#include <QPointF>
#include <QSharedPointer>
#include <QString>
#include <QVector>

class QGraphicsItem;
class QPainterPath;
class QPen;

class GraphicsObject;
typedef QSharedPointer<GraphicsObject> GraphicsObjectPtr;

// Base of every object the editor keeps in its scene model. Items shown on
// the canvas are built from these, never the other way around.
class GraphicsObject
{
public:
    enum class Type {
        Point,
        Line,
        Polygon,
        Bezier,
        BSpline,
        Wireframe
    };

    explicit GraphicsObject(const QColor &color = Qt::black);
    virtual ~GraphicsObject();

    virtual Type type() const = 0;
    virtual QString typeName() const = 0;
    virtual GraphicsObjectPtr clone() const = 0;
    virtual bool is3D() const { return false; }

    QColor color() const { return m_color; }
    void setColor(const QColor &color);

protected:
    QColor m_color;
};

// A planar object described by an ordered list of points.
class Shape2D : public GraphicsObject
{
public:
    explicit Shape2D(const QColor &color = Qt::black);

    virtual QVector<QPointF> coordinates() const = 0;
    // Replaces the points keeping the object's structure. Fails when the new
    // list would break the object's invariants.
    virtual bool setCoordinates(const QVector<QPointF> &points, QString *errorMessage = nullptr) = 0;
    virtual QGraphicsItem *createGraphicsItem() const = 0;

    QPointF center() const;
};

QPointF centroid(const QVector<QPointF> &points);

// Shared look of the canvas items.
QPen objectPen(const QColor &color, double width, bool dashed = false);
QGraphicsItem *createPathItem(const QPainterPath &path, const QPen &pen);

Q_DECLARE_METATYPE(GraphicsObjectPtr)

#endif // GRAPHICSOBJECT_H
