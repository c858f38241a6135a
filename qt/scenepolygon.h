#ifndef SCENEPOLYGON_H
#define SCENEPOLYGON_H

#include "graphicsobject.h"

// Closed polygon or, when open, a polyline. Open polylines are never filled.
class ScenePolygon : public Shape2D
{
public:
    static const int PEN_WIDTH = 2;
    static constexpr double FILL_ALPHA = 0.35;

    static QSharedPointer<ScenePolygon> create(const QVector<QPointF> &points, bool isOpen,
                                               bool isFilled, const QColor &color = Qt::black,
                                               QString *errorMessage = nullptr);

    static int minimumPointCount(bool isOpen) { return isOpen ? 2 : 3; }

    Type type() const override { return Type::Polygon; }
    QString typeName() const override { return QStringLiteral("Polygon"); }
    GraphicsObjectPtr clone() const override;

    bool isOpen() const { return m_open; }
    bool isFilled() const { return m_filled; }

    QVector<QPointF> coordinates() const override { return m_points; }
    bool setCoordinates(const QVector<QPointF> &points, QString *errorMessage = nullptr) override;
    QGraphicsItem *createGraphicsItem() const override;

private:
    ScenePolygon(const QVector<QPointF> &points, bool isOpen, bool isFilled, const QColor &color);

    QVector<QPointF> m_points;
    bool m_open;
    bool m_filled;
};

#endif // SCENEPOLYGON_H
