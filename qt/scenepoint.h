#ifndef SCENEPOINT_H
#define SCENEPOINT_H

#include "graphicsobject.h"

class ScenePoint : public Shape2D
{
public:
    static const int DRAW_SIZE = 6;

    explicit ScenePoint(const QPointF &position, const QColor &color = Qt::black);

    Type type() const override { return Type::Point; }
    QString typeName() const override { return QStringLiteral("Point"); }
    GraphicsObjectPtr clone() const override;

    QPointF position() const { return m_position; }

    QVector<QPointF> coordinates() const override;
    bool setCoordinates(const QVector<QPointF> &points, QString *errorMessage = nullptr) override;
    QGraphicsItem *createGraphicsItem() const override;

private:
    QPointF m_position;
};

#endif // SCENEPOINT_H
