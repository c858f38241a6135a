#ifndef SCENELINE_H
#define SCENELINE_H

#include "graphicsobject.h"

#include <QLineF>

class SceneLine : public Shape2D
{
public:
    static const int PEN_WIDTH = 2;

    // Returns a null pointer when both endpoints coincide.
    static QSharedPointer<SceneLine> create(const QPointF &start, const QPointF &end,
                                            const QColor &color = Qt::black,
                                            QString *errorMessage = nullptr);

    Type type() const override { return Type::Line; }
    QString typeName() const override { return QStringLiteral("Line"); }
    GraphicsObjectPtr clone() const override;

    QPointF start() const { return m_start; }
    QPointF end() const { return m_end; }
    QLineF line() const { return QLineF(m_start, m_end); }

    QVector<QPointF> coordinates() const override;
    bool setCoordinates(const QVector<QPointF> &points, QString *errorMessage = nullptr) override;
    QGraphicsItem *createGraphicsItem() const override;

private:
    SceneLine(const QPointF &start, const QPointF &end, const QColor &color);

    QPointF m_start;
    QPointF m_end;
};

#endif // SCENELINE_H
