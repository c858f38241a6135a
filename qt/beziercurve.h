#ifndef BEZIERCURVE_H
#define BEZIERCURVE_H

#include "graphicsobject.h"

// Composite cubic Bezier curve. Segments share their end points, so a curve
// of N segments has 3N + 1 control points.
class BezierCurve : public Shape2D
{
public:
    static const int PEN_WIDTH = 2;
    static const int DEFAULT_SAMPLES_PER_SEGMENT = 20;

    static QSharedPointer<BezierCurve> create(const QVector<QPointF> &controlPoints,
                                              const QColor &color = Qt::black,
                                              QString *errorMessage = nullptr);

    static bool isValidPointCount(int count);

    Type type() const override { return Type::Bezier; }
    QString typeName() const override { return QStringLiteral("BezierCurve"); }
    GraphicsObjectPtr clone() const override;

    QVector<QPointF> controlPoints() const { return m_controlPoints; }
    int segmentCount() const { return (m_controlPoints.size() - 1) / 3; }

    // t is clamped to [0, 1].
    QPointF pointAt(int segment, double t) const;
    QVector<QPointF> sample(int samplesPerSegment = DEFAULT_SAMPLES_PER_SEGMENT) const;

    QVector<QPointF> coordinates() const override { return m_controlPoints; }
    bool setCoordinates(const QVector<QPointF> &points, QString *errorMessage = nullptr) override;
    QGraphicsItem *createGraphicsItem() const override;

private:
    BezierCurve(const QVector<QPointF> &controlPoints, const QColor &color);

    QVector<QPointF> m_controlPoints;
};

#endif // BEZIERCURVE_H
