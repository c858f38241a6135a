#ifndef BSPLINECURVE_H
#define BSPLINECURVE_H

#include "graphicsobject.h"

class BSplineCurve : public Shape2D
{
public:
    static const int PEN_WIDTH = 2;
    static const int DEFAULT_DEGREE = 3;
    static const int DEFAULT_SAMPLES_PER_SPAN = 20;

    // The degree is clamped to [1, n - 1]. An empty knot vector selects the
    // clamped uniform one; a custom vector needs n + degree + 1 non-decreasing
    // values.
    static QSharedPointer<BSplineCurve> create(const QVector<QPointF> &controlPoints,
                                               const QColor &color = Qt::black,
                                               int degree = DEFAULT_DEGREE,
                                               const QVector<double> &knots = QVector<double>(),
                                               QString *errorMessage = nullptr);

    static QVector<double> clampedUniformKnots(int controlPointCount, int degree);

    Type type() const override { return Type::BSpline; }
    QString typeName() const override { return QStringLiteral("BSplineCurve"); }
    GraphicsObjectPtr clone() const override;

    QVector<QPointF> controlPoints() const { return m_controlPoints; }
    int degree() const { return m_degree; }
    QVector<double> knots() const { return m_knots; }

    double basis(int i, int p, double u) const;
    // u is clamped to the curve domain [knots[degree], knots[n]].
    QPointF pointAt(double u) const;
    QVector<QPointF> sample(int samplesPerSpan = DEFAULT_SAMPLES_PER_SPAN) const;

    QVector<QPointF> coordinates() const override { return m_controlPoints; }
    bool setCoordinates(const QVector<QPointF> &points, QString *errorMessage = nullptr) override;
    QGraphicsItem *createGraphicsItem() const override;

private:
    BSplineCurve(const QVector<QPointF> &controlPoints, int degree, const QVector<double> &knots,
                 const QColor &color);

    int lastActiveSpan() const;

    QVector<QPointF> m_controlPoints;
    int m_degree;
    QVector<double> m_knots;
};

#endif // BSPLINECURVE_H
