#include "bsplinecurve.h"
#include "geometry.h"

#include <QPainterPath>
#include <QPen>

const int BSplineCurve::PEN_WIDTH;
const int BSplineCurve::DEFAULT_DEGREE;
const int BSplineCurve::DEFAULT_SAMPLES_PER_SPAN;

BSplineCurve::BSplineCurve(const QVector<QPointF> &controlPoints, int degree,
                           const QVector<double> &knots, const QColor &color)
    : Shape2D(color)
    , m_controlPoints(controlPoints)
    , m_degree(degree)
    , m_knots(knots)
{
}

QSharedPointer<BSplineCurve> BSplineCurve::create(const QVector<QPointF> &controlPoints,
                                                  const QColor &color, int degree,
                                                  const QVector<double> &knots,
                                                  QString *errorMessage)
{
    const int n = controlPoints.size();
    if (n < 2) {
        if (errorMessage)
            *errorMessage = QStringLiteral("A B-spline needs at least 2 control points (got %1).").arg(n);
        return QSharedPointer<BSplineCurve>();
    }

    const int p = qBound(1, degree, n - 1);

    if (knots.isEmpty())
        return QSharedPointer<BSplineCurve>(new BSplineCurve(controlPoints, p, clampedUniformKnots(n, p), color));

    const int expected = n + p + 1;
    if (knots.size() != expected) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Knot vector has the wrong size. Expected %1, got %2.")
                                .arg(expected)
                                .arg(knots.size());
        return QSharedPointer<BSplineCurve>();
    }
    for (int i = 1; i < knots.size(); ++i) {
        if (knots[i] - knots[i - 1] < -GEOMETRY_EPSILON) {
            if (errorMessage)
                *errorMessage = QStringLiteral("Knot vector must be non-decreasing.");
            return QSharedPointer<BSplineCurve>();
        }
    }
    // The curve is only defined on [knots[p], knots[n]].
    if (knots[n] - knots[p] <= GEOMETRY_EPSILON) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Knot vector has an empty parameter range.");
        return QSharedPointer<BSplineCurve>();
    }
    return QSharedPointer<BSplineCurve>(new BSplineCurve(controlPoints, p, knots, color));
}

QVector<double> BSplineCurve::clampedUniformKnots(int controlPointCount, int degree)
{
    const int count = controlPointCount + degree + 1;
    QVector<double> knots(count, 0.0);

    for (int i = count - degree - 1; i < count; ++i)
        knots[i] = 1.0;

    const int internal = controlPointCount - degree - 1;
    if (internal > 0) {
        const double step = 1.0 / (controlPointCount - degree);
        for (int i = 0; i < internal; ++i)
            knots[degree + 1 + i] = (i + 1) * step;
    }
    return knots;
}

GraphicsObjectPtr BSplineCurve::clone() const
{
    return GraphicsObjectPtr(new BSplineCurve(m_controlPoints, m_degree, m_knots, m_color));
}

int BSplineCurve::lastActiveSpan() const
{
    for (int i = m_knots.size() - 2; i >= 0; --i) {
        if (m_knots[i] < m_knots[i + 1])
            return i;
    }
    return -1;
}

double BSplineCurve::basis(int i, int p, double u) const
{
    if (p == 0) {
        if (m_knots[i] <= u && u < m_knots[i + 1])
            return 1.0;
        // The right end of the domain belongs to the last non-empty span.
        if (isNearZero(u - m_knots.last()) && i == lastActiveSpan())
            return 1.0;
        return 0.0;
    }

    double result = 0.0;
    const double left = m_knots[i + p] - m_knots[i];
    if (!isNearZero(left))
        result += (u - m_knots[i]) / left * basis(i, p - 1, u);

    const double right = m_knots[i + p + 1] - m_knots[i + 1];
    if (!isNearZero(right))
        result += (m_knots[i + p + 1] - u) / right * basis(i + 1, p - 1, u);

    return result;
}

QPointF BSplineCurve::pointAt(double u) const
{
    const int n = m_controlPoints.size();
    u = qBound(m_knots[m_degree], u, m_knots[n]);

    QPointF point(0.0, 0.0);
    for (int i = 0; i < n; ++i)
        point += m_controlPoints[i] * basis(i, m_degree, u);
    return point;
}

QVector<QPointF> BSplineCurve::sample(int samplesPerSpan) const
{
    samplesPerSpan = qMax(2, samplesPerSpan);

    const int n = m_controlPoints.size();
    const double uMin = m_knots[m_degree];
    const double uMax = m_knots[n];

    QVector<double> spanKnots;
    for (int i = m_degree; i <= n; ++i) {
        if (spanKnots.isEmpty() || !isNearZero(m_knots[i] - spanKnots.last()))
            spanKnots << m_knots[i];
    }

    QVector<QPointF> points;
    points << pointAt(uMin);
    if (spanKnots.size() < 2)
        return points;

    for (int k = 0; k + 1 < spanKnots.size(); ++k) {
        const double start = spanKnots[k];
        const double end = spanKnots[k + 1];
        for (int i = 1; i <= samplesPerSpan; ++i) {
            const QPointF p = pointAt(start + (end - start) * i / samplesPerSpan);
            if (!fuzzyEqual(p, points.last()))
                points << p;
        }
    }

    const QPointF last = pointAt(uMax);
    if (!fuzzyEqual(last, points.last()))
        points << last;
    return points;
}

bool BSplineCurve::setCoordinates(const QVector<QPointF> &points, QString *errorMessage)
{
    if (points.size() != m_controlPoints.size()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Expected %1 control points, got %2.")
                                .arg(m_controlPoints.size())
                                .arg(points.size());
        return false;
    }
    m_controlPoints = points;
    return true;
}

QGraphicsItem *BSplineCurve::createGraphicsItem() const
{
    const QVector<QPointF> points = sample();
    QPainterPath path;
    path.moveTo(points.first());
    for (int i = 1; i < points.size(); ++i)
        path.lineTo(points[i]);
    return createPathItem(path, objectPen(m_color, PEN_WIDTH));
}
