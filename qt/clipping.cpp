#include "clipping.h"
#include "geometry.h"

#include <QtMath>

namespace Clipping {

namespace {

enum OutCode {
    INSIDE = 0,
    LEFT = 1,
    RIGHT = 2,
    BOTTOM = 4, // y < ymin
    TOP = 8     // y > ymax
};

int computeOutCode(double x, double y, const QRectF &window)
{
    int code = INSIDE;
    if (x < window.left())
        code |= LEFT;
    else if (x > window.right())
        code |= RIGHT;
    if (y < window.top())
        code |= BOTTOM;
    else if (y > window.bottom())
        code |= TOP;
    return code;
}

enum class Edge {
    Left,
    Right,
    Bottom,
    Top
};

bool isInside(const QPointF &point, Edge edge, const QRectF &window)
{
    switch (edge) {
    case Edge::Left:
        return point.x() >= window.left();
    case Edge::Right:
        return point.x() <= window.right();
    case Edge::Bottom:
        return point.y() >= window.top();
    case Edge::Top:
        return point.y() <= window.bottom();
    }
    return false;
}

QPointF intersect(const QPointF &s, const QPointF &e, Edge edge, const QRectF &window)
{
    const double dx = e.x() - s.x();
    const double dy = e.y() - s.y();

    if (edge == Edge::Left || edge == Edge::Right) {
        const double xEdge = edge == Edge::Left ? window.left() : window.right();
        if (isNearZero(dx))
            return QPointF(xEdge, s.y());
        const double t = (xEdge - s.x()) / dx;
        return QPointF(xEdge, s.y() + t * dy);
    }

    const double yEdge = edge == Edge::Bottom ? window.top() : window.bottom();
    if (isNearZero(dy))
        return QPointF(s.x(), yEdge);
    const double t = (yEdge - s.y()) / dy;
    return QPointF(s.x() + t * dx, yEdge);
}

} // namespace

bool clipPoint(const QPointF &point, const QRectF &window)
{
    return point.x() >= window.left() && point.x() <= window.right()
        && point.y() >= window.top() && point.y() <= window.bottom();
}

bool cohenSutherland(const QLineF &line, const QRectF &window, QLineF *clipped)
{
    double x1 = line.x1(), y1 = line.y1();
    double x2 = line.x2(), y2 = line.y2();

    int code1 = computeOutCode(x1, y1, window);
    int code2 = computeOutCode(x2, y2, window);

    for (;;) {
        if (!(code1 | code2)) {
            if (clipped)
                *clipped = QLineF(x1, y1, x2, y2);
            return true;
        }
        if (code1 & code2)
            return false;

        const int codeOut = code1 ? code1 : code2;
        const double dx = x2 - x1;
        const double dy = y2 - y1;
        double x = 0.0;
        double y = 0.0;

        if (codeOut & TOP) {
            y = window.bottom();
            x = isNearZero(dy) ? x1 : x1 + dx * (y - y1) / dy;
        } else if (codeOut & BOTTOM) {
            y = window.top();
            x = isNearZero(dy) ? x1 : x1 + dx * (y - y1) / dy;
        } else if (codeOut & RIGHT) {
            x = window.right();
            y = isNearZero(dx) ? y1 : y1 + dy * (x - x1) / dx;
        } else {
            x = window.left();
            y = isNearZero(dx) ? y1 : y1 + dy * (x - x1) / dx;
        }

        if (codeOut == code1) {
            x1 = x;
            y1 = y;
            code1 = computeOutCode(x1, y1, window);
        } else {
            x2 = x;
            y2 = y;
            code2 = computeOutCode(x2, y2, window);
        }
    }
}

bool liangBarsky(const QLineF &line, const QRectF &window, QLineF *clipped)
{
    const double x1 = line.x1(), y1 = line.y1();
    const double dx = line.x2() - x1;
    const double dy = line.y2() - y1;

    const double p[4] = { -dx, dx, -dy, dy };
    const double q[4] = { x1 - window.left(), window.right() - x1,
                          y1 - window.top(), window.bottom() - y1 };

    double u1 = 0.0;
    double u2 = 1.0;

    for (int i = 0; i < 4; ++i) {
        if (isNearZero(p[i])) {
            // Parallel to this edge: reject when outside of it.
            if (q[i] < 0.0)
                return false;
            continue;
        }
        const double r = q[i] / p[i];
        if (p[i] < 0.0)
            u1 = qMax(u1, r);
        else
            u2 = qMin(u2, r);
    }

    if (u1 > u2)
        return false;

    if (clipped)
        *clipped = QLineF(x1 + u1 * dx, y1 + u1 * dy, x1 + u2 * dx, y1 + u2 * dy);
    return true;
}

bool clipLine(const QLineF &line, const QRectF &window, LineClipper clipper, QLineF *clipped)
{
    switch (clipper) {
    case LineClipper::LiangBarsky:
        return liangBarsky(line, window, clipped);
    case LineClipper::CohenSutherland:
        break;
    }
    return cohenSutherland(line, window, clipped);
}

QVector<QPointF> sutherlandHodgman(const QVector<QPointF> &polygon, const QRectF &window)
{
    if (polygon.size() < 3)
        return QVector<QPointF>();

    QVector<QPointF> output = polygon;
    const Edge edges[] = { Edge::Left, Edge::Right, Edge::Bottom, Edge::Top };

    for (Edge edge : edges) {
        if (output.isEmpty())
            break;

        const QVector<QPointF> input = output;
        output.clear();

        QPointF s = input.last();
        for (const QPointF &e : input) {
            const bool eInside = isInside(e, edge, window);
            const bool sInside = isInside(s, edge, window);
            if (eInside) {
                if (!sInside)
                    output << intersect(s, e, edge, window);
                output << e;
            } else if (sInside) {
                output << intersect(s, e, edge, window);
            }
            s = e;
        }
    }

    if (output.size() < 3)
        return QVector<QPointF>();
    return output;
}

QVector<QVector<QPointF>> clipPolyline(const QVector<QPointF> &polyline, const QRectF &window,
                                       LineClipper clipper)
{
    QVector<QVector<QPointF>> runs;
    QVector<QPointF> current;

    for (int i = 0; i + 1 < polyline.size(); ++i) {
        QLineF piece;
        if (!clipLine(QLineF(polyline[i], polyline[i + 1]), window, clipper, &piece)
            || fuzzyEqual(piece.p1(), piece.p2())) {
            if (current.size() >= 2)
                runs << current;
            current.clear();
            continue;
        }

        if (!current.isEmpty() && fuzzyEqual(current.last(), piece.p1())) {
            current << piece.p2();
        } else {
            if (current.size() >= 2)
                runs << current;
            current.clear();
            current << piece.p1() << piece.p2();
        }
    }

    if (current.size() >= 2)
        runs << current;
    return runs;
}

QString clipperName(LineClipper clipper)
{
    switch (clipper) {
    case LineClipper::LiangBarsky:
        return QStringLiteral("Liang-Barsky");
    case LineClipper::CohenSutherland:
        break;
    }
    return QStringLiteral("Cohen-Sutherland");
}

} // namespace Clipping
