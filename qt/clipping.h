#ifndef CLIPPING_H
#define CLIPPING_H

#include <QLineF>
#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QVector>

// Clipping against an axis aligned window. The window is expected to be
// normalized: left() is xmin, right() is xmax, top() is ymin, bottom() is ymax.
namespace Clipping {
Q_NAMESPACE

enum class LineClipper {
    CohenSutherland,
    LiangBarsky
};
Q_ENUM_NS(LineClipper)

bool clipPoint(const QPointF &point, const QRectF &window);

bool cohenSutherland(const QLineF &line, const QRectF &window, QLineF *clipped);
bool liangBarsky(const QLineF &line, const QRectF &window, QLineF *clipped);
bool clipLine(const QLineF &line, const QRectF &window, LineClipper clipper, QLineF *clipped);

// Returns the clipped vertex list, or an empty list when fewer than three
// vertices survive.
QVector<QPointF> sutherlandHodgman(const QVector<QPointF> &polygon, const QRectF &window);

// Clips an open polyline segment by segment. Connected visible pieces are
// merged, so every returned run has at least two points.
QVector<QVector<QPointF>> clipPolyline(const QVector<QPointF> &polyline, const QRectF &window,
                                       LineClipper clipper);

QString clipperName(LineClipper clipper);

} // namespace Clipping

#endif // CLIPPING_H
