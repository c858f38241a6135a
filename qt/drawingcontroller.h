#ifndef DRAWINGCONTROLLER_H
#define DRAWINGCONTROLLER_H

#include "editorstate.h"
#include "graphicsobject.h"

#include <QObject>
#include <QPointF>
#include <QVector>

class QGraphicsLineItem;
class QGraphicsPathItem;
class QGraphicsScene;

// Turns clicks on the canvas into new objects, showing a preview while a
// multi-click object is being built.
class DrawingController : public QObject
{
    Q_OBJECT

public:
    static const int PREVIEW_Z_VALUE = 1000;

    DrawingController(QGraphicsScene *scene, EditorState *state, QObject *parent = nullptr);

    bool isDrawing() const;
    bool isWaitingForPolygonProperties() const { return m_hasPendingPolygonPoint; }
    int pendingPointCount() const;

public slots:
    void handleLeftClick(const QPointF &scenePos);
    void handleRightClick(const QPointF &scenePos);
    void handleMouseMove(const QPointF &scenePos);
    // Answer to polygonPropertiesRequested().
    void setPendingPolygonProperties(bool isOpen, bool isFilled, bool cancelled = false);
    void cancelDrawing();

signals:
    void objectReady(const GraphicsObjectPtr &object);
    void statusMessage(const QString &text, int timeout);
    void polygonPropertiesRequested();
    // The drawing could not be committed and stays in progress.
    void drawingRejected(const QString &title, const QString &text);

private:
    void finishDrawing(bool commit);
    void resetDrawing();
    void updatePreview(const QPointF &cursor);
    void removePreview();
    void updateBezierStatus();

    QGraphicsScene *m_scene;
    EditorState *m_state;

    bool m_hasLineStart;
    QPointF m_lineStart;

    QVector<QPointF> m_polygonPoints;
    bool m_polygonOpen;
    bool m_polygonFilled;
    bool m_hasPendingPolygonPoint;
    QPointF m_pendingPolygonPoint;

    QVector<QPointF> m_curvePoints;

    QGraphicsLineItem *m_previewLine;
    QGraphicsPathItem *m_previewPath;
};

#endif // DRAWINGCONTROLLER_H
