#ifndef GRAPHICSVIEW_H
#define GRAPHICSVIEW_H

#include "editorstate.h"

#include <QGraphicsView>
#include <QPoint>

class GraphicsView : public QGraphicsView
{
    Q_OBJECT

public:
    static constexpr double MIN_ZOOM = 0.02;
    static constexpr double MAX_ZOOM = 50.0;
    static const int ZOOM_SLIDER_MAX = 400;
    static constexpr double ROTATION_STEP = 5.0;

    explicit GraphicsView(QWidget *parent = nullptr);

    double zoomFactor() const { return m_zoom; }
    double rotationAngle() const { return m_rotation; }

    // Logarithmic mapping between the status bar slider and the zoom factor.
    static double sliderValueToZoom(int value);
    static int zoomToSliderValue(double zoom);

public slots:
    void setDrawingMode(EditorState::DrawingMode mode);
    void setZoom(double factor);
    void rotateView(double degrees);
    void resetView();

signals:
    void sceneLeftClicked(const QPointF &scenePos);
    void sceneRightClicked(const QPointF &scenePos);
    void sceneMouseMoved(const QPointF &scenePos);
    void zoomChanged(double factor);
    void rotationChanged(double degrees);
    void deleteRequested();

protected:
    void wheelEvent(QWheelEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private:
    bool isDrawingMode() const;

    EditorState::DrawingMode m_mode;
    double m_zoom;
    double m_rotation;
    bool m_middlePanning;
    QPoint m_lastPanPos;
};

#endif // GRAPHICSVIEW_H
