#ifndef EDITORSTATE_H
#define EDITORSTATE_H

#include "camera.h"
#include "clipping.h"

#include <QColor>
#include <QObject>
#include <QRectF>

class EditorState : public QObject
{
    Q_OBJECT

public:
    enum class DrawingMode {
        Point,
        Line,
        Polygon,
        Bezier,
        BSpline,
        Select,
        Pan
    };
    Q_ENUM(DrawingMode)

    static QRectF defaultClipRect() { return QRectF(-500.0, -400.0, 1000.0, 800.0); }
    static QString modeName(DrawingMode mode);

    explicit EditorState(QObject *parent = nullptr);

    DrawingMode drawingMode() const { return m_drawingMode; }
    QColor drawColor() const { return m_drawColor; }
    QRectF clipRect() const { return m_clipRect; }
    Clipping::LineClipper lineClipper() const { return m_lineClipper; }
    bool hasUnsavedChanges() const { return m_unsavedChanges; }
    QString currentFilePath() const { return m_currentFilePath; }
    Camera camera() const { return m_camera; }

public slots:
    void setDrawingMode(EditorState::DrawingMode mode);
    void setDrawColor(const QColor &color);
    // The rectangle is normalized, an empty one is rejected.
    void setClipRect(const QRectF &rect);
    void setLineClipper(Clipping::LineClipper clipper);
    void setCamera(const Camera &camera);
    void setCurrentFilePath(const QString &path);
    void markModified();
    void markSaved();

signals:
    void drawingModeChanged(EditorState::DrawingMode mode);
    void drawColorChanged(const QColor &color);
    void clipRectChanged(const QRectF &rect);
    void lineClipperChanged(Clipping::LineClipper clipper);
    void cameraChanged();
    void currentFilePathChanged(const QString &path);
    void unsavedChangesChanged(bool unsaved);

private:
    DrawingMode m_drawingMode;
    QColor m_drawColor;
    QRectF m_clipRect;
    Clipping::LineClipper m_lineClipper;
    bool m_unsavedChanges;
    QString m_currentFilePath;
    Camera m_camera;
};

#endif // EDITORSTATE_H
