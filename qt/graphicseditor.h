#ifndef GRAPHICSEDITOR_H
#define GRAPHICSEDITOR_H

#include "editorstate.h"
#include "graphicsobject.h"

#include <QMainWindow>
#include <QScopedPointer>

class DrawingController;
class EditorSettings;
class QActionGroup;
class QGraphicsRectItem;
class QGraphicsScene;
class QLabel;
class QSlider;
class SceneController;
class TransformationController;

QT_BEGIN_NAMESPACE
namespace Ui {
class GraphicsEditor;
}
QT_END_NAMESPACE

class GraphicsEditor : public QMainWindow
{
    Q_OBJECT

public:
    GraphicsEditor(QWidget *parent = nullptr, QString fileToOpen = "");
    ~GraphicsEditor();

    EditorState *editorState() const { return m_state; }
    SceneController *sceneController() const { return m_sceneController; }

    // Replaces the scene by the content of an OBJ file. Warnings are shown,
    // a read error is reported and leaves the scene untouched.
    bool openFile(const QString &path);
    bool saveFile(const QString &path);

    // Summary followed by at most MAX_WARNINGS_SHOWN warnings and a count of
    // the ones left out.
    static QString warningReport(const QString &summary, const QStringList &warnings);

    static const int MAX_WARNINGS_SHOWN = 15;

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void on_actionNew_triggered();
    void on_actionOpen_triggered();
    void on_actionImportWireframe_triggered();
    void on_actionSave_triggered();
    void on_actionSaveAs_triggered();
    void on_actionDelete_triggered();
    void on_actionTransform_triggered();
    void on_actionAddCoordinates_triggered();
    void on_actionResetView_triggered();
    void on_actionShowClipWindow_toggled(bool checked);
    void on_actionCamera_triggered();
    void on_actionPerspective_toggled(bool checked);
    void on_actionCohenSutherland_triggered();
    void on_actionLiangBarsky_triggered();
    void on_actionColor_triggered();

    void modeActionTriggered(QAction *action);
    void askPolygonProperties();
    void showDrawingRejected(const QString &title, const QString &text);
    void showStatusMessage(const QString &text, int timeout);

    void updateWindowTitle();
    void updateModeWidgets(EditorState::DrawingMode mode);
    void updateZoomWidgets(double factor);
    void updateRotationLabel(double degrees);
    void updateCursorLabel(const QPointF &scenePos);
    void updateClipRectItem(const QRectF &rect);
    void updateColorAction(const QColor &color);

private:
    Ui::GraphicsEditor *ui;

    bool maybeSave();
    bool saveAs();
    void clearScene();
    void showWarnings(const QString &title, const QString &summary, const QStringList &warnings);
    QString dialogDirectory() const;

    EditorState *m_state;
    QGraphicsScene *m_scene;
    SceneController *m_sceneController;
    DrawingController *m_drawingController;
    TransformationController *m_transformationController;
    QScopedPointer<EditorSettings> m_settings;

    QGraphicsRectItem *m_clipRectItem;
    QActionGroup *m_modeGroup;
    QActionGroup *m_clipperGroup;
    QSlider *m_zoomSlider;
    QLabel *m_zoomLabel;
    QLabel *m_rotationLabel;
    QLabel *m_modeLabel;
    QLabel *m_cursorLabel;
};

#endif // GRAPHICSEDITOR_H
