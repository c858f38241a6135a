#include "graphicseditor.h"
#include "./ui_graphicseditor.h"
#include "cameradialog.h"
#include "coordinateinputdialog.h"
#include "drawingcontroller.h"
#include "editorlogging.h"
#include "editorsettings.h"
#include "objfile.h"
#include "scenecontroller.h"
#include "transformationcontroller.h"
#include "transformationdialog.h"

#include <QActionGroup>
#include <QCloseEvent>
#include <QColorDialog>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QGraphicsRectItem>
#include <QGraphicsScene>
#include <QIcon>
#include <QLabel>
#include <QMessageBox>
#include <QPen>
#include <QPixmap>
#include <QSignalBlocker>
#include <QSlider>
#include <QTimer>

namespace {
const qreal SCENE_EXTENT = 20000.0;
}

const int GraphicsEditor::MAX_WARNINGS_SHOWN;

GraphicsEditor::GraphicsEditor(QWidget *parent, QString fileToOpen)
    : QMainWindow(parent)
    , ui(new Ui::GraphicsEditor)
    , m_state(new EditorState(this))
    , m_scene(new QGraphicsScene(this))
    , m_settings(new EditorSettings())
{
    ui->setupUi(this);

    m_scene->setSceneRect(-SCENE_EXTENT / 2, -SCENE_EXTENT / 2, SCENE_EXTENT, SCENE_EXTENT);
    ui->graphicsView->setScene(m_scene);

    m_sceneController = new SceneController(m_scene, m_state, this);
    m_drawingController = new DrawingController(m_scene, m_state, this);
    m_transformationController = new TransformationController(m_sceneController, this);

    QPen clipPen(Qt::blue, 1, Qt::DashLine);
    clipPen.setCosmetic(true);
    m_clipRectItem = new QGraphicsRectItem(m_state->clipRect());
    m_clipRectItem->setPen(clipPen);
    m_clipRectItem->setBrush(Qt::NoBrush);
    m_clipRectItem->setZValue(-1);
    m_scene->addItem(m_clipRectItem);

    // mode tools
    m_modeGroup = new QActionGroup(this);
    const QList<QPair<QAction *, EditorState::DrawingMode>> modeActions = {
        {ui->actionModeSelect, EditorState::DrawingMode::Select},
        {ui->actionModePan, EditorState::DrawingMode::Pan},
        {ui->actionModePoint, EditorState::DrawingMode::Point},
        {ui->actionModeLine, EditorState::DrawingMode::Line},
        {ui->actionModePolygon, EditorState::DrawingMode::Polygon},
        {ui->actionModeBezier, EditorState::DrawingMode::Bezier},
        {ui->actionModeBSpline, EditorState::DrawingMode::BSpline},
    };
    for (const auto &entry : modeActions) {
        entry.first->setData(int(entry.second));
        m_modeGroup->addAction(entry.first);
    }
    connect(m_modeGroup, &QActionGroup::triggered, this, &GraphicsEditor::modeActionTriggered);

    m_clipperGroup = new QActionGroup(this);
    m_clipperGroup->addAction(ui->actionCohenSutherland);
    m_clipperGroup->addAction(ui->actionLiangBarsky);

    // status bar
    m_modeLabel = new QLabel(this);
    m_cursorLabel = new QLabel(tr("X: -  Y: -"), this);
    m_cursorLabel->setMinimumWidth(180);
    m_rotationLabel = new QLabel(this);
    m_zoomLabel = new QLabel(this);
    m_zoomLabel->setMinimumWidth(90);
    m_zoomSlider = new QSlider(Qt::Horizontal, this);
    m_zoomSlider->setRange(0, GraphicsView::ZOOM_SLIDER_MAX);
    m_zoomSlider->setFixedWidth(150);
    m_zoomSlider->setValue(GraphicsView::zoomToSliderValue(1.0));
    statusBar()->addPermanentWidget(m_modeLabel);
    statusBar()->addPermanentWidget(m_cursorLabel);
    statusBar()->addPermanentWidget(m_rotationLabel);
    statusBar()->addPermanentWidget(m_zoomSlider);
    statusBar()->addPermanentWidget(m_zoomLabel);

    connect(m_zoomSlider, &QSlider::valueChanged, this, [this](int value) {
        ui->graphicsView->setZoom(GraphicsView::sliderValueToZoom(value));
    });

    // view -> controllers
    connect(ui->graphicsView, &GraphicsView::sceneLeftClicked, m_drawingController,
            &DrawingController::handleLeftClick);
    connect(ui->graphicsView, &GraphicsView::sceneRightClicked, m_drawingController,
            &DrawingController::handleRightClick);
    connect(ui->graphicsView, &GraphicsView::sceneMouseMoved, m_drawingController,
            &DrawingController::handleMouseMove);
    connect(ui->graphicsView, &GraphicsView::sceneMouseMoved, this, &GraphicsEditor::updateCursorLabel);
    connect(ui->graphicsView, &GraphicsView::zoomChanged, this, &GraphicsEditor::updateZoomWidgets);
    connect(ui->graphicsView, &GraphicsView::rotationChanged, this, &GraphicsEditor::updateRotationLabel);
    connect(ui->graphicsView, &GraphicsView::deleteRequested, this,
            &GraphicsEditor::on_actionDelete_triggered);

    // controllers -> model and window
    connect(m_drawingController, &DrawingController::objectReady, m_sceneController,
            &SceneController::addObject);
    connect(m_drawingController, &DrawingController::statusMessage, this,
            &GraphicsEditor::showStatusMessage);
    connect(m_drawingController, &DrawingController::polygonPropertiesRequested, this,
            &GraphicsEditor::askPolygonProperties);
    connect(m_drawingController, &DrawingController::drawingRejected, this,
            &GraphicsEditor::showDrawingRejected);
    connect(m_transformationController, &TransformationController::statusMessage, this,
            &GraphicsEditor::showStatusMessage);
    connect(m_transformationController, &TransformationController::transformationFailed, this,
            [this](const QString &text) { QMessageBox::warning(this, tr("Transformation failed"), text); });
    connect(m_sceneController, &SceneController::sceneModified, m_state, &EditorState::markModified);

    // state -> window
    connect(m_state, &EditorState::drawingModeChanged, ui->graphicsView, &GraphicsView::setDrawingMode);
    connect(m_state, &EditorState::drawingModeChanged, this, &GraphicsEditor::updateModeWidgets);
    connect(m_state, &EditorState::drawColorChanged, this, &GraphicsEditor::updateColorAction);
    connect(m_state, &EditorState::clipRectChanged, this, &GraphicsEditor::updateClipRectItem);
    connect(m_state, &EditorState::lineClipperChanged, this, [this](Clipping::LineClipper clipper) {
        ui->actionCohenSutherland->setChecked(clipper == Clipping::LineClipper::CohenSutherland);
        ui->actionLiangBarsky->setChecked(clipper == Clipping::LineClipper::LiangBarsky);
        showStatusMessage(tr("Line clipping: %1").arg(Clipping::clipperName(clipper)), 2000);
    });
    connect(m_state, &EditorState::cameraChanged, this, [this]() {
        QSignalBlocker blocker(ui->actionPerspective);
        ui->actionPerspective->setChecked(m_state->camera().projection == Camera::Projection::Perspective);
    });
    connect(m_state, &EditorState::currentFilePathChanged, this, &GraphicsEditor::updateWindowTitle);
    connect(m_state, &EditorState::unsavedChangesChanged, this, &GraphicsEditor::updateWindowTitle);

    m_settings->restore(m_state);
    restoreGeometry(m_settings->windowGeometry());
    restoreState(m_settings->windowState());

    ui->actionCohenSutherland->setChecked(m_state->lineClipper() == Clipping::LineClipper::CohenSutherland);
    ui->actionLiangBarsky->setChecked(m_state->lineClipper() == Clipping::LineClipper::LiangBarsky);
    ui->actionPerspective->blockSignals(true);
    ui->actionPerspective->setChecked(m_state->camera().projection == Camera::Projection::Perspective);
    ui->actionPerspective->blockSignals(false);
    updateClipRectItem(m_state->clipRect());
    updateColorAction(m_state->drawColor());
    updateModeWidgets(m_state->drawingMode());
    updateZoomWidgets(ui->graphicsView->zoomFactor());
    updateRotationLabel(ui->graphicsView->rotationAngle());
    updateWindowTitle();

    ui->graphicsView->resetView();
    showStatusMessage(tr("Ready."), 2000);

    if (!fileToOpen.isEmpty()) {
        QTimer::singleShot(0, this, [this, fileToOpen]() { openFile(fileToOpen); });
    }
}

GraphicsEditor::~GraphicsEditor()
{
    delete ui;
}

bool GraphicsEditor::openFile(const QString &path)
{
    QVector<GraphicsObjectPtr> objects;
    QStringList warnings;
    QString error;

    showStatusMessage(tr("Loading %1...").arg(QFileInfo(path).fileName()), 0);
    if (!ObjFile::load(path, &objects, &warnings, &error, m_state->drawColor())) {
        QMessageBox::critical(this, tr("Cannot open file"), error);
        showStatusMessage(tr("Loading failed."), 3000);
        return false;
    }

    clearScene();
    m_sceneController->addObjects(objects);
    m_state->setCurrentFilePath(QFileInfo(path).absoluteFilePath());
    m_state->markSaved();
    m_settings->setLastDirectory(QFileInfo(path).absolutePath());

    qCInfo(lcApp) << "Opened" << path << "with" << objects.size() << "objects";

    const QString summary = objects.isEmpty()
        ? tr("No supported geometry found in '%1'.").arg(QFileInfo(path).fileName())
        : tr("Loaded %1 object(s) from '%2'.").arg(objects.size()).arg(QFileInfo(path).fileName());
    if (!warnings.isEmpty())
        showWarnings(tr("Loaded with warnings"), summary, warnings);
    showStatusMessage(summary, 5000);
    return true;
}

bool GraphicsEditor::saveFile(const QString &path)
{
    m_drawingController->cancelDrawing();

    QStringList warnings;
    QString error;
    QString writtenPath;
    if (!ObjFile::save(path, m_sceneController->objects(), &warnings, &error, &writtenPath)) {
        QMessageBox::critical(this, tr("Cannot save file"), error);
        showStatusMessage(tr("Saving failed."), 3000);
        return false;
    }

    m_state->setCurrentFilePath(writtenPath);
    m_state->markSaved();
    m_settings->setLastDirectory(QFileInfo(writtenPath).absolutePath());

    const QString summary = tr("Scene saved as '%1'.").arg(QFileInfo(writtenPath).fileName());
    if (!warnings.isEmpty())
        showWarnings(tr("Saved with warnings"), summary, warnings);
    showStatusMessage(summary, 5000);
    return true;
}

void GraphicsEditor::closeEvent(QCloseEvent *event)
{
    m_drawingController->cancelDrawing();
    if (!maybeSave()) {
        event->ignore();
        return;
    }
    m_settings->store(*m_state);
    m_settings->setWindowLayout(saveGeometry(), saveState());
    m_settings->sync();
    event->accept();
}

void GraphicsEditor::on_actionNew_triggered()
{
    m_drawingController->cancelDrawing();
    if (!maybeSave())
        return;
    clearScene();
    ui->graphicsView->resetView();
    m_state->setCurrentFilePath(QString());
    m_state->markSaved();
    showStatusMessage(tr("New scene."), 2000);
}

void GraphicsEditor::on_actionOpen_triggered()
{
    m_drawingController->cancelDrawing();
    if (!maybeSave())
        return;
    const QString path = QFileDialog::getOpenFileName(this, tr("Open OBJ file"), dialogDirectory(),
                                                      tr("Wavefront OBJ (*.obj);;All files (*)"));
    if (path.isEmpty())
        return;
    openFile(path);
}

void GraphicsEditor::on_actionImportWireframe_triggered()
{
    m_drawingController->cancelDrawing();
    const QString path = QFileDialog::getOpenFileName(this, tr("Import 3D wireframe"), dialogDirectory(),
                                                      tr("Wavefront OBJ (*.obj);;All files (*)"));
    if (path.isEmpty())
        return;

    QSharedPointer<Wireframe3D> wireframe;
    QStringList warnings;
    QString error;
    if (!ObjFile::loadWireframe(path, m_state->drawColor(), &wireframe, &warnings, &error)) {
        QMessageBox::critical(this, tr("Cannot import wireframe"), error);
        return;
    }
    m_settings->setLastDirectory(QFileInfo(path).absolutePath());
    m_sceneController->addObject(wireframe);

    const QString summary = tr("Imported '%1' with %2 edge(s).").arg(wireframe->name()).arg(wireframe->edgeCount());
    if (!warnings.isEmpty())
        showWarnings(tr("Imported with warnings"), summary, warnings);
    showStatusMessage(summary, 5000);
}

void GraphicsEditor::on_actionSave_triggered()
{
    if (m_state->currentFilePath().isEmpty())
        saveAs();
    else
        saveFile(m_state->currentFilePath());
}

void GraphicsEditor::on_actionSaveAs_triggered()
{
    saveAs();
}

void GraphicsEditor::on_actionDelete_triggered()
{
    const int removed = m_sceneController->removeSelected();
    if (removed == 0)
        showStatusMessage(tr("Nothing selected to delete."), 2000);
    else
        showStatusMessage(tr("%1 object(s) deleted.").arg(removed), 2000);
}

void GraphicsEditor::on_actionTransform_triggered()
{
    const QVector<GraphicsObjectPtr> selected = m_sceneController->selectedObjects();
    if (selected.isEmpty()) {
        QMessageBox::warning(this, tr("Nothing selected"), tr("Select the objects to transform first."));
        return;
    }
    const bool is3D = selected.first()->is3D();
    for (const GraphicsObjectPtr &object : selected) {
        if (object->is3D() != is3D) {
            QMessageBox::warning(this, tr("Mixed selection"),
                                 tr("2D objects and 3D wireframes cannot be transformed together."));
            return;
        }
    }

    m_drawingController->cancelDrawing();
    TransformationDialog dialog(is3D, this);
    if (dialog.exec() != QDialog::Accepted)
        return;
    m_transformationController->transformObjects(selected, dialog.parameters());
}

void GraphicsEditor::on_actionAddCoordinates_triggered()
{
    m_drawingController->cancelDrawing();

    CoordinateInputDialog dialog(this);
    switch (m_state->drawingMode()) {
    case EditorState::DrawingMode::Point:
        dialog.setMode(CoordinateInputDialog::Mode::Point);
        break;
    case EditorState::DrawingMode::Line:
        dialog.setMode(CoordinateInputDialog::Mode::Line);
        break;
    case EditorState::DrawingMode::Bezier:
        dialog.setMode(CoordinateInputDialog::Mode::Bezier);
        break;
    case EditorState::DrawingMode::BSpline:
        dialog.setMode(CoordinateInputDialog::Mode::BSpline);
        break;
    default:
        dialog.setMode(CoordinateInputDialog::Mode::Polygon);
        break;
    }
    dialog.setColor(m_state->drawColor());

    if (dialog.exec() != QDialog::Accepted)
        return;
    m_sceneController->addObject(dialog.createdObject());
    showStatusMessage(tr("%1 added.").arg(dialog.createdObject()->typeName()), 2000);
}

void GraphicsEditor::on_actionResetView_triggered()
{
    ui->graphicsView->resetView();
}

void GraphicsEditor::on_actionShowClipWindow_toggled(bool checked)
{
    m_clipRectItem->setVisible(checked);
}

void GraphicsEditor::on_actionCamera_triggered()
{
    CameraDialog dialog(this);
    dialog.setCamera(m_state->camera());
    if (dialog.exec() != QDialog::Accepted)
        return;
    m_state->setCamera(dialog.camera());
}

void GraphicsEditor::on_actionPerspective_toggled(bool checked)
{
    Camera camera = m_state->camera();
    camera.projection = checked ? Camera::Projection::Perspective : Camera::Projection::Orthographic;
    m_state->setCamera(camera);
    showStatusMessage(checked ? tr("Perspective projection.") : tr("Orthographic projection."), 2000);
}

void GraphicsEditor::on_actionCohenSutherland_triggered()
{
    m_state->setLineClipper(Clipping::LineClipper::CohenSutherland);
}

void GraphicsEditor::on_actionLiangBarsky_triggered()
{
    m_state->setLineClipper(Clipping::LineClipper::LiangBarsky);
}

void GraphicsEditor::on_actionColor_triggered()
{
    const QColor color = QColorDialog::getColor(m_state->drawColor(), this, tr("Drawing color"));
    if (color.isValid())
        m_state->setDrawColor(color);
}

void GraphicsEditor::modeActionTriggered(QAction *action)
{
    m_state->setDrawingMode(EditorState::DrawingMode(action->data().toInt()));
}

void GraphicsEditor::askPolygonProperties()
{
    const QMessageBox::StandardButton type =
        QMessageBox::question(this, tr("Polygon type"),
                              tr("Draw an open polyline?\n\nYes: open polyline\nNo: closed polygon"),
                              QMessageBox::Yes | QMessageBox::No | QMessageBox::Cancel, QMessageBox::No);
    if (type == QMessageBox::Cancel) {
        m_drawingController->setPendingPolygonProperties(false, false, true);
        return;
    }

    const bool isOpen = type == QMessageBox::Yes;
    bool isFilled = false;
    if (!isOpen) {
        isFilled = QMessageBox::question(this, tr("Fill polygon"), tr("Fill the polygon?"),
                                         QMessageBox::Yes | QMessageBox::No, QMessageBox::No)
            == QMessageBox::Yes;
    }
    m_drawingController->setPendingPolygonProperties(isOpen, isFilled);
}

void GraphicsEditor::showDrawingRejected(const QString &title, const QString &text)
{
    QMessageBox::warning(this, title, text);
}

void GraphicsEditor::showStatusMessage(const QString &text, int timeout)
{
    statusBar()->showMessage(text, timeout);
}

void GraphicsEditor::updateWindowTitle()
{
    const QString path = m_state->currentFilePath();
    QString title = tr("Graphics Editor - %1").arg(path.isEmpty() ? tr("New scene") : QFileInfo(path).fileName());
    if (m_state->hasUnsavedChanges())
        title += QStringLiteral(" *");
    setWindowTitle(title);
}

void GraphicsEditor::updateModeWidgets(EditorState::DrawingMode mode)
{
    for (QAction *action : m_modeGroup->actions()) {
        if (action->data().toInt() == int(mode))
            action->setChecked(true);
    }
    m_modeLabel->setText(tr("Mode: %1").arg(EditorState::modeName(mode)));
}

void GraphicsEditor::updateZoomWidgets(double factor)
{
    QSignalBlocker blocker(m_zoomSlider);
    m_zoomSlider->setValue(GraphicsView::zoomToSliderValue(factor));
    m_zoomLabel->setText(tr("Zoom: %1%").arg(qRound(factor * 100.0)));
}

void GraphicsEditor::updateRotationLabel(double degrees)
{
    m_rotationLabel->setText(tr("Rot: %1°").arg(degrees, 0, 'f', 1));
}

void GraphicsEditor::updateCursorLabel(const QPointF &scenePos)
{
    m_cursorLabel->setText(tr("X: %1  Y: %2").arg(scenePos.x(), 0, 'f', 2).arg(scenePos.y(), 0, 'f', 2));
}

void GraphicsEditor::updateClipRectItem(const QRectF &rect)
{
    m_clipRectItem->setRect(rect.normalized());
}

void GraphicsEditor::updateColorAction(const QColor &color)
{
    QPixmap swatch(16, 16);
    swatch.fill(color);
    ui->actionColor->setIcon(QIcon(swatch));
}

bool GraphicsEditor::maybeSave()
{
    if (!m_state->hasUnsavedChanges())
        return true;

    const QMessageBox::StandardButton answer =
        QMessageBox::warning(this, tr("Unsaved changes"),
                             tr("The scene has unsaved changes. Do you want to save them?"),
                             QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel, QMessageBox::Save);
    switch (answer) {
    case QMessageBox::Save:
        return m_state->currentFilePath().isEmpty() ? saveAs() : saveFile(m_state->currentFilePath());
    case QMessageBox::Discard:
        return true;
    default:
        return false;
    }
}

bool GraphicsEditor::saveAs()
{
    m_drawingController->cancelDrawing();
    const QString current = m_state->currentFilePath();
    const QString suggestion = current.isEmpty()
        ? QDir(dialogDirectory()).filePath(QStringLiteral("scene.obj"))
        : current;
    const QString path = QFileDialog::getSaveFileName(this, tr("Save OBJ file"), suggestion,
                                                      tr("Wavefront OBJ (*.obj)"));
    if (path.isEmpty()) {
        showStatusMessage(tr("Save cancelled."), 2000);
        return false;
    }
    return saveFile(path);
}

void GraphicsEditor::clearScene()
{
    m_drawingController->cancelDrawing();
    m_scene->clearSelection();
    m_sceneController->clearScene();
}

QString GraphicsEditor::warningReport(const QString &summary, const QStringList &warnings)
{
    QString text = summary + QStringLiteral("\n\n") + tr("Warnings:");
    for (int i = 0; i < warnings.size() && i < MAX_WARNINGS_SHOWN; ++i)
        text += QStringLiteral("\n- ") + warnings[i];
    if (warnings.size() > MAX_WARNINGS_SHOWN)
        text += QStringLiteral("\n- ") + tr("... (%1 more warnings)").arg(warnings.size() - MAX_WARNINGS_SHOWN);
    return text;
}

void GraphicsEditor::showWarnings(const QString &title, const QString &summary, const QStringList &warnings)
{
    for (const QString &warning : warnings)
        qCWarning(lcIo).noquote() << warning;
    QMessageBox::warning(this, title, warningReport(summary, warnings));
}

QString GraphicsEditor::dialogDirectory() const
{
    const QString current = m_state->currentFilePath();
    if (!current.isEmpty())
        return QFileInfo(current).absolutePath();
    return m_settings->lastDirectory();
}
