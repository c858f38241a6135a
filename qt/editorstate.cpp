#include "editorstate.h"
#include "editorlogging.h"

EditorState::EditorState(QObject *parent)
    : QObject(parent)
    , m_drawingMode(DrawingMode::Select)
    , m_drawColor(Qt::black)
    , m_clipRect(defaultClipRect())
    , m_lineClipper(Clipping::LineClipper::CohenSutherland)
    , m_unsavedChanges(false)
{
}

QString EditorState::modeName(DrawingMode mode)
{
    switch (mode) {
    case DrawingMode::Point:
        return tr("Point");
    case DrawingMode::Line:
        return tr("Line");
    case DrawingMode::Polygon:
        return tr("Polygon");
    case DrawingMode::Bezier:
        return tr("Bezier");
    case DrawingMode::BSpline:
        return tr("B-spline");
    case DrawingMode::Select:
        return tr("Select");
    case DrawingMode::Pan:
        return tr("Pan");
    }
    return QString();
}

void EditorState::setDrawingMode(EditorState::DrawingMode mode)
{
    if (m_drawingMode == mode)
        return;
    m_drawingMode = mode;
    qCDebug(lcApp) << "Drawing mode:" << mode;
    emit drawingModeChanged(mode);
}

void EditorState::setDrawColor(const QColor &color)
{
    if (!color.isValid() || m_drawColor == color)
        return;
    m_drawColor = color;
    emit drawColorChanged(color);
}

void EditorState::setClipRect(const QRectF &rect)
{
    const QRectF normalized = rect.normalized();
    if (normalized.isEmpty()) {
        qCWarning(lcApp) << "Ignoring empty clip rectangle" << rect;
        return;
    }
    if (m_clipRect == normalized)
        return;
    m_clipRect = normalized;
    emit clipRectChanged(normalized);
}

void EditorState::setLineClipper(Clipping::LineClipper clipper)
{
    if (m_lineClipper == clipper)
        return;
    m_lineClipper = clipper;
    qCDebug(lcApp) << "Line clipper:" << Clipping::clipperName(clipper);
    emit lineClipperChanged(clipper);
}

void EditorState::setCamera(const Camera &camera)
{
    if (m_camera == camera)
        return;
    m_camera = camera;
    emit cameraChanged();
}

void EditorState::setCurrentFilePath(const QString &path)
{
    if (m_currentFilePath == path)
        return;
    m_currentFilePath = path;
    emit currentFilePathChanged(path);
}

void EditorState::markModified()
{
    if (m_unsavedChanges)
        return;
    m_unsavedChanges = true;
    emit unsavedChangesChanged(true);
}

void EditorState::markSaved()
{
    if (!m_unsavedChanges)
        return;
    m_unsavedChanges = false;
    emit unsavedChangesChanged(false);
}
