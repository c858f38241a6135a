#include "editorsettings.h"
#include "editorstate.h"

#include <QDir>

namespace {
const char *KEY_CLIP_RECT = "scene/clipRect";
const char *KEY_LINE_CLIPPER = "scene/lineClipper";
const char *KEY_DRAW_COLOR = "drawing/color";
const char *KEY_PROJECTION = "camera/projection";
const char *KEY_LAST_DIRECTORY = "files/lastDirectory";
const char *KEY_GEOMETRY = "window/geometry";
const char *KEY_WINDOW_STATE = "window/state";
}

EditorSettings::EditorSettings()
    : m_settings(new QSettings(QSettings::IniFormat, QSettings::UserScope,
                               QStringLiteral("GraphicsEditor"), QStringLiteral("graphics-editor")))
{
}

EditorSettings::EditorSettings(const QString &fileName)
    : m_settings(new QSettings(fileName, QSettings::IniFormat))
{
}

void EditorSettings::restore(EditorState *state) const
{
    const QRectF clipRect = m_settings->value(KEY_CLIP_RECT, EditorState::defaultClipRect()).toRectF();
    if (!clipRect.normalized().isEmpty())
        state->setClipRect(clipRect);

    const QString clipper = m_settings->value(KEY_LINE_CLIPPER).toString();
    if (clipper == QLatin1String("LiangBarsky"))
        state->setLineClipper(Clipping::LineClipper::LiangBarsky);
    else
        state->setLineClipper(Clipping::LineClipper::CohenSutherland);

    const QColor color(m_settings->value(KEY_DRAW_COLOR, QStringLiteral("#000000")).toString());
    if (color.isValid())
        state->setDrawColor(color);

    Camera camera = state->camera();
    camera.projection = m_settings->value(KEY_PROJECTION).toString() == QLatin1String("perspective")
        ? Camera::Projection::Perspective
        : Camera::Projection::Orthographic;
    state->setCamera(camera);
}

void EditorSettings::store(const EditorState &state)
{
    m_settings->setValue(KEY_CLIP_RECT, state.clipRect());
    m_settings->setValue(KEY_LINE_CLIPPER,
                         state.lineClipper() == Clipping::LineClipper::LiangBarsky
                             ? QStringLiteral("LiangBarsky")
                             : QStringLiteral("CohenSutherland"));
    m_settings->setValue(KEY_DRAW_COLOR, state.drawColor().name());
    m_settings->setValue(KEY_PROJECTION,
                         state.camera().projection == Camera::Projection::Perspective
                             ? QStringLiteral("perspective")
                             : QStringLiteral("orthographic"));
}

QString EditorSettings::lastDirectory() const
{
    return m_settings->value(KEY_LAST_DIRECTORY, QDir::homePath()).toString();
}

void EditorSettings::setLastDirectory(const QString &directory)
{
    m_settings->setValue(KEY_LAST_DIRECTORY, directory);
}

QByteArray EditorSettings::windowGeometry() const
{
    return m_settings->value(KEY_GEOMETRY).toByteArray();
}

QByteArray EditorSettings::windowState() const
{
    return m_settings->value(KEY_WINDOW_STATE).toByteArray();
}

void EditorSettings::setWindowLayout(const QByteArray &geometry, const QByteArray &state)
{
    m_settings->setValue(KEY_GEOMETRY, geometry);
    m_settings->setValue(KEY_WINDOW_STATE, state);
}
