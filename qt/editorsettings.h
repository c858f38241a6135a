#ifndef EDITORSETTINGS_H
#define EDITORSETTINGS_H

#include <QByteArray>
#include <QScopedPointer>
#include <QSettings>

class EditorState;

// Persists the editor preferences between sessions.
class EditorSettings
{
public:
    // Uses the application wide settings location.
    EditorSettings();
    // Uses an explicit INI file.
    explicit EditorSettings(const QString &fileName);

    void restore(EditorState *state) const;
    void store(const EditorState &state);

    QString lastDirectory() const;
    void setLastDirectory(const QString &directory);

    QByteArray windowGeometry() const;
    QByteArray windowState() const;
    void setWindowLayout(const QByteArray &geometry, const QByteArray &state);

    void sync() { m_settings->sync(); }

private:
    QScopedPointer<QSettings> m_settings;
};

#endif // EDITORSETTINGS_H
