#ifndef EDITORLOGGING_H
#define EDITORLOGGING_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcApp)
Q_DECLARE_LOGGING_CATEGORY(lcScene)
Q_DECLARE_LOGGING_CATEGORY(lcIo)
Q_DECLARE_LOGGING_CATEGORY(lcLauncher)

// Installs the message pattern shared by the editor and the launcher.
// Debug output of the graphicseditor.* categories is only enabled when
// GRAPHICS_EDITOR_DEBUG is set.
void installEditorLogging();

#endif // EDITORLOGGING_H
