#include "editorlogging.h"

Q_LOGGING_CATEGORY(lcApp, "graphicseditor.app", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScene, "graphicseditor.scene", QtInfoMsg)
Q_LOGGING_CATEGORY(lcIo, "graphicseditor.io", QtInfoMsg)
Q_LOGGING_CATEGORY(lcLauncher, "graphicseditor.launcher", QtInfoMsg)

void installEditorLogging()
{
    qSetMessagePattern("[%{time hh:mm:ss.zzz}] %{if-category}%{category}: %{endif}"
                       "%{if-warning}warning: %{endif}%{if-critical}error: %{endif}%{message}");

    if (qEnvironmentVariableIsSet("GRAPHICS_EDITOR_DEBUG")) {
        QLoggingCategory::setFilterRules("graphicseditor.*.debug=true");
    }
}
