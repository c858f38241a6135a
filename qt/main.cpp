#include "editorlogging.h"
#include "graphicseditor.h"

#include <QApplication>

int main(int argc, char *argv[])
{
    QApplication a(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("GraphicsEditor"));
    QCoreApplication::setApplicationName(QStringLiteral("graphics-editor"));
    installEditorLogging();

    // An optional OBJ file to open is passed as the first argument.
    GraphicsEditor w(nullptr, a.arguments().length() > 1 ? a.arguments()[1] : "");
    w.show();

    return a.exec();
}
