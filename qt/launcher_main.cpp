#include "editorlogging.h"
#include "launcher.h"

#include <QCoreApplication>

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    installEditorLogging();

    return Launcher::fromApplication().run();
}
