#include "launcher.h"
#include "editorlogging.h"

#include <QCoreApplication>
#include <QDir>
#include <QProcess>
#include <QStandardPaths>
#include <QTextStream>

namespace {
const char *SEARCH_PATH_VARIABLE = "LD_LIBRARY_PATH";
}

Launcher::Launcher(const QString &applicationDir)
    : m_applicationDir(QDir(applicationDir).absolutePath())
    , m_candidates(QStringList() << QStringLiteral("graphics-editor") << QStringLiteral("graphics-editor-bin"))
{
}

Launcher Launcher::fromApplication()
{
    return Launcher(QCoreApplication::applicationDirPath());
}

void Launcher::setCandidates(const QStringList &candidates)
{
    m_candidates = candidates;
}

QString Launcher::prependSearchPath(const QString &dir, const QString &current)
{
    if (current.isEmpty())
        return dir;
    return dir + QLatin1Char(':') + current;
}

QProcessEnvironment Launcher::editorEnvironment() const
{
    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QLatin1String(SEARCH_PATH_VARIABLE),
                       prependSearchPath(m_applicationDir,
                                         environment.value(QLatin1String(SEARCH_PATH_VARIABLE))));
    return environment;
}

QString Launcher::findEditor() const
{
    for (const QString &name : m_candidates) {
        QString path = QStandardPaths::findExecutable(name, QStringList() << m_applicationDir);
        if (path.isEmpty())
            path = QStandardPaths::findExecutable(name);
        if (!path.isEmpty())
            return path;
    }
    return QString();
}

int Launcher::run() const
{
    const QProcessEnvironment environment = editorEnvironment();

    if (!QDir::setCurrent(m_applicationDir)) {
        QTextStream(stderr) << "Error: cannot change directory to " << m_applicationDir << "\n";
        return 1;
    }

    qCInfo(lcLauncher).noquote() << "Running graphics editor from:" << QDir::currentPath();
    qCInfo(lcLauncher).noquote() << "LD_LIBRARY_PATH set to:"
                                 << environment.value(QLatin1String(SEARCH_PATH_VARIABLE));

    const QString editor = findEditor();
    if (editor.isEmpty()) {
        QTextStream(stderr) << "Error: graphics-editor executable not found in " << m_applicationDir
                            << " or PATH.\n";
        return 1;
    }
    qCDebug(lcLauncher) << "Starting" << editor;

    QProcess process;
    process.setProcessEnvironment(environment);
    process.setProcessChannelMode(QProcess::ForwardedChannels);
    process.setInputChannelMode(QProcess::ForwardedInputChannel);
    process.setWorkingDirectory(m_applicationDir);
    process.start(editor, QStringList());

    if (!process.waitForStarted(-1)) {
        qCCritical(lcLauncher).noquote() << "Cannot start" << editor << ":" << process.errorString();
        return 1;
    }
    process.waitForFinished(-1);

    if (process.exitStatus() == QProcess::CrashExit) {
        qCCritical(lcLauncher).noquote() << editor << "crashed";
        return 1;
    }
    return process.exitCode();
}
