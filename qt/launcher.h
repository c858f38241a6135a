#ifndef LAUNCHER_H
#define LAUNCHER_H

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

// Starts the editor binary installed next to the launcher, with the library
// search path pointing at the launcher's directory.
class Launcher
{
public:
    explicit Launcher(const QString &applicationDir);
    // Uses the directory of the running executable.
    static Launcher fromApplication();

    QString applicationDir() const { return m_applicationDir; }

    // Executable names in order of preference.
    QStringList candidates() const { return m_candidates; }
    void setCandidates(const QStringList &candidates);

    // dir, or dir:current when a search path is already set.
    static QString prependSearchPath(const QString &dir, const QString &current);

    QProcessEnvironment editorEnvironment() const;

    // Looks in the application directory first, then on PATH. Empty when no
    // candidate is found.
    QString findEditor() const;

    // Returns the editor's exit code, 1 when it could not be started or
    // crashed, or when the launcher itself failed.
    int run() const;

private:
    QString m_applicationDir;
    QStringList m_candidates;
};

#endif // LAUNCHER_H
