#include "launcher.h"
#include "testbase.h"

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QScopedPointer>
#include <QtCore/QTemporaryDir>

namespace Tests {

class UtLauncher : public TestBase
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testPrependSearchPath_data();
    void testPrependSearchPath();
    void testDefaults();
    void testEditorEnvironment();
    void testFindEditorPreference();
    void testEditorNotFound();
    void testExitCode();
    void testEnvironmentAndDirectory();

private:
    bool writeScript(const QString &name, const QByteArray &body) const;

private:
    QString m_savedCurrentPath;
    // Created next to the test binary, /tmp may be mounted noexec.
    QScopedPointer<QTemporaryDir> m_dir;
};

} // namespace Tests

using namespace Tests;

/*
 * \class Tests::UtLauncher
 */

void UtLauncher::init()
{
    m_savedCurrentPath = QDir::currentPath();
    m_dir.reset(new QTemporaryDir(QCoreApplication::applicationDirPath() + "/ut_launcher-XXXXXX"));
    QVERIFY(m_dir->isValid());
}

void UtLauncher::cleanup()
{
    QDir::setCurrent(m_savedCurrentPath);
    m_dir.reset();
}

bool UtLauncher::writeScript(const QString &name, const QByteArray &body) const
{
    QFile file(m_dir->filePath(name));
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    file.write("#!/bin/sh\n");
    file.write(body);
    file.close();
    return file.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
}

void UtLauncher::testPrependSearchPath_data()
{
    QTest::addColumn<QString>("dir");
    QTest::addColumn<QString>("current");
    QTest::addColumn<QString>("expected");

    QTest::newRow("unset") << "/opt/editor" << QString() << "/opt/editor";
    QTest::newRow("one entry") << "/opt/editor" << "/usr/lib" << "/opt/editor:/usr/lib";
    QTest::newRow("two entries") << "/opt/editor" << "/a:/b" << "/opt/editor:/a:/b";
}

void UtLauncher::testPrependSearchPath()
{
    QFETCH(QString, dir);
    QFETCH(QString, current);
    QFETCH(QString, expected);

    QCOMPARE(Launcher::prependSearchPath(dir, current), expected);
}

void UtLauncher::testDefaults()
{
    const Launcher launcher = Launcher::fromApplication();
    QCOMPARE(launcher.applicationDir(), QDir(QCoreApplication::applicationDirPath()).absolutePath());
    QCOMPARE(launcher.candidates(), QStringList() << "graphics-editor" << "graphics-editor-bin");

    const Launcher relative(".");
    QVERIFY(QDir::isAbsolutePath(relative.applicationDir()));
}

void UtLauncher::testEditorEnvironment()
{
    const Launcher launcher(m_dir->path());
    const QString existing = QProcessEnvironment::systemEnvironment().value("LD_LIBRARY_PATH");

    const QProcessEnvironment environment = launcher.editorEnvironment();
    QCOMPARE(environment.value("LD_LIBRARY_PATH"),
             Launcher::prependSearchPath(launcher.applicationDir(), existing));
    QCOMPARE(environment.value("PATH"), QProcessEnvironment::systemEnvironment().value("PATH"));
}

void UtLauncher::testFindEditorPreference()
{
    Launcher launcher(m_dir->path());
    launcher.setCandidates(QStringList() << "ut-launcher-preferred" << "ut-launcher-fallback");
    QVERIFY(launcher.findEditor().isEmpty());

    QVERIFY(writeScript("ut-launcher-fallback", "exit 0\n"));
    QCOMPARE(launcher.findEditor(), QDir(launcher.applicationDir()).filePath("ut-launcher-fallback"));

    QVERIFY(writeScript("ut-launcher-preferred", "exit 0\n"));
    QCOMPARE(launcher.findEditor(), QDir(launcher.applicationDir()).filePath("ut-launcher-preferred"));

    // Not executable, so not a candidate.
    QVERIFY(QFile::setPermissions(m_dir->filePath("ut-launcher-preferred"), QFile::ReadOwner | QFile::WriteOwner));
    QCOMPARE(launcher.findEditor(), QDir(launcher.applicationDir()).filePath("ut-launcher-fallback"));
}

void UtLauncher::testEditorNotFound()
{
    Launcher launcher(m_dir->path());
    launcher.setCandidates(QStringList() << "ut-launcher-missing-editor");
    QCOMPARE(launcher.run(), 1);

    // The launcher still switched into its directory before looking.
    QCOMPARE(QFileInfo(QDir::currentPath()).canonicalFilePath(), QFileInfo(m_dir->path()).canonicalFilePath());

    const Launcher nowhere(m_dir->filePath("does-not-exist"));
    QCOMPARE(nowhere.run(), 1);
}

void UtLauncher::testExitCode()
{
    QVERIFY(writeScript("ut-launcher-editor", "exit 3\n"));

    Launcher launcher(m_dir->path());
    launcher.setCandidates(QStringList() << "ut-launcher-editor");
    QCOMPARE(launcher.run(), 3);
}

void UtLauncher::testEnvironmentAndDirectory()
{
    QVERIFY(writeScript("ut-launcher-editor",
                        "echo \"$LD_LIBRARY_PATH\" > launched.txt\n"
                        "pwd -P >> launched.txt\n"));

    Launcher launcher(m_dir->path());
    launcher.setCandidates(QStringList() << "ut-launcher-editor");
    QCOMPARE(launcher.run(), 0);

    QFile output(m_dir->filePath("launched.txt"));
    QVERIFY(output.open(QIODevice::ReadOnly | QIODevice::Text));
    const QStringList lines = QString::fromLocal8Bit(output.readAll()).split('\n', QString::SkipEmptyParts);
    QCOMPARE(lines.size(), 2);
    QVERIFY2(lines[0].startsWith(launcher.applicationDir()), qPrintable(lines[0]));
    QCOMPARE(lines[1], QFileInfo(m_dir->path()).canonicalFilePath());
}

QTEST_MAIN(UtLauncher)

#include "ut_launcher.moc"
