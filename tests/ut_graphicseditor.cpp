#include "graphicseditor.h"
#include "scenecontroller.h"
#include "scenepoint.h"
#include "testbase.h"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QStandardPaths>
#include <QtCore/QTemporaryDir>
#include <QtCore/QTimer>
#include <QtWidgets/QApplication>
#include <QtWidgets/QMessageBox>

namespace Tests {

class UtGraphicsEditor : public TestBase
{
    Q_OBJECT

private slots:
    void initTestCase();

    void testInitialTitle();
    void testModifiedTitle();
    void testOpenAndSave();
    void testOpenMissingFile();
    void testWarningReport();
    void testWarningReportCapped();

private:
    static void dismissMessageBoxLater(int attempts = 50);
};

} // namespace Tests

using namespace Tests;

/*
 * \class Tests::UtGraphicsEditor
 */

void UtGraphicsEditor::initTestCase()
{
    // Keep the editor's QSettings away from the user's configuration.
    QStandardPaths::setTestModeEnabled(true);
}

void UtGraphicsEditor::dismissMessageBoxLater(int attempts)
{
    QTimer::singleShot(20, [attempts]() {
        for (QWidget *widget : QApplication::topLevelWidgets()) {
            QMessageBox *box = qobject_cast<QMessageBox *>(widget);
            if (box && box->isVisible()) {
                box->done(0);
                return;
            }
        }
        if (attempts > 1)
            dismissMessageBoxLater(attempts - 1);
    });
}

void UtGraphicsEditor::testInitialTitle()
{
    GraphicsEditor editor;
    QCOMPARE(editor.windowTitle(), QString("Graphics Editor - New scene"));
    QVERIFY(!editor.editorState()->hasUnsavedChanges());
    QVERIFY(editor.sceneController()->objects().isEmpty());
}

void UtGraphicsEditor::testModifiedTitle()
{
    GraphicsEditor editor;
    editor.sceneController()->addObject(GraphicsObjectPtr(new ScenePoint(QPointF(5.0, 5.0))));

    QVERIFY(editor.editorState()->hasUnsavedChanges());
    QCOMPARE(editor.windowTitle(), QString("Graphics Editor - New scene *"));
}

void UtGraphicsEditor::testOpenAndSave()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QFile file(dir.filePath("scene.obj"));
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write("v 0 0 0\nv 10 10 0\nl 1 2\n");
    file.close();

    GraphicsEditor editor;
    QVERIFY(editor.openFile(file.fileName()));
    QCOMPARE(editor.sceneController()->objects().size(), 1);
    QCOMPARE(editor.windowTitle(), QString("Graphics Editor - scene.obj"));
    QCOMPARE(editor.editorState()->currentFilePath(), QFileInfo(file.fileName()).absoluteFilePath());
    QVERIFY(!editor.editorState()->hasUnsavedChanges());

    editor.sceneController()->addObject(GraphicsObjectPtr(new ScenePoint(QPointF(1.0, 2.0))));
    QCOMPARE(editor.windowTitle(), QString("Graphics Editor - scene.obj *"));

    QVERIFY(editor.saveFile(dir.filePath("out.obj")));
    QVERIFY(!editor.editorState()->hasUnsavedChanges());
    QVERIFY(editor.editorState()->currentFilePath().endsWith("out.obj"));
    QCOMPARE(editor.windowTitle(), QString("Graphics Editor - out.obj"));
    QVERIFY(QFile::exists(dir.filePath("out.obj")));

    // The saved scene reopens with both objects.
    GraphicsEditor reopened;
    QVERIFY(reopened.openFile(dir.filePath("out.obj")));
    QCOMPARE(reopened.sceneController()->objects().size(), 2);
}

void UtGraphicsEditor::testOpenMissingFile()
{
    GraphicsEditor editor;
    editor.sceneController()->addObject(GraphicsObjectPtr(new ScenePoint(QPointF(5.0, 5.0))));

    dismissMessageBoxLater();
    QVERIFY(!editor.openFile(QDir::temp().filePath("ut_graphicseditor-missing.obj")));

    // The current scene is left alone.
    QCOMPARE(editor.sceneController()->objects().size(), 1);
    QVERIFY(editor.editorState()->currentFilePath().isEmpty());
    QVERIFY(editor.editorState()->hasUnsavedChanges());
}

void UtGraphicsEditor::testWarningReport()
{
    const QStringList warnings = QStringList() << "first" << "second" << "third";
    const QString report = GraphicsEditor::warningReport("Loaded 2 object(s).", warnings);

    QCOMPARE(report, QString("Loaded 2 object(s).\n\nWarnings:\n- first\n- second\n- third"));
}

void UtGraphicsEditor::testWarningReportCapped()
{
    QStringList warnings;
    for (int i = 1; i <= 20; ++i)
        warnings << QString("line %1 skipped").arg(i);

    const QStringList lines = GraphicsEditor::warningReport("summary", warnings).split('\n');
    QStringList listed;
    for (const QString &line : lines) {
        if (line.startsWith("- "))
            listed << line;
    }

    QCOMPARE(listed.size(), GraphicsEditor::MAX_WARNINGS_SHOWN + 1);
    QCOMPARE(listed.first(), QString("- line 1 skipped"));
    QCOMPARE(listed.at(GraphicsEditor::MAX_WARNINGS_SHOWN - 1), QString("- line 15 skipped"));
    QCOMPARE(listed.last(), QString("- ... (5 more warnings)"));
}

QTEST_MAIN(UtGraphicsEditor)

#include "ut_graphicseditor.moc"
