#ifndef OBJFILE_H
#define OBJFILE_H

#include "graphicsobject.h"
#include "wireframe3d.h"

#include <QHash>
#include <QStringList>

typedef QHash<QString, QColor> MaterialMap;

// Wavefront OBJ/MTL support. The parsing and generating functions work on
// lines of text, the load/save functions add the file handling around them.
// Problems inside a file are reported as warnings and never abort a load.
namespace ObjFile {

const int CURVE_SAVE_SAMPLES = 20;

QColor defaultMaterialColor();

// Name of the first mtllib statement, later ones are reported as warnings.
QString findMaterialLibrary(const QStringList &objLines, QStringList *warnings);

MaterialMap parseMtl(const QStringList &mtlLines, QStringList *warnings,
                     const QString &sourceName = QString());

QVector<GraphicsObjectPtr> parseObj(const QStringList &objLines, const MaterialMap &materials,
                                    QStringList *warnings,
                                    const QColor &defaultColor = QColor(Qt::black));

// Reads every l and f statement as edges of a single wireframe.
QSharedPointer<Wireframe3D> parseWireframe(const QStringList &objLines, const QString &fallbackName,
                                           const QColor &color, QStringList *warnings);

struct GeneratedFiles
{
    QStringList objLines;
    QStringList mtlLines; // empty when no material is needed
};

GeneratedFiles generate(const QVector<GraphicsObjectPtr> &objects, const QString &mtlFileName,
                        QStringList *warnings);

bool readLines(const QString &path, QStringList *lines, QString *errorMessage);
bool writeLines(const QString &path, const QStringList &lines, QString *errorMessage);

bool load(const QString &objPath, QVector<GraphicsObjectPtr> *objects, QStringList *warnings,
          QString *errorMessage, const QColor &defaultColor = QColor(Qt::black));
bool loadWireframe(const QString &objPath, const QColor &color,
                   QSharedPointer<Wireframe3D> *wireframe, QStringList *warnings,
                   QString *errorMessage);

// basePath may carry the .obj suffix, it is replaced by .obj and .mtl.
bool save(const QString &basePath, const QVector<GraphicsObjectPtr> &objects,
          QStringList *warnings, QString *errorMessage, QString *writtenObjPath = nullptr);

} // namespace ObjFile

#endif // OBJFILE_H
