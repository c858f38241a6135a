#include "objfile.h"
#include "beziercurve.h"
#include "bsplinecurve.h"
#include "editorlogging.h"
#include "geometry.h"
#include "sceneline.h"
#include "scenepoint.h"
#include "scenepolygon.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

namespace ObjFile {

namespace {

QStringList tokens(const QString &line)
{
    const QString simplified = line.simplified();
    if (simplified.isEmpty())
        return QStringList();
    return simplified.split(QLatin1Char(' '));
}

bool isIgnorable(const QString &line)
{
    const QString trimmed = line.trimmed();
    return trimmed.isEmpty() || trimmed.startsWith(QLatin1Char('#'));
}

void warn(QStringList *warnings, const QString &message)
{
    qCDebug(lcIo) << message;
    if (warnings)
        *warnings << message;
}

// Converts the 1-based (or negative, relative) indices of a p/l/f statement
// to 0-based ones. Invalid entries are skipped with a warning.
QVector<int> parseIndices(const QStringList &parts, int vertexCount, int lineNumber,
                          QStringList *warnings)
{
    QVector<int> indices;
    if (vertexCount == 0) {
        warn(warnings, QStringLiteral("Line %1: vertex reference before any 'v' statement.").arg(lineNumber));
        return indices;
    }

    for (const QString &part : parts) {
        const QString indexText = part.section(QLatin1Char('/'), 0, 0);
        if (indexText.isEmpty()) {
            warn(warnings, QStringLiteral("Line %1: empty vertex index ('%2').").arg(lineNumber).arg(part));
            continue;
        }

        bool ok = false;
        const int index = indexText.toInt(&ok);
        if (!ok) {
            warn(warnings, QStringLiteral("Line %1: non numeric vertex index '%2'.").arg(lineNumber).arg(indexText));
            continue;
        }

        if (index == 0) {
            warn(warnings, QStringLiteral("Line %1: invalid vertex index 0, OBJ indices are 1-based.").arg(lineNumber));
        } else if (index > 0) {
            if (index <= vertexCount)
                indices << index - 1;
            else
                warn(warnings, QStringLiteral("Line %1: index %2 out of range [1..%3].")
                                   .arg(lineNumber).arg(index).arg(vertexCount));
        } else {
            const int resolved = vertexCount + index;
            if (resolved >= 0)
                indices << resolved;
            else
                warn(warnings, QStringLiteral("Line %1: relative index %2 out of range.")
                                   .arg(lineNumber).arg(index));
        }
    }
    return indices;
}

QString materialName(const QColor &color)
{
    return QStringLiteral("mat_") + color.name(QColor::HexRgb).mid(1).toUpper();
}

QString formatNumber(double value)
{
    return QString::number(value, 'f', 6);
}

typedef QPair<qint64, qint64> VertexKey;

VertexKey vertexKey(const QPointF &point)
{
    return VertexKey(qRound64(point.x() * 1e6), qRound64(point.y() * 1e6));
}

struct ObjectDefinition
{
    QString name;
    QString material;
    QString statement;
    QVector<int> indices;
};

} // namespace

QColor defaultMaterialColor()
{
    return QColor(128, 128, 128);
}

QString findMaterialLibrary(const QStringList &objLines, QStringList *warnings)
{
    QString library;
    for (int i = 0; i < objLines.size(); ++i) {
        if (isIgnorable(objLines[i]))
            continue;
        const QStringList parts = tokens(objLines[i]);
        if (parts.first().toLower() != QLatin1String("mtllib"))
            continue;
        if (parts.size() < 2) {
            warn(warnings, QStringLiteral("Line %1: 'mtllib' without a file name.").arg(i + 1));
            continue;
        }
        const QString name = parts.mid(1).join(QLatin1Char(' '));
        if (library.isEmpty())
            library = name;
        else
            warn(warnings, QStringLiteral("Line %1: ignoring additional material library '%2'.").arg(i + 1).arg(name));
    }
    return library;
}

MaterialMap parseMtl(const QStringList &mtlLines, QStringList *warnings, const QString &sourceName)
{
    MaterialMap materials;
    QString current;
    const QString prefix = sourceName.isEmpty() ? QStringLiteral("MTL") : QStringLiteral("MTL '%1'").arg(sourceName);

    for (int i = 0; i < mtlLines.size(); ++i) {
        if (isIgnorable(mtlLines[i]))
            continue;
        const QStringList parts = tokens(mtlLines[i]);
        const QString command = parts.first().toLower();
        const int lineNumber = i + 1;

        if (command == QLatin1String("newmtl")) {
            if (parts.size() < 2) {
                warn(warnings, QStringLiteral("%1 line %2: 'newmtl' without a material name.").arg(prefix).arg(lineNumber));
                current.clear();
                continue;
            }
            current = parts.mid(1).join(QLatin1Char(' '));
            materials.insert(current, defaultMaterialColor());
        } else if (command == QLatin1String("kd")) {
            if (current.isEmpty()) {
                warn(warnings, QStringLiteral("%1 line %2: ignoring 'Kd' outside of a material.").arg(prefix).arg(lineNumber));
                continue;
            }
            if (parts.size() < 4) {
                warn(warnings, QStringLiteral("%1 line %2: malformed 'Kd' for '%3'.").arg(prefix).arg(lineNumber).arg(current));
                continue;
            }
            bool okR = false, okG = false, okB = false;
            const double r = parts[1].toDouble(&okR);
            const double g = parts[2].toDouble(&okG);
            const double b = parts[3].toDouble(&okB);
            if (!okR || !okG || !okB) {
                warn(warnings, QStringLiteral("%1 line %2: non numeric 'Kd' for '%3'.").arg(prefix).arg(lineNumber).arg(current));
                continue;
            }
            materials[current] = QColor(qRound(qBound(0.0, r, 1.0) * 255),
                                        qRound(qBound(0.0, g, 1.0) * 255),
                                        qRound(qBound(0.0, b, 1.0) * 255));
        }
    }
    return materials;
}

QVector<GraphicsObjectPtr> parseObj(const QStringList &objLines, const MaterialMap &materials,
                                    QStringList *warnings, const QColor &defaultColor)
{
    QVector<GraphicsObjectPtr> objects;
    QVector<QPointF> vertices;
    QColor activeColor = defaultColor;

    for (int i = 0; i < objLines.size(); ++i) {
        if (isIgnorable(objLines[i]))
            continue;
        const QStringList parts = tokens(objLines[i]);
        const QString command = parts.first().toLower();
        const int lineNumber = i + 1;

        if (command == QLatin1String("v")) {
            bool okX = false, okY = false;
            const double x = parts.value(1).toDouble(&okX);
            const double y = parts.value(2).toDouble(&okY);
            if (parts.size() < 3 || !okX || !okY) {
                warn(warnings, QStringLiteral("Line %1: malformed vertex '%2'.").arg(lineNumber).arg(objLines[i].trimmed()));
                continue;
            }
            vertices << QPointF(x, y);
        } else if (command == QLatin1String("usemtl")) {
            if (parts.size() < 2) {
                warn(warnings, QStringLiteral("Line %1: 'usemtl' without a name, using the default color.").arg(lineNumber));
                activeColor = defaultColor;
                continue;
            }
            const QString name = parts.mid(1).join(QLatin1Char(' '));
            if (materials.contains(name)) {
                activeColor = materials.value(name);
            } else {
                warn(warnings, QStringLiteral("Line %1: material '%2' not found, using the default color.").arg(lineNumber).arg(name));
                activeColor = defaultColor;
            }
        } else if (command == QLatin1String("p") || command == QLatin1String("l")
                   || command == QLatin1String("f")) {
            if (parts.size() < 2) {
                warn(warnings, QStringLiteral("Line %1: '%2' without indices.").arg(lineNumber).arg(command));
                continue;
            }
            const QVector<int> indices = parseIndices(parts.mid(1), vertices.size(), lineNumber, warnings);
            QVector<QPointF> points;
            for (int index : indices)
                points << vertices[index];

            if (command == QLatin1String("p")) {
                for (const QPointF &p : points)
                    objects << GraphicsObjectPtr(new ScenePoint(p, activeColor));
                continue;
            }

            QString error;
            if (command == QLatin1String("l")) {
                if (points.size() == 2) {
                    const QSharedPointer<SceneLine> line = SceneLine::create(points[0], points[1], activeColor, &error);
                    if (line)
                        objects << line;
                    else
                        warn(warnings, QStringLiteral("Line %1: %2").arg(lineNumber).arg(error));
                } else if (points.size() > 2) {
                    objects << ScenePolygon::create(points, true, false, activeColor);
                } else if (!points.isEmpty()) {
                    warn(warnings, QStringLiteral("Line %1: 'l' needs at least 2 valid vertices.").arg(lineNumber));
                }
            } else {
                if (points.size() >= 3)
                    objects << ScenePolygon::create(points, false, true, activeColor);
                else if (!points.isEmpty())
                    warn(warnings, QStringLiteral("Line %1: 'f' needs at least 3 valid vertices.").arg(lineNumber));
            }
        }
    }
    return objects;
}

QSharedPointer<Wireframe3D> parseWireframe(const QStringList &objLines, const QString &fallbackName,
                                           const QColor &color, QStringList *warnings)
{
    QVector<QVector3D> vertices;
    QVector<Segment3D> segments;
    QString name;

    for (int i = 0; i < objLines.size(); ++i) {
        if (isIgnorable(objLines[i]))
            continue;
        const QStringList parts = tokens(objLines[i]);
        const QString command = parts.first().toLower();
        const int lineNumber = i + 1;

        if (command == QLatin1String("v")) {
            bool okX = false, okY = false, okZ = true;
            const double x = parts.value(1).toDouble(&okX);
            const double y = parts.value(2).toDouble(&okY);
            const double z = parts.size() > 3 ? parts[3].toDouble(&okZ) : 0.0;
            if (!okX || !okY || !okZ) {
                warn(warnings, QStringLiteral("Line %1: malformed vertex '%2'.").arg(lineNumber).arg(objLines[i].trimmed()));
                continue;
            }
            vertices << QVector3D(x, y, z);
        } else if (command == QLatin1String("o") || command == QLatin1String("g")) {
            if (name.isEmpty() && parts.size() > 1)
                name = parts.mid(1).join(QLatin1Char(' '));
        } else if (command == QLatin1String("l") || command == QLatin1String("f")) {
            const QVector<int> indices = parseIndices(parts.mid(1), vertices.size(), lineNumber, warnings);
            for (int k = 0; k + 1 < indices.size(); ++k)
                segments << Segment3D(vertices[indices[k]], vertices[indices[k + 1]]);
            if (command == QLatin1String("f") && indices.size() >= 3)
                segments << Segment3D(vertices[indices.last()], vertices[indices.first()]);
        }
    }

    QString error;
    QSharedPointer<Wireframe3D> wireframe =
        Wireframe3D::create(name.isEmpty() ? fallbackName : name, segments, color, &error);
    if (!wireframe)
        warn(warnings, error);
    return wireframe;
}

GeneratedFiles generate(const QVector<GraphicsObjectPtr> &objects, const QString &mtlFileName,
                        QStringList *warnings)
{
    QVector<VertexKey> vertexKeys;
    QHash<VertexKey, int> vertexIndex;
    QStringList materialOrder;
    MaterialMap materials;
    QVector<ObjectDefinition> definitions;

    for (int i = 0; i < objects.size(); ++i) {
        const GraphicsObjectPtr &object = objects[i];
        if (!object)
            continue;
        if (object->is3D()) {
            warn(warnings, QStringLiteral("Object %1 (%2) is three-dimensional and was not saved.")
                               .arg(i + 1).arg(object->typeName()));
            continue;
        }

        const QSharedPointer<Shape2D> shape = object.staticCast<Shape2D>();
        ObjectDefinition definition;
        definition.name = shape->typeName();
        QVector<QPointF> points;
        int minimum = 1;

        switch (shape->type()) {
        case GraphicsObject::Type::Point:
            definition.statement = QStringLiteral("p");
            points = shape->coordinates();
            break;
        case GraphicsObject::Type::Line:
            definition.statement = QStringLiteral("l");
            points = shape->coordinates();
            minimum = 2;
            break;
        case GraphicsObject::Type::Polygon: {
            const bool open = shape.staticCast<ScenePolygon>()->isOpen();
            definition.statement = open ? QStringLiteral("l") : QStringLiteral("f");
            points = shape->coordinates();
            minimum = open ? 2 : 3;
            break;
        }
        case GraphicsObject::Type::Bezier:
            definition.name = QStringLiteral("BezierApproximation");
            definition.statement = QStringLiteral("l");
            points = shape.staticCast<BezierCurve>()->sample(CURVE_SAVE_SAMPLES);
            minimum = 2;
            break;
        case GraphicsObject::Type::BSpline:
            definition.name = QStringLiteral("BSplineApproximation");
            definition.statement = QStringLiteral("l");
            points = shape.staticCast<BSplineCurve>()->sample(CURVE_SAVE_SAMPLES);
            minimum = 2;
            break;
        case GraphicsObject::Type::Wireframe:
            continue;
        }

        if (points.size() < minimum) {
            warn(warnings, QStringLiteral("Object %1 (%2) has %3 usable vertices, skipped.")
                               .arg(i + 1).arg(definition.name).arg(points.size()));
            continue;
        }

        definition.material = materialName(shape->color());
        if (!materials.contains(definition.material)) {
            materials.insert(definition.material, shape->color());
            materialOrder << definition.material;
        }

        for (const QPointF &p : points) {
            const VertexKey key = vertexKey(p);
            if (!vertexIndex.contains(key)) {
                vertexKeys << key;
                vertexIndex.insert(key, vertexKeys.size());
            }
            definition.indices << vertexIndex.value(key);
        }
        definitions << definition;
    }

    GeneratedFiles files;
    files.objLines << QStringLiteral("# OBJ file (Graphics Editor 2D)");

    if (vertexKeys.isEmpty()) {
        if (!objects.isEmpty())
            warn(warnings, QStringLiteral("No valid vertex found in the objects to save."));
        files.objLines << QStringLiteral("# Empty scene");
        return files;
    }

    files.mtlLines << QStringLiteral("# Material file (Graphics Editor 2D)")
                   << QStringLiteral("# Materials: %1").arg(materialOrder.size())
                   << QString();
    for (const QString &name : materialOrder) {
        const QColor color = materials.value(name);
        files.mtlLines << QStringLiteral("newmtl ") + name
                       << QStringLiteral("Kd %1 %2 %3").arg(formatNumber(color.redF()),
                                                            formatNumber(color.greenF()),
                                                            formatNumber(color.blueF()))
                       << QStringLiteral("Ka 0.1 0.1 0.1")
                       << QStringLiteral("Ks 0.0 0.0 0.0")
                       << QStringLiteral("Ns 0.0")
                       << QStringLiteral("d 1.0")
                       << QStringLiteral("illum 1")
                       << QString();
    }

    files.objLines << QStringLiteral("mtllib ") + mtlFileName
                   << QString()
                   << QStringLiteral("# Vertices: %1, Objects: %2").arg(vertexKeys.size()).arg(definitions.size())
                   << QString()
                   << QStringLiteral("# Geometric vertices (z=0)");
    for (const VertexKey &key : vertexKeys) {
        files.objLines << QStringLiteral("v %1 %2 0.0").arg(formatNumber(key.first / 1e6),
                                                            formatNumber(key.second / 1e6));
    }
    files.objLines << QString() << QStringLiteral("# Geometric elements");

    QString lastMaterial;
    for (int i = 0; i < definitions.size(); ++i) {
        const ObjectDefinition &definition = definitions[i];
        files.objLines << QStringLiteral("o %1_%2").arg(definition.name).arg(i + 1);
        if (definition.material != lastMaterial) {
            files.objLines << QStringLiteral("usemtl ") + definition.material;
            lastMaterial = definition.material;
        }
        QStringList indexText;
        for (int index : definition.indices)
            indexText << QString::number(index);
        files.objLines << definition.statement + QLatin1Char(' ') + indexText.join(QLatin1Char(' '))
                       << QString();
    }
    return files;
}

bool readLines(const QString &path, QStringList *lines, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Cannot open '%1': %2").arg(path, file.errorString());
        return false;
    }
    QTextStream in(&file);
    in.setCodec("UTF-8");
    while (!in.atEnd())
        *lines << in.readLine();
    return true;
}

bool writeLines(const QString &path, const QStringList &lines, QString *errorMessage)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Cannot write '%1': %2").arg(path, file.errorString());
        return false;
    }
    QTextStream out(&file);
    out.setCodec("UTF-8");
    for (const QString &line : lines)
        out << line << '\n';
    out.flush();
    if (!file.commit()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Cannot write '%1': %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

bool load(const QString &objPath, QVector<GraphicsObjectPtr> *objects, QStringList *warnings,
          QString *errorMessage, const QColor &defaultColor)
{
    QStringList objLines;
    if (!readLines(objPath, &objLines, errorMessage))
        return false;

    MaterialMap materials;
    const QString library = findMaterialLibrary(objLines, warnings);
    if (!library.isEmpty()) {
        const QString mtlPath = QFileInfo(objPath).dir().filePath(library);
        QStringList mtlLines;
        QString mtlError;
        if (readLines(mtlPath, &mtlLines, &mtlError))
            materials = parseMtl(mtlLines, warnings, library);
        else
            warn(warnings, QStringLiteral("Material file not found: %1").arg(mtlPath));
    }

    *objects = parseObj(objLines, materials, warnings, defaultColor);
    qCInfo(lcIo) << "Loaded" << objects->size() << "objects from" << objPath;
    return true;
}

bool loadWireframe(const QString &objPath, const QColor &color,
                   QSharedPointer<Wireframe3D> *wireframe, QStringList *warnings,
                   QString *errorMessage)
{
    QStringList objLines;
    if (!readLines(objPath, &objLines, errorMessage))
        return false;

    *wireframe = parseWireframe(objLines, QFileInfo(objPath).completeBaseName(), color, warnings);
    if (!*wireframe) {
        if (errorMessage)
            *errorMessage = QStringLiteral("'%1' does not contain any edge.").arg(objPath);
        return false;
    }
    return true;
}

bool save(const QString &basePath, const QVector<GraphicsObjectPtr> &objects,
          QStringList *warnings, QString *errorMessage, QString *writtenObjPath)
{
    QString base = basePath;
    if (base.endsWith(QLatin1String(".obj"), Qt::CaseInsensitive))
        base.chop(4);

    const QString objPath = base + QStringLiteral(".obj");
    const QString mtlPath = base + QStringLiteral(".mtl");

    const GeneratedFiles files = generate(objects, QFileInfo(mtlPath).fileName(), warnings);

    if (!writeLines(objPath, files.objLines, errorMessage))
        return false;
    if (!files.mtlLines.isEmpty() && !writeLines(mtlPath, files.mtlLines, errorMessage))
        return false;

    if (writtenObjPath)
        *writtenObjPath = objPath;
    qCInfo(lcIo) << "Saved" << objects.size() << "objects to" << objPath;
    return true;
}

} // namespace ObjFile
