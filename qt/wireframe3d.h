#ifndef WIREFRAME3D_H
#define WIREFRAME3D_H

#include "graphicsobject.h"

#include <QPair>
#include <QVector3D>

typedef QPair<QVector3D, QVector3D> Segment3D;

// Named 3D object made of straight edges. Vertices are stored once and edges
// refer to them by index, so transforming the vertices moves every edge.
class Wireframe3D : public GraphicsObject
{
public:
    static constexpr double PEN_WIDTH = 1.5;

    static QSharedPointer<Wireframe3D> create(const QString &name, const QVector<Segment3D> &segments,
                                              const QColor &color = Qt::black,
                                              QString *errorMessage = nullptr);

    Type type() const override { return Type::Wireframe; }
    QString typeName() const override { return QStringLiteral("Wireframe3D"); }
    GraphicsObjectPtr clone() const override;
    bool is3D() const override { return true; }

    QString name() const { return m_name; }
    void setName(const QString &name) { m_name = name; }

    QVector<QVector3D> points() const { return m_vertices; }
    // Same vertex count required, order as returned by points().
    bool setPoints(const QVector<QVector3D> &points, QString *errorMessage = nullptr);
    QVector<Segment3D> segments() const;
    int edgeCount() const { return m_edges.size(); }
    QVector3D center() const;

private:
    Wireframe3D(const QString &name, const QColor &color);

    int vertexIndex(const QVector3D &point);

    QString m_name;
    QVector<QVector3D> m_vertices;
    QVector<QPair<int, int>> m_edges;
};

#endif // WIREFRAME3D_H
