#include "wireframe3d.h"
#include "geometry.h"

constexpr double Wireframe3D::PEN_WIDTH;

Wireframe3D::Wireframe3D(const QString &name, const QColor &color)
    : GraphicsObject(color)
    , m_name(name)
{
}

QSharedPointer<Wireframe3D> Wireframe3D::create(const QString &name, const QVector<Segment3D> &segments,
                                                const QColor &color, QString *errorMessage)
{
    QSharedPointer<Wireframe3D> object(new Wireframe3D(name, color));

    for (const Segment3D &segment : segments) {
        if (fuzzyEqual(segment.first, segment.second))
            continue;
        int a = object->vertexIndex(segment.first);
        int b = object->vertexIndex(segment.second);
        if (a > b)
            qSwap(a, b);
        const QPair<int, int> edge(a, b);
        if (!object->m_edges.contains(edge))
            object->m_edges << edge;
    }

    if (object->m_edges.isEmpty()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Wireframe '%1' has no edges.").arg(name);
        return QSharedPointer<Wireframe3D>();
    }
    return object;
}

int Wireframe3D::vertexIndex(const QVector3D &point)
{
    for (int i = 0; i < m_vertices.size(); ++i) {
        if (fuzzyEqual(m_vertices[i], point))
            return i;
    }
    m_vertices << point;
    return m_vertices.size() - 1;
}

GraphicsObjectPtr Wireframe3D::clone() const
{
    QSharedPointer<Wireframe3D> copy(new Wireframe3D(m_name, m_color));
    copy->m_vertices = m_vertices;
    copy->m_edges = m_edges;
    return copy;
}

bool Wireframe3D::setPoints(const QVector<QVector3D> &points, QString *errorMessage)
{
    if (points.size() != m_vertices.size()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Expected %1 vertices, got %2.")
                                .arg(m_vertices.size())
                                .arg(points.size());
        return false;
    }
    m_vertices = points;
    return true;
}

QVector<Segment3D> Wireframe3D::segments() const
{
    QVector<Segment3D> result;
    result.reserve(m_edges.size());
    for (const QPair<int, int> &edge : m_edges)
        result << Segment3D(m_vertices[edge.first], m_vertices[edge.second]);
    return result;
}

QVector3D Wireframe3D::center() const
{
    if (m_vertices.isEmpty())
        return QVector3D();
    QVector3D sum;
    for (const QVector3D &v : m_vertices)
        sum += v;
    return sum / float(m_vertices.size());
}
