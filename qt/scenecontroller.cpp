#include "scenecontroller.h"
#include "beziercurve.h"
#include "bsplinecurve.h"
#include "clipping.h"
#include "editorlogging.h"
#include "editorstate.h"
#include "geometry.h"
#include "sceneline.h"
#include "scenepoint.h"
#include "scenepolygon.h"
#include "transformations3d.h"
#include "wireframe3d.h"

#include <QGraphicsItem>
#include <QGraphicsScene>
#include <QPainterPath>
#include <QPen>

namespace {

QGraphicsItem *createRunsItem(const QVector<QVector<QPointF>> &runs, const QPen &pen)
{
    QPainterPath path;
    for (const QVector<QPointF> &run : runs) {
        path.moveTo(run.first());
        for (int i = 1; i < run.size(); ++i)
            path.lineTo(run[i]);
    }
    return createPathItem(path, pen);
}

bool allInside(const QVector<QPointF> &points, const QRectF &window)
{
    for (const QPointF &p : points) {
        if (!Clipping::clipPoint(p, window))
            return false;
    }
    return true;
}

} // namespace

SceneController::SceneController(QGraphicsScene *scene, EditorState *state, QObject *parent)
    : QObject(parent)
    , m_scene(scene)
    , m_state(state)
{
    connect(m_state, &EditorState::clipRectChanged, this, &SceneController::refreshAll);
    connect(m_state, &EditorState::lineClipperChanged, this, &SceneController::refreshAll);
    connect(m_state, &EditorState::cameraChanged, this, &SceneController::refreshAll);
}

void SceneController::addObject(const GraphicsObjectPtr &object)
{
    if (!object) {
        qCWarning(lcScene) << "Refusing to add a null object";
        return;
    }
    m_objects << object;
    attachItem(object);
    emit sceneModified();
}

void SceneController::addObjects(const QVector<GraphicsObjectPtr> &objects)
{
    bool added = false;
    for (const GraphicsObjectPtr &object : objects) {
        if (!object)
            continue;
        m_objects << object;
        attachItem(object);
        added = true;
    }
    if (added)
        emit sceneModified();
}

bool SceneController::removeObject(const GraphicsObjectPtr &object)
{
    const int index = m_objects.indexOf(object);
    if (index < 0)
        return false;
    detachItem(object);
    m_objects.remove(index);
    emit sceneModified();
    return true;
}

int SceneController::removeSelected()
{
    const QVector<GraphicsObjectPtr> selected = selectedObjects();
    for (const GraphicsObjectPtr &object : selected) {
        detachItem(object);
        m_objects.removeAll(object);
    }
    if (!selected.isEmpty())
        emit sceneModified();
    return selected.size();
}

bool SceneController::updateObject(const GraphicsObjectPtr &oldObject, const GraphicsObjectPtr &newObject)
{
    const int index = m_objects.indexOf(oldObject);
    if (index < 0 || !newObject) {
        qCWarning(lcScene) << "Cannot update an object that is not in the scene";
        return false;
    }

    QGraphicsItem *oldItem = m_items.value(oldObject.data());
    const bool selected = oldItem && oldItem->isSelected();

    detachItem(oldObject);
    m_objects[index] = newObject;
    attachItem(newObject, selected);
    emit sceneModified();
    return true;
}

void SceneController::clearScene()
{
    if (m_objects.isEmpty())
        return;
    for (const GraphicsObjectPtr &object : m_objects)
        detachItem(object);
    m_objects.clear();
    emit sceneModified();
}

QVector<GraphicsObjectPtr> SceneController::selectedObjects() const
{
    QVector<GraphicsObjectPtr> selected;
    for (const GraphicsObjectPtr &object : m_objects) {
        QGraphicsItem *item = m_items.value(object.data());
        if (item && item->isSelected())
            selected << object;
    }
    return selected;
}

GraphicsObjectPtr SceneController::objectForItem(const QGraphicsItem *item) const
{
    for (const GraphicsObjectPtr &object : m_objects) {
        if (m_items.value(object.data()) == item)
            return object;
    }
    return GraphicsObjectPtr();
}

QGraphicsItem *SceneController::itemForObject(const GraphicsObjectPtr &object) const
{
    return m_items.value(object.data());
}

void SceneController::refreshAll()
{
    for (const GraphicsObjectPtr &object : m_objects) {
        QGraphicsItem *item = m_items.value(object.data());
        const bool selected = item && item->isSelected();
        detachItem(object);
        attachItem(object, selected);
    }
    qCDebug(lcScene) << "Re-clipped" << m_objects.size() << "objects," << m_items.size() << "visible";
}

void SceneController::attachItem(const GraphicsObjectPtr &object, bool selected)
{
    QGraphicsItem *item = createClippedItem(*object);
    if (!item) {
        qCDebug(lcScene) << object->typeName() << "is outside the clip window";
        return;
    }
    item->setFlag(QGraphicsItem::ItemIsSelectable, true);
    m_scene->addItem(item);
    item->setSelected(selected);
    m_items.insert(object.data(), item);
}

void SceneController::detachItem(const GraphicsObjectPtr &object)
{
    QGraphicsItem *item = m_items.take(object.data());
    if (!item)
        return;
    if (item->scene())
        item->scene()->removeItem(item);
    delete item;
}

QGraphicsItem *SceneController::createClippedItem(const GraphicsObject &object) const
{
    const QRectF window = m_state->clipRect();
    const Clipping::LineClipper clipper = m_state->lineClipper();

    switch (object.type()) {
    case GraphicsObject::Type::Point: {
        const ScenePoint &point = static_cast<const ScenePoint &>(object);
        if (!Clipping::clipPoint(point.position(), window))
            return nullptr;
        return point.createGraphicsItem();
    }
    case GraphicsObject::Type::Line: {
        const SceneLine &line = static_cast<const SceneLine &>(object);
        QLineF clipped;
        if (!Clipping::clipLine(line.line(), window, clipper, &clipped))
            return nullptr;
        const QSharedPointer<SceneLine> visible = SceneLine::create(clipped.p1(), clipped.p2(), line.color());
        return visible ? visible->createGraphicsItem() : nullptr;
    }
    case GraphicsObject::Type::Polygon: {
        const ScenePolygon &polygon = static_cast<const ScenePolygon &>(object);
        if (polygon.isOpen()) {
            const QVector<QVector<QPointF>> runs = Clipping::clipPolyline(polygon.coordinates(), window, clipper);
            if (runs.isEmpty())
                return nullptr;
            return createRunsItem(runs, objectPen(polygon.color(), ScenePolygon::PEN_WIDTH, true));
        }
        if (allInside(polygon.coordinates(), window))
            return polygon.createGraphicsItem();
        const QVector<QPointF> clipped = Clipping::sutherlandHodgman(polygon.coordinates(), window);
        const QSharedPointer<ScenePolygon> visible =
            ScenePolygon::create(clipped, false, polygon.isFilled(), polygon.color());
        return visible ? visible->createGraphicsItem() : nullptr;
    }
    case GraphicsObject::Type::Bezier:
    case GraphicsObject::Type::BSpline: {
        const Shape2D &curve = static_cast<const Shape2D &>(object);
        if (allInside(curve.coordinates(), window))
            return curve.createGraphicsItem();
        const QVector<QPointF> samples = object.type() == GraphicsObject::Type::Bezier
            ? static_cast<const BezierCurve &>(object).sample()
            : static_cast<const BSplineCurve &>(object).sample();
        const QVector<QVector<QPointF>> runs = Clipping::clipPolyline(samples, window, clipper);
        if (runs.isEmpty())
            return nullptr;
        return createRunsItem(runs, objectPen(curve.color(), BezierCurve::PEN_WIDTH, true));
    }
    case GraphicsObject::Type::Wireframe:
        return createClippedWireframe(static_cast<const Wireframe3D &>(object));
    }
    return nullptr;
}

QGraphicsItem *SceneController::createClippedWireframe(const Wireframe3D &wireframe) const
{
    const QRectF window = m_state->clipRect();
    const Camera camera = m_state->camera();
    const QMatrix4x4 view = camera.viewMatrix();
    const QMatrix4x4 projection = camera.projectionMatrix(window);
    const QMatrix4x4 viewport = camera.viewportMatrix(window);

    QVector<QVector<QPointF>> visibleEdges;
    for (const Segment3D &segment : wireframe.segments()) {
        QPointF a, b;
        if (!Transform3D::projectPoint(segment.first, QMatrix4x4(), view, projection, viewport, &a)
            || !Transform3D::projectPoint(segment.second, QMatrix4x4(), view, projection, viewport, &b))
            continue;
        QLineF clipped;
        if (!Clipping::clipLine(QLineF(a, b), window, m_state->lineClipper(), &clipped))
            continue;
        if (fuzzyEqual(clipped.p1(), clipped.p2()))
            continue;
        visibleEdges << (QVector<QPointF>() << clipped.p1() << clipped.p2());
    }

    if (visibleEdges.isEmpty())
        return nullptr;
    return createRunsItem(visibleEdges, objectPen(wireframe.color(), Wireframe3D::PEN_WIDTH));
}
