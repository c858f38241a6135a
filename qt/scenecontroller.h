#ifndef SCENECONTROLLER_H
#define SCENECONTROLLER_H

#include "graphicsobject.h"

#include <QHash>
#include <QObject>

class EditorState;
class QGraphicsItem;
class QGraphicsScene;
class Wireframe3D;

// Keeps the scene model (the original, unclipped objects) and the items that
// show their clipped version on the canvas. An object clipped away entirely
// has no item but stays in the model.
class SceneController : public QObject
{
    Q_OBJECT

public:
    SceneController(QGraphicsScene *scene, EditorState *state, QObject *parent = nullptr);

    void addObject(const GraphicsObjectPtr &object);
    void addObjects(const QVector<GraphicsObjectPtr> &objects);
    bool removeObject(const GraphicsObjectPtr &object);
    int removeSelected();
    // Replaces oldObject by newObject at the same position, keeping the
    // selection.
    bool updateObject(const GraphicsObjectPtr &oldObject, const GraphicsObjectPtr &newObject);
    void clearScene();

    QVector<GraphicsObjectPtr> objects() const { return m_objects; }
    QVector<GraphicsObjectPtr> selectedObjects() const;
    GraphicsObjectPtr objectForItem(const QGraphicsItem *item) const;
    QGraphicsItem *itemForObject(const GraphicsObjectPtr &object) const;
    int visibleItemCount() const { return m_items.size(); }

public slots:
    // Rebuilds every item, e.g. after the clip window or the clipper changed.
    void refreshAll();

signals:
    void sceneModified();

private:
    QGraphicsItem *createClippedItem(const GraphicsObject &object) const;
    QGraphicsItem *createClippedWireframe(const Wireframe3D &wireframe) const;
    void attachItem(const GraphicsObjectPtr &object, bool selected = false);
    void detachItem(const GraphicsObjectPtr &object);

    QGraphicsScene *m_scene;
    EditorState *m_state;
    QVector<GraphicsObjectPtr> m_objects;
    QHash<GraphicsObject *, QGraphicsItem *> m_items;
};

#endif // SCENECONTROLLER_H
