#ifndef CAMERADIALOG_H
#define CAMERADIALOG_H

#include "camera.h"

#include <QDialog>

class QDoubleSpinBox;

// Edits the view reference point, the target and the up vector.
class CameraDialog : public QDialog
{
    Q_OBJECT

public:
    explicit CameraDialog(QWidget *parent = nullptr);

    void setCamera(const Camera &camera);
    // The projection mode is kept from the last setCamera() call.
    Camera camera() const;

public slots:
    void accept() override;

private:
    QDoubleSpinBox *m_vrp[3];
    QDoubleSpinBox *m_target[3];
    QDoubleSpinBox *m_vup[3];
    QDoubleSpinBox *m_fieldOfView;
    Camera m_camera;
};

#endif // CAMERADIALOG_H
