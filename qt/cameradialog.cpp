#include "cameradialog.h"

#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QGridLayout>
#include <QLabel>
#include <QMessageBox>
#include <QVBoxLayout>

namespace {

QDoubleSpinBox *createCoordinateSpinBox(QWidget *parent, double value)
{
    auto spinBox = new QDoubleSpinBox(parent);
    spinBox->setRange(-100000.0, 100000.0);
    spinBox->setDecimals(2);
    spinBox->setValue(value);
    return spinBox;
}

QVector3D vectorFrom(QDoubleSpinBox *const boxes[3])
{
    return QVector3D(boxes[0]->value(), boxes[1]->value(), boxes[2]->value());
}

} // namespace

CameraDialog::CameraDialog(QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Camera"));

    auto grid = new QGridLayout();
    grid->addWidget(new QLabel(QStringLiteral("X"), this), 0, 1, Qt::AlignCenter);
    grid->addWidget(new QLabel(QStringLiteral("Y"), this), 0, 2, Qt::AlignCenter);
    grid->addWidget(new QLabel(QStringLiteral("Z"), this), 0, 3, Qt::AlignCenter);
    grid->addWidget(new QLabel(tr("View reference point:"), this), 1, 0);
    grid->addWidget(new QLabel(tr("Target:"), this), 2, 0);
    grid->addWidget(new QLabel(tr("View up:"), this), 3, 0);

    for (int i = 0; i < 3; ++i) {
        m_vrp[i] = createCoordinateSpinBox(this, m_camera.vrp[i]);
        m_target[i] = createCoordinateSpinBox(this, m_camera.target[i]);
        m_vup[i] = createCoordinateSpinBox(this, m_camera.vup[i]);
        grid->addWidget(m_vrp[i], 1, i + 1);
        grid->addWidget(m_target[i], 2, i + 1);
        grid->addWidget(m_vup[i], 3, i + 1);
    }

    m_fieldOfView = new QDoubleSpinBox(this);
    m_fieldOfView->setRange(1.0, 170.0);
    m_fieldOfView->setDecimals(1);
    m_fieldOfView->setSuffix(QStringLiteral(" °"));
    m_fieldOfView->setValue(m_camera.fieldOfView);
    grid->addWidget(new QLabel(tr("Field of view:"), this), 4, 0);
    grid->addWidget(m_fieldOfView, 4, 1);

    auto buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &CameraDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &CameraDialog::reject);

    auto layout = new QVBoxLayout(this);
    layout->addLayout(grid);
    layout->addWidget(buttonBox);
}

void CameraDialog::setCamera(const Camera &camera)
{
    m_camera = camera;
    for (int i = 0; i < 3; ++i) {
        m_vrp[i]->setValue(camera.vrp[i]);
        m_target[i]->setValue(camera.target[i]);
        m_vup[i]->setValue(camera.vup[i]);
    }
    m_fieldOfView->setValue(camera.fieldOfView);
}

Camera CameraDialog::camera() const
{
    Camera result = m_camera;
    result.vrp = vectorFrom(m_vrp);
    result.target = vectorFrom(m_target);
    result.vup = vectorFrom(m_vup);
    result.fieldOfView = m_fieldOfView->value();
    return result;
}

void CameraDialog::accept()
{
    const Camera edited = camera();
    QString error;
    if (!Camera::validate(edited.vrp, edited.target, edited.vup, &error)) {
        QMessageBox::warning(this, tr("Invalid camera"), error);
        return;
    }
    QDialog::accept();
}
