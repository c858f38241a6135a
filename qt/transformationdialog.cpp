#include "transformationdialog.h"
#include "geometry.h"

#include <QComboBox>
#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGridLayout>
#include <QGroupBox>
#include <QLabel>
#include <QMessageBox>
#include <QVBoxLayout>

typedef TransformParameters::Kind Kind;

TransformationDialog::TransformationDialog(bool for3D, QWidget *parent)
    : QDialog(parent)
    , m_for3D(for3D)
{
    setWindowTitle(for3D ? tr("Transform 3D objects") : tr("Transform objects"));

    m_kindCombo = new QComboBox(this);
    QList<Kind> kinds;
    if (for3D) {
        kinds << Kind::Translate3D << Kind::ScaleCenter3D << Kind::RotateX3D << Kind::RotateY3D
              << Kind::RotateZ3D << Kind::RotateAxis3D;
    } else {
        kinds << Kind::Translate2D << Kind::ScaleCenter2D << Kind::RotateOrigin2D
              << Kind::RotateCenter2D << Kind::RotateArbitrary2D;
    }
    for (Kind kind : kinds)
        m_kindCombo->addItem(TransformParameters::kindName(kind), int(kind));

    const int dimensions = for3D ? 3 : 2;
    const QStringList axisNames = QStringList() << QStringLiteral("X:") << QStringLiteral("Y:")
                                                << QStringLiteral("Z:");

    m_offsetGroup = new QGroupBox(tr("Offset"), this);
    auto offsetLayout = new QFormLayout(m_offsetGroup);
    for (int i = 0; i < 3; ++i) {
        m_offset[i] = createSpinBox(-100000.0, 100000.0, 0.0);
        if (i < dimensions)
            offsetLayout->addRow(axisNames[i], m_offset[i]);
        else
            m_offset[i]->hide();
    }

    m_factorGroup = new QGroupBox(tr("Scale factors"), this);
    auto factorLayout = new QFormLayout(m_factorGroup);
    for (int i = 0; i < 3; ++i) {
        m_factor[i] = createSpinBox(-1000.0, 1000.0, 1.0);
        m_factor[i]->setDecimals(3);
        m_factor[i]->setSingleStep(0.1);
        if (i < dimensions)
            factorLayout->addRow(axisNames[i], m_factor[i]);
        else
            m_factor[i]->hide();
    }

    m_angleGroup = new QGroupBox(tr("Angle"), this);
    auto angleLayout = new QFormLayout(m_angleGroup);
    m_angle = createSpinBox(-360.0, 360.0, 0.0);
    m_angle->setSuffix(QStringLiteral(" °"));
    angleLayout->addRow(tr("Degrees:"), m_angle);

    m_pivotGroup = new QGroupBox(tr("Rotation point"), this);
    auto pivotLayout = new QFormLayout(m_pivotGroup);
    for (int i = 0; i < 2; ++i) {
        m_pivot[i] = createSpinBox(-100000.0, 100000.0, 0.0);
        pivotLayout->addRow(axisNames[i], m_pivot[i]);
    }

    m_axisGroup = new QGroupBox(tr("Rotation axis"), this);
    auto axisLayout = new QGridLayout(m_axisGroup);
    axisLayout->addWidget(new QLabel(tr("Point"), m_axisGroup), 0, 1);
    axisLayout->addWidget(new QLabel(tr("Direction"), m_axisGroup), 0, 2);
    for (int i = 0; i < 3; ++i) {
        m_axisPoint[i] = createSpinBox(-100000.0, 100000.0, 0.0);
        m_axisDirection[i] = createSpinBox(-100000.0, 100000.0, i == 2 ? 1.0 : 0.0);
        axisLayout->addWidget(new QLabel(axisNames[i], m_axisGroup), i + 1, 0);
        axisLayout->addWidget(m_axisPoint[i], i + 1, 1);
        axisLayout->addWidget(m_axisDirection[i], i + 1, 2);
    }

    auto buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);

    auto form = new QFormLayout();
    form->addRow(tr("Transformation:"), m_kindCombo);

    auto layout = new QVBoxLayout(this);
    layout->addLayout(form);
    layout->addWidget(m_offsetGroup);
    layout->addWidget(m_factorGroup);
    layout->addWidget(m_angleGroup);
    layout->addWidget(m_pivotGroup);
    layout->addWidget(m_axisGroup);
    layout->addStretch();
    layout->addWidget(buttonBox);

    connect(m_kindCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this,
            &TransformationDialog::updatePages);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &TransformationDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &TransformationDialog::reject);

    updatePages();
}

QDoubleSpinBox *TransformationDialog::createSpinBox(double minimum, double maximum, double value)
{
    auto spinBox = new QDoubleSpinBox(this);
    spinBox->setRange(minimum, maximum);
    spinBox->setDecimals(2);
    spinBox->setValue(value);
    return spinBox;
}

TransformParameters::Kind TransformationDialog::kind() const
{
    return Kind(m_kindCombo->currentData().toInt());
}

void TransformationDialog::setKind(TransformParameters::Kind kind)
{
    const int index = m_kindCombo->findData(int(kind));
    if (index >= 0)
        m_kindCombo->setCurrentIndex(index);
}

void TransformationDialog::setParameters(const TransformParameters &parameters)
{
    setKind(parameters.kind);
    for (int i = 0; i < 3; ++i) {
        m_offset[i]->setValue(parameters.offset[i]);
        m_factor[i]->setValue(parameters.factors[i]);
        m_axisPoint[i]->setValue(parameters.axisPoint[i]);
        m_axisDirection[i]->setValue(parameters.axisDirection[i]);
    }
    m_angle->setValue(parameters.angle);
    m_pivot[0]->setValue(parameters.pivot.x());
    m_pivot[1]->setValue(parameters.pivot.y());
}

TransformParameters TransformationDialog::parameters() const
{
    TransformParameters result;
    result.kind = kind();
    result.offset = QVector3D(m_offset[0]->value(), m_offset[1]->value(),
                              m_for3D ? m_offset[2]->value() : 0.0);
    result.factors = QVector3D(m_factor[0]->value(), m_factor[1]->value(),
                               m_for3D ? m_factor[2]->value() : 1.0);
    result.angle = m_angle->value();
    result.pivot = QPointF(m_pivot[0]->value(), m_pivot[1]->value());
    result.axisPoint = QVector3D(m_axisPoint[0]->value(), m_axisPoint[1]->value(),
                                 m_axisPoint[2]->value());
    result.axisDirection = QVector3D(m_axisDirection[0]->value(), m_axisDirection[1]->value(),
                                     m_axisDirection[2]->value());
    return result;
}

bool TransformationDialog::validate(const TransformParameters &parameters, QString *errorMessage)
{
    if (parameters.kind == Kind::ScaleCenter2D || parameters.kind == Kind::ScaleCenter3D) {
        const int dimensions = parameters.is3D() ? 3 : 2;
        for (int i = 0; i < dimensions; ++i) {
            if (isNearZero(parameters.factors[i])) {
                if (errorMessage)
                    *errorMessage = tr("Scale factors must not be zero.");
                return false;
            }
        }
    }
    if (parameters.kind == Kind::RotateAxis3D && isNearZero(parameters.axisDirection.length())) {
        if (errorMessage)
            *errorMessage = tr("The rotation axis direction must not be the zero vector.");
        return false;
    }
    return true;
}

void TransformationDialog::accept()
{
    QString error;
    if (!validate(parameters(), &error)) {
        QMessageBox::warning(this, tr("Invalid transformation"), error);
        return;
    }
    QDialog::accept();
}

void TransformationDialog::updatePages()
{
    const Kind current = kind();
    m_offsetGroup->setVisible(current == Kind::Translate2D || current == Kind::Translate3D);
    m_factorGroup->setVisible(current == Kind::ScaleCenter2D || current == Kind::ScaleCenter3D);
    m_angleGroup->setVisible(current != Kind::Translate2D && current != Kind::Translate3D
                             && current != Kind::ScaleCenter2D && current != Kind::ScaleCenter3D);
    m_pivotGroup->setVisible(current == Kind::RotateArbitrary2D);
    m_axisGroup->setVisible(current == Kind::RotateAxis3D);
    adjustSize();
}
