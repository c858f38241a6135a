#ifndef TRANSFORMATIONDIALOG_H
#define TRANSFORMATIONDIALOG_H

#include "transformationcontroller.h"

#include <QDialog>

class QComboBox;
class QDoubleSpinBox;
class QGroupBox;

class TransformationDialog : public QDialog
{
    Q_OBJECT

public:
    // A 3D dialog offers the wireframe transformations, a 2D one the planar ones.
    explicit TransformationDialog(bool for3D, QWidget *parent = nullptr);

    bool is3D() const { return m_for3D; }

    TransformParameters::Kind kind() const;
    void setKind(TransformParameters::Kind kind);

    void setParameters(const TransformParameters &parameters);
    TransformParameters parameters() const;

    // Rejects scale factors close to zero and a zero rotation axis.
    static bool validate(const TransformParameters &parameters, QString *errorMessage);

public slots:
    void accept() override;

private slots:
    void updatePages();

private:
    QDoubleSpinBox *createSpinBox(double minimum, double maximum, double value);

    bool m_for3D;
    QComboBox *m_kindCombo;

    QGroupBox *m_offsetGroup;
    QDoubleSpinBox *m_offset[3];

    QGroupBox *m_factorGroup;
    QDoubleSpinBox *m_factor[3];

    QGroupBox *m_angleGroup;
    QDoubleSpinBox *m_angle;

    QGroupBox *m_pivotGroup;
    QDoubleSpinBox *m_pivot[2];

    QGroupBox *m_axisGroup;
    QDoubleSpinBox *m_axisPoint[3];
    QDoubleSpinBox *m_axisDirection[3];
};

#endif // TRANSFORMATIONDIALOG_H
