#include "coordinateinputdialog.h"
#include "beziercurve.h"
#include "bsplinecurve.h"
#include "sceneline.h"
#include "scenepoint.h"
#include "scenepolygon.h"

#include <QCheckBox>
#include <QColorDialog>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QTableWidget>
#include <QVBoxLayout>

namespace {

int minimumRows(CoordinateInputDialog::Mode mode, bool isOpen)
{
    switch (mode) {
    case CoordinateInputDialog::Mode::Point:
        return 1;
    case CoordinateInputDialog::Mode::Line:
        return 2;
    case CoordinateInputDialog::Mode::Polygon:
        return ScenePolygon::minimumPointCount(isOpen);
    case CoordinateInputDialog::Mode::Bezier:
        return 4;
    case CoordinateInputDialog::Mode::BSpline:
        return 2;
    }
    return 1;
}

bool hasFixedRows(CoordinateInputDialog::Mode mode)
{
    return mode == CoordinateInputDialog::Mode::Point || mode == CoordinateInputDialog::Mode::Line;
}

} // namespace

CoordinateInputDialog::CoordinateInputDialog(QWidget *parent)
    : QDialog(parent)
    , m_color(Qt::black)
{
    setWindowTitle(tr("Add by coordinates"));

    m_modeCombo = new QComboBox(this);
    m_modeCombo->addItem(tr("Point"), int(Mode::Point));
    m_modeCombo->addItem(tr("Line"), int(Mode::Line));
    m_modeCombo->addItem(tr("Polygon"), int(Mode::Polygon));
    m_modeCombo->addItem(tr("Bezier curve"), int(Mode::Bezier));
    m_modeCombo->addItem(tr("B-spline curve"), int(Mode::BSpline));

    m_table = new QTableWidget(0, 2, this);
    m_table->setHorizontalHeaderLabels(QStringList() << QStringLiteral("X") << QStringLiteral("Y"));
    m_table->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);

    m_addRowButton = new QPushButton(tr("Add point"), this);
    m_removeRowButton = new QPushButton(tr("Remove point"), this);
    auto rowButtons = new QHBoxLayout();
    rowButtons->addWidget(m_addRowButton);
    rowButtons->addWidget(m_removeRowButton);
    rowButtons->addStretch();

    m_openCheck = new QCheckBox(tr("Open (polyline)"), this);
    m_filledCheck = new QCheckBox(tr("Filled"), this);

    m_degreeSpin = new QSpinBox(this);
    m_degreeSpin->setRange(1, 10);
    m_degreeSpin->setValue(BSplineCurve::DEFAULT_DEGREE);

    m_colorButton = new QPushButton(this);
    m_colorButton->setFixedWidth(60);

    m_hintLabel = new QLabel(this);
    m_hintLabel->setWordWrap(true);

    auto form = new QFormLayout();
    form->addRow(tr("Type:"), m_modeCombo);
    form->addRow(tr("Color:"), m_colorButton);
    form->addRow(QString(), m_openCheck);
    form->addRow(QString(), m_filledCheck);
    form->addRow(tr("Degree:"), m_degreeSpin);

    auto buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);

    auto layout = new QVBoxLayout(this);
    layout->addLayout(form);
    layout->addWidget(m_table);
    layout->addLayout(rowButtons);
    layout->addWidget(m_hintLabel);
    layout->addWidget(buttonBox);

    connect(m_modeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this,
            &CoordinateInputDialog::updateControls);
    connect(m_openCheck, &QCheckBox::toggled, this, &CoordinateInputDialog::updateControls);
    connect(m_addRowButton, &QPushButton::clicked, this, &CoordinateInputDialog::addRow);
    connect(m_removeRowButton, &QPushButton::clicked, this, &CoordinateInputDialog::removeRow);
    connect(m_colorButton, &QPushButton::clicked, this, &CoordinateInputDialog::chooseColor);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &CoordinateInputDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &CoordinateInputDialog::reject);

    setColor(m_color);
    updateControls();
}

CoordinateInputDialog::Mode CoordinateInputDialog::mode() const
{
    return Mode(m_modeCombo->currentData().toInt());
}

void CoordinateInputDialog::setMode(Mode mode)
{
    m_modeCombo->setCurrentIndex(m_modeCombo->findData(int(mode)));
}

void CoordinateInputDialog::setColor(const QColor &color)
{
    if (!color.isValid())
        return;
    m_color = color;
    m_colorButton->setStyleSheet(QStringLiteral("background-color: %1").arg(color.name()));
}

QVector<QPointF> CoordinateInputDialog::points(QString *errorMessage) const
{
    QVector<QPointF> result;
    for (int row = 0; row < m_table->rowCount(); ++row) {
        double values[2] = {0.0, 0.0};
        for (int column = 0; column < 2; ++column) {
            const QTableWidgetItem *item = m_table->item(row, column);
            bool ok = false;
            if (item)
                values[column] = item->text().trimmed().toDouble(&ok);
            if (!ok) {
                if (errorMessage)
                    *errorMessage = tr("Point %1: %2 is not a number.")
                                        .arg(row + 1)
                                        .arg(column == 0 ? QStringLiteral("X") : QStringLiteral("Y"));
                return QVector<QPointF>();
            }
        }
        result << QPointF(values[0], values[1]);
    }
    return result;
}

void CoordinateInputDialog::setPoints(const QVector<QPointF> &points)
{
    m_table->setRowCount(points.size());
    for (int row = 0; row < points.size(); ++row)
        setRowValues(row, points[row]);
    updateControls();
}

void CoordinateInputDialog::setPolygonOptions(bool isOpen, bool isFilled)
{
    m_openCheck->setChecked(isOpen);
    m_filledCheck->setChecked(isFilled && !isOpen);
}

void CoordinateInputDialog::setSplineDegree(int degree)
{
    m_degreeSpin->setValue(degree);
}

GraphicsObjectPtr CoordinateInputDialog::buildObject(QString *errorMessage) const
{
    QString error;
    const QVector<QPointF> input = points(&error);
    if (!error.isEmpty()) {
        if (errorMessage)
            *errorMessage = error;
        return GraphicsObjectPtr();
    }

    GraphicsObjectPtr object;
    switch (mode()) {
    case Mode::Point:
        if (input.size() == 1)
            object = GraphicsObjectPtr(new ScenePoint(input.first(), m_color));
        else
            error = tr("A point takes exactly one coordinate.");
        break;
    case Mode::Line:
        if (input.size() == 2)
            object = SceneLine::create(input[0], input[1], m_color, &error);
        else
            error = tr("A line takes exactly two coordinates.");
        break;
    case Mode::Polygon:
        object = ScenePolygon::create(input, m_openCheck->isChecked(), m_filledCheck->isChecked(),
                                      m_color, &error);
        break;
    case Mode::Bezier:
        object = BezierCurve::create(input, m_color, &error);
        break;
    case Mode::BSpline:
        object = BSplineCurve::create(input, m_color, m_degreeSpin->value(), QVector<double>(), &error);
        break;
    }

    if (!object && errorMessage)
        *errorMessage = error;
    return object;
}

void CoordinateInputDialog::accept()
{
    QString error;
    const GraphicsObjectPtr object = buildObject(&error);
    if (!object) {
        QMessageBox::warning(this, tr("Invalid coordinates"), error);
        return;
    }
    m_object = object;
    QDialog::accept();
}

void CoordinateInputDialog::addRow()
{
    const int row = m_table->rowCount();
    m_table->insertRow(row);
    setRowValues(row, QPointF());
    updateControls();
}

void CoordinateInputDialog::removeRow()
{
    if (m_table->rowCount() <= minimumRows(mode(), m_openCheck->isChecked()))
        return;
    const int current = m_table->currentRow();
    m_table->removeRow(current >= 0 ? current : m_table->rowCount() - 1);
    updateControls();
}

void CoordinateInputDialog::chooseColor()
{
    setColor(QColorDialog::getColor(m_color, this, tr("Choose color")));
}

void CoordinateInputDialog::updateControls()
{
    const Mode current = mode();
    const int minimum = minimumRows(current, m_openCheck->isChecked());

    if (hasFixedRows(current)) {
        while (m_table->rowCount() > minimum)
            m_table->removeRow(m_table->rowCount() - 1);
    }
    while (m_table->rowCount() < minimum) {
        const int row = m_table->rowCount();
        m_table->insertRow(row);
        setRowValues(row, QPointF());
    }

    const bool isPolygon = current == Mode::Polygon;
    m_openCheck->setVisible(isPolygon);
    m_filledCheck->setVisible(isPolygon);
    m_filledCheck->setEnabled(!m_openCheck->isChecked());
    if (m_openCheck->isChecked())
        m_filledCheck->setChecked(false);
    m_degreeSpin->setEnabled(current == Mode::BSpline);

    m_addRowButton->setEnabled(!hasFixedRows(current));
    m_removeRowButton->setEnabled(!hasFixedRows(current) && m_table->rowCount() > minimum);

    switch (current) {
    case Mode::Point:
        m_hintLabel->setText(tr("One coordinate."));
        break;
    case Mode::Line:
        m_hintLabel->setText(tr("Two distinct endpoints."));
        break;
    case Mode::Polygon:
        m_hintLabel->setText(tr("At least 3 vertices, or 2 for an open polyline."));
        break;
    case Mode::Bezier:
        m_hintLabel->setText(tr("4 control points for the first segment, 3 more for each further one."));
        break;
    case Mode::BSpline:
        m_hintLabel->setText(tr("At least 2 control points. The degree is limited to the point count minus one."));
        break;
    }
}

void CoordinateInputDialog::setRowValues(int row, const QPointF &point)
{
    m_table->setItem(row, 0, new QTableWidgetItem(QString::number(point.x())));
    m_table->setItem(row, 1, new QTableWidgetItem(QString::number(point.y())));
}
