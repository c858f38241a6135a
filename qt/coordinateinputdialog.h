#ifndef COORDINATEINPUTDIALOG_H
#define COORDINATEINPUTDIALOG_H

#include "graphicsobject.h"

#include <QDialog>

class QCheckBox;
class QComboBox;
class QLabel;
class QPushButton;
class QSpinBox;
class QTableWidget;

// Creates an object from typed coordinates instead of mouse clicks.
class CoordinateInputDialog : public QDialog
{
    Q_OBJECT

public:
    enum class Mode {
        Point,
        Line,
        Polygon,
        Bezier,
        BSpline
    };
    Q_ENUM(Mode)

    explicit CoordinateInputDialog(QWidget *parent = nullptr);

    Mode mode() const;
    void setMode(Mode mode);

    QColor color() const { return m_color; }
    void setColor(const QColor &color);

    QVector<QPointF> points(QString *errorMessage = nullptr) const;
    void setPoints(const QVector<QPointF> &points);

    void setPolygonOptions(bool isOpen, bool isFilled);
    void setSplineDegree(int degree);

    // Builds the object from the current input without closing the dialog.
    GraphicsObjectPtr buildObject(QString *errorMessage) const;
    // Set once the dialog was accepted.
    GraphicsObjectPtr createdObject() const { return m_object; }

public slots:
    void accept() override;

private slots:
    void addRow();
    void removeRow();
    void chooseColor();
    void updateControls();

private:
    void setRowValues(int row, const QPointF &point);

    QComboBox *m_modeCombo;
    QTableWidget *m_table;
    QPushButton *m_addRowButton;
    QPushButton *m_removeRowButton;
    QCheckBox *m_openCheck;
    QCheckBox *m_filledCheck;
    QSpinBox *m_degreeSpin;
    QPushButton *m_colorButton;
    QLabel *m_hintLabel;
    QColor m_color;
    GraphicsObjectPtr m_object;
};

#endif // COORDINATEINPUTDIALOG_H
