#ifndef SEMESTERSELECTIONDIALOG_H
#define SEMESTERSELECTIONDIALOG_H

#include <QDialog>
#include <QMap>
#include <QVector>
#include "marksdata.h"

class QCheckBox;

// Se muestra al elegir un año sin archivo: qué semestres crear vacíos.
class SemesterSelectionDialog : public QDialog {
    Q_OBJECT
public:
    explicit SemesterSelectionDialog(int year, QWidget* parent = nullptr);

    QVector<Semester> selectedSemesters() const; // en orden Autumn, Spring, Annual

private:
    QMap<Semester, QCheckBox*> checks_;
};

#endif // SEMESTERSELECTIONDIALOG_H
