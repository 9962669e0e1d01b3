#include "semesterselectiondialog.h"

#include <QCheckBox>
#include <QDialogButtonBox>
#include <QLabel>
#include <QVBoxLayout>

SemesterSelectionDialog::SemesterSelectionDialog(int year, QWidget* parent) : QDialog(parent) {
    setWindowTitle(tr("Select Semesters"));
    resize(300, 200);

    auto *root = new QVBoxLayout(this);
    root->addWidget(new QLabel(tr("No data for %1. Semesters to create:").arg(year)));

    for (Semester s : allSemesters()) {
        auto *chk = new QCheckBox(semesterName(s));
        checks_.insert(s, chk);
        root->addWidget(chk);
    }
    root->addStretch();

    auto *bb = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    root->addWidget(bb);
    connect(bb, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(bb, &QDialogButtonBox::rejected, this, &QDialog::reject);
}

QVector<Semester> SemesterSelectionDialog::selectedSemesters() const {
    QVector<Semester> out;
    for (Semester s : allSemesters())
        if (checks_.value(s) && checks_.value(s)->isChecked()) out << s;
    return out;
}
