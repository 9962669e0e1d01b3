#include "addsubjectdialog.h"

#include <QCheckBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

AddSubjectDialog::AddSubjectDialog(Semester target, QWidget* parent) : QDialog(parent) {
    setWindowTitle(tr("Add Subject"));
    setMinimumWidth(360);

    auto *root = new QVBoxLayout(this);
    auto *form = new QFormLayout;

    edCode_ = new QLineEdit;
    edName_ = new QLineEdit;
    form->addRow(tr("Subject Code:"), edCode_);
    form->addRow(tr("Subject Name:"), edName_);
    root->addLayout(form);

    chkSync_ = new QCheckBox(tr("Sync to Autumn and Spring"));
    const bool annual = (target == Semester::Annual);
    chkSync_->setChecked(annual);
    chkSync_->setEnabled(annual);
    if (!annual)
        chkSync_->setToolTip(tr("Only Annual subjects can be synced."));
    root->addWidget(chkSync_);

    auto *lblTarget = new QLabel(tr("Semester: %1").arg(semesterName(target)));
    lblTarget->setStyleSheet("color:#666; font-size:11px;");
    root->addWidget(lblTarget);

    auto *bb = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    btnOk_ = bb->button(QDialogButtonBox::Ok);
    btnOk_->setEnabled(false);
    root->addWidget(bb);

    // Sin código no se puede aceptar
    connect(edCode_, &QLineEdit::textChanged, this, [this](const QString& t){
        btnOk_->setEnabled(!t.trimmed().isEmpty());
    });
    connect(bb, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(bb, &QDialogButtonBox::rejected, this, &QDialog::reject);

    edCode_->setFocus();
}

QString AddSubjectDialog::subjectCode() const { return edCode_->text().trimmed(); }
QString AddSubjectDialog::subjectName() const { return edName_->text().trimmed(); }
bool    AddSubjectDialog::syncSubject() const { return chkSync_->isEnabled() && chkSync_->isChecked(); }
