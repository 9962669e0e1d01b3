#ifndef ADDSUBJECTDIALOG_H
#define ADDSUBJECTDIALOG_H

#include <QDialog>
#include "marksdata.h"

class QLineEdit;
class QCheckBox;
class QPushButton;

class AddSubjectDialog : public QDialog {
    Q_OBJECT
public:
    explicit AddSubjectDialog(Semester target, QWidget* parent = nullptr);

    QString subjectCode() const;
    QString subjectName() const;
    bool    syncSubject() const;  // solo tiene efecto en Annual

private:
    QLineEdit*   edCode_  = nullptr;
    QLineEdit*   edName_  = nullptr;
    QCheckBox*   chkSync_ = nullptr;
    QPushButton* btnOk_   = nullptr;
};

#endif // ADDSUBJECTDIALOG_H
