#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#pragma once

#include <QMainWindow>
#include "appconfig.h"
#include "yearstore.h"
#include "markengine.h"
#include "semesterreport.h"

class QComboBox;
class QTableWidget;
class QLineEdit;
class QPushButton;
class QAction;
class QCloseEvent;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const AppConfig& config, QWidget* parent = nullptr);

    // Corta el texto en líneas de como mucho maxChars (por palabras)
    static QString wrapText(const QString& text, int maxChars);

protected:
    void closeEvent(QCloseEvent* e) override;

private:
    /* =================== Helpers UI =================== */
    QWidget* buildSelectorRow();    // año / semestre
    QWidget* buildEntryFields();    // código, evaluación, nota, peso
    QWidget* buildButtons();
    void     buildMenus();
    void     wireActions();

    bool     currentSemester(Semester* out, bool report = true);
    QString  selectedSubjectCode() const;
    void     refreshSemesterCombo(const QString& preferred = QString());
    void     selectYearInCombo(int year);
    void     showError(const QString& title, const MarkError& err);

private slots:
    void onYearChanged();
    void refreshTable();
    void populateEntriesFromSelection();

    void onAddSubject();
    void onDeleteSubject();
    void onAddEntry();
    void onDeleteEntry();
    void onCalculateExamMark();
    void onSetTotalMark();
    void onSetExamWeight();
    void onExportPdf();
    void onAddSemester();
    void onRemoveSemester();

private:
    AppConfig      config_;
    YearStore      store_;
    MarkEngine     engine_;
    SemesterReport report_;
    int            loadedYear_ = 0;

    /* =================== Widgets =================== */
    QComboBox*    yearCombo_     = nullptr;
    QComboBox*    semesterCombo_ = nullptr;
    QTableWidget* table_         = nullptr;

    QLineEdit* edCode_         = nullptr;
    QLineEdit* edAssessment_   = nullptr;
    QLineEdit* edWeightedMark_ = nullptr;
    QLineEdit* edMarkWeight_   = nullptr;

    QPushButton* btnAddSubject_    = nullptr;
    QPushButton* btnDeleteSubject_ = nullptr;
    QPushButton* btnAddEntry_      = nullptr;
    QPushButton* btnDeleteEntry_   = nullptr;
    QPushButton* btnCalc_          = nullptr;
    QPushButton* btnTotalMark_     = nullptr;
    QPushButton* btnExamWeight_    = nullptr;
    QPushButton* btnExportPdf_     = nullptr;

    QAction* actAddSemester_    = nullptr;
    QAction* actRemoveSemester_ = nullptr;
    QAction* actExportPdf_      = nullptr;
    QAction* actQuit_           = nullptr;
};

#endif // MAINWINDOW_H
