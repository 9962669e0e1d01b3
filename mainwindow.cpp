#include "mainwindow.h"
#include "addsubjectdialog.h"
#include "semesterselectiondialog.h"
#include "markslog.h"

#include <QAbstractItemView>
#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QComboBox>
#include <QDate>
#include <QFileDialog>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QInputDialog>
#include <QItemSelectionModel>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPair>
#include <QPushButton>
#include <QSettings>
#include <QSignalBlocker>
#include <QTableWidget>
#include <QTableWidgetItem>
#include <QVBoxLayout>
#include <algorithm>

// Columnas de la tabla
enum Col { ColCode = 0, ColName, ColAssessment, ColUnweighted, ColWeighted, ColWeight, ColTotal, ColCount };

// Ancho máximo (caracteres) antes de partir el texto en cada columna
static const int kColumnCharLimits[ColCount] = { 25, 30, 25, 20, 15, 20, 20 };

MainWindow::MainWindow(const AppConfig& config, QWidget* parent)
    : QMainWindow(parent),
      config_(config),
      store_(config.dataDir),
      engine_(store_, MarkEngine::Options{ config.enforceWeightLimit }) {
    setWindowTitle(tr("University Marks Manager"));

    auto *central = new QWidget;
    auto *root = new QVBoxLayout(central);

    root->addWidget(buildSelectorRow());

    table_ = new QTableWidget(0, ColCount);
    table_->setHorizontalHeaderLabels(SemesterReport::columnHeaders());
    table_->setSelectionBehavior(QAbstractItemView::SelectRows);
    table_->setSelectionMode(QAbstractItemView::ExtendedSelection);
    table_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    table_->setWordWrap(true);
    table_->verticalHeader()->setVisible(false);
    for (int c = 0; c < ColCount; ++c)
        table_->horizontalHeader()->setSectionResizeMode(c, QHeaderView::ResizeToContents);
    root->addWidget(table_, 1);

    root->addWidget(buildEntryFields());
    root->addWidget(buildButtons());
    setCentralWidget(central);

    buildMenus();
    wireActions();

    // Primer año: el de la configuración (o el actual)
    selectYearInCombo(config_.effectiveYear());
    onYearChanged();
    table_->setFocus();
}

/* =================== Construcción =================== */

QWidget* MainWindow::buildSelectorRow() {
    auto *w = new QWidget;
    auto *grid = new QGridLayout(w);
    grid->setContentsMargins(0, 0, 0, 0);

    yearCombo_ = new QComboBox;
    const int current = QDate::currentDate().year();
    QVector<int> years = YearStore::selectableYears(current);
    if (!years.contains(config_.effectiveYear())) {
        years << config_.effectiveYear();
        std::sort(years.begin(), years.end());
    }
    for (int y : years) yearCombo_->addItem(QString::number(y), y);

    semesterCombo_ = new QComboBox;

    grid->addWidget(new QLabel(tr("Select Year:")), 0, 0);
    grid->addWidget(yearCombo_, 0, 1);
    grid->addWidget(new QLabel(tr("Select Semester:")), 0, 2);
    grid->addWidget(semesterCombo_, 0, 3);
    grid->setColumnStretch(1, 1);
    grid->setColumnStretch(3, 1);
    return w;
}

QWidget* MainWindow::buildEntryFields() {
    auto *w = new QWidget;
    auto *grid = new QGridLayout(w);
    grid->setContentsMargins(0, 0, 0, 0);

    edCode_         = new QLineEdit;
    edAssessment_   = new QLineEdit;
    edWeightedMark_ = new QLineEdit;
    edMarkWeight_   = new QLineEdit;
    edWeightedMark_->setPlaceholderText(tr("% of subject total"));
    edMarkWeight_->setPlaceholderText(tr("% weight"));

    const QList<QPair<QString, QLineEdit*>> fields = {
        { tr("Enter Subject Code:"),  edCode_ },
        { tr("Enter Assessment:"),    edAssessment_ },
        { tr("Enter Weighted Mark:"), edWeightedMark_ },
        { tr("Enter Mark Weight:"),   edMarkWeight_ },
    };
    // Dos filas: etiqueta + campo
    const int perRow = (fields.size() + 1) / 2;
    for (int i = 0; i < fields.size(); ++i) {
        const int row = i / perRow;
        const int col = (i % perRow) * 2;
        grid->addWidget(new QLabel(fields[i].first), row, col);
        grid->addWidget(fields[i].second, row, col + 1);
    }
    return w;
}

QWidget* MainWindow::buildButtons() {
    auto *w = new QWidget;
    auto *grid = new QGridLayout(w);
    grid->setContentsMargins(0, 0, 0, 0);

    btnAddSubject_    = new QPushButton(tr("Add Subject"));
    btnDeleteSubject_ = new QPushButton(tr("Delete Subject"));
    btnAddEntry_      = new QPushButton(tr("Add Entry"));
    btnDeleteEntry_   = new QPushButton(tr("Delete Entry"));
    btnCalc_          = new QPushButton(tr("Calculate Exam Mark"));
    btnTotalMark_     = new QPushButton(tr("Set Total Mark"));
    btnExamWeight_    = new QPushButton(tr("Set Exam Weight"));
    btnExportPdf_     = new QPushButton(tr("Export PDF…"));

    const QList<QPushButton*> buttons = {
        btnAddSubject_, btnDeleteSubject_, btnAddEntry_, btnDeleteEntry_,
        btnCalc_, btnTotalMark_, btnExamWeight_, btnExportPdf_
    };
    const int perRow = (buttons.size() + 1) / 2;
    for (int i = 0; i < buttons.size(); ++i)
        grid->addWidget(buttons[i], i / perRow, i % perRow);
    return w;
}

void MainWindow::buildMenus() {
    QMenu* file = menuBar()->addMenu(tr("&File"));
    actExportPdf_ = file->addAction(tr("Export PDF…"));
    file->addSeparator();
    actQuit_ = file->addAction(tr("Quit"));

    QMenu* sem = menuBar()->addMenu(tr("&Semesters"));
    actAddSemester_    = sem->addAction(tr("Add Semester…"));
    actRemoveSemester_ = sem->addAction(tr("Remove Semester…"));
}

void MainWindow::wireActions() {
    connect(yearCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::onYearChanged);
    connect(semesterCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::refreshTable);
    connect(table_, &QTableWidget::itemSelectionChanged, this, &MainWindow::populateEntriesFromSelection);

    connect(btnAddSubject_,    &QPushButton::clicked, this, &MainWindow::onAddSubject);
    connect(btnDeleteSubject_, &QPushButton::clicked, this, &MainWindow::onDeleteSubject);
    connect(btnAddEntry_,      &QPushButton::clicked, this, &MainWindow::onAddEntry);
    connect(btnDeleteEntry_,   &QPushButton::clicked, this, &MainWindow::onDeleteEntry);
    connect(btnCalc_,          &QPushButton::clicked, this, &MainWindow::onCalculateExamMark);
    connect(btnTotalMark_,     &QPushButton::clicked, this, &MainWindow::onSetTotalMark);
    connect(btnExamWeight_,    &QPushButton::clicked, this, &MainWindow::onSetExamWeight);
    connect(btnExportPdf_,     &QPushButton::clicked, this, &MainWindow::onExportPdf);

    connect(actExportPdf_,      &QAction::triggered, this, &MainWindow::onExportPdf);
    connect(actQuit_,           &QAction::triggered, this, &QWidget::close);
    connect(actAddSemester_,    &QAction::triggered, this, &MainWindow::onAddSemester);
    connect(actRemoveSemester_, &QAction::triggered, this, &MainWindow::onRemoveSemester);

    // Cualquier mutación del motor repinta la vista
    connect(&engine_, &MarkEngine::subjectsChanged, this, &MainWindow::refreshTable);
}

/* =================== Utilidades =================== */

QString MainWindow::wrapText(const QString& text, int maxChars) {
    const QStringList words = text.split(' ', Qt::SkipEmptyParts);
    QStringList lines;
    QString current;
    for (const QString& word : words) {
        if (current.isEmpty()) { current = word; continue; }
        if (current.size() + 1 + word.size() <= maxChars) {
            current += ' ' + word;
        } else {
            lines << current;
            current = word;
        }
    }
    if (!current.isEmpty()) lines << current;
    return lines.join('\n');
}

bool MainWindow::currentSemester(Semester* out, bool report) {
    const SemesterRef ref = resolveSemester(semesterCombo_->currentText());
    if (!ref.isResolved()) {
        if (report)
            QMessageBox::warning(this, tr("Error"), tr("Semester %1 not found.").arg(ref.rawName));
        return false;
    }
    *out = ref.semester;
    return true;
}

QString MainWindow::selectedSubjectCode() const {
    const QModelIndexList rows = table_->selectionModel()->selectedRows();
    if (rows.isEmpty()) return QString();
    QTableWidgetItem* it = table_->item(rows.first().row(), ColCode);
    return it ? it->data(Qt::UserRole).toString() : QString();
}

void MainWindow::selectYearInCombo(int year) {
    const QSignalBlocker block(yearCombo_);
    const int ix = yearCombo_->findData(year);
    if (ix >= 0) yearCombo_->setCurrentIndex(ix);
}

void MainWindow::showError(const QString& title, const MarkError& err) {
    qCWarning(lcUi) << title << markErrorKindName(err.kind) << err.message;
    switch (err.kind) {
    case MarkErrorKind::IO:
        QMessageBox::warning(this, title, tr("Saving failed: %1").arg(err.message));
        break;
    case MarkErrorKind::NotFound:
    case MarkErrorKind::Validation:
    case MarkErrorKind::None:
        QMessageBox::critical(this, title, err.message);
        break;
    }
}

/* =================== Año / semestre =================== */

void MainWindow::onYearChanged() {
    const int year = yearCombo_->currentData().toInt();
    MarkError err;

    if (store_.exists(year)) {
        if (!store_.load(year, &err)) {
            showError(tr("Load Year"), err);
            selectYearInCombo(loadedYear_);
            return;
        }
    } else {
        SemesterSelectionDialog dlg(year, this);
        if (dlg.exec() != QDialog::Accepted) {
            QMessageBox::information(this, tr("Info"), tr("Year change canceled."));
            selectYearInCombo(loadedYear_);
            if (loadedYear_ == 0) refreshSemesterCombo();
            return;
        }
        QVector<Semester> chosen = dlg.selectedSemesters();
        if (chosen.isEmpty()) {
            QMessageBox::warning(this, tr("Warning"), tr("No semesters selected. Defaulting to all semesters."));
            chosen = allSemesters();
        }
        if (!store_.initializeYear(year, chosen, &err))
            showError(tr("New Year"), err);
    }

    loadedYear_ = year;
    config_.year = year;
    qCInfo(lcUi) << "año activo" << year;
    refreshSemesterCombo();
}

void MainWindow::refreshSemesterCombo(const QString& preferred) {
    QString previous = preferred;
    if (previous.isEmpty()) previous = semesterCombo_->currentText();
    if (previous.isEmpty()) previous = config_.semester;
    {
        const QSignalBlocker block(semesterCombo_);
        semesterCombo_->clear();
        for (Semester s : store_.semesters())
            semesterCombo_->addItem(semesterName(s));

        int ix = semesterCombo_->findText(previous);
        if (ix < 0) ix = semesterCombo_->findText(semesterName(store_.defaultSemester()));
        if (ix >= 0) semesterCombo_->setCurrentIndex(ix);
    }
    refreshTable();
}

void MainWindow::refreshTable() {
    table_->setRowCount(0);
    Semester sem;
    if (!currentSemester(&sem, false)) return;
    config_.semester = semesterName(sem);

    const QVector<ViewRow> rows = engine_.viewData(sem);
    for (const ViewRow& r : rows) {
        const int ri = table_->rowCount();
        table_->insertRow(ri);
        const QStringList cells = r.cells();
        for (int c = 0; c < ColCount; ++c) {
            const QString text = cells.value(c);
            auto *item = new QTableWidgetItem(wrapText(text, kColumnCharLimits[c]));
            if ((c == ColName || c == ColAssessment) && !text.isEmpty() && !r.placeholder)
                item->setToolTip(text);
            if (r.synced) item->setForeground(Qt::gray);
            table_->setItem(ri, c, item);
        }
        // Datos crudos para repoblar los campos sin depender del texto partido
        QTableWidgetItem* codeItem = table_->item(ri, ColCode);
        codeItem->setData(Qt::UserRole, r.subjectCode);
        codeItem->setData(Qt::UserRole + 1, r.synced || r.placeholder);
        table_->item(ri, ColAssessment)->setData(Qt::UserRole, r.assessment);

        SubjectRecord rec;
        if (engine_.subject(sem, r.subjectCode, &rec))
            codeItem->setToolTip(SemesterReport::summaryLine(rec));

        table_->resizeRowToContents(ri);
    }
    qCDebug(lcUi) << "tabla" << semesterName(sem) << "filas" << table_->rowCount();
}

void MainWindow::populateEntriesFromSelection() {
    const QModelIndexList rows = table_->selectionModel()->selectedRows();
    if (rows.isEmpty()) return;
    const int row = rows.first().row();
    QTableWidgetItem* codeItem = table_->item(row, ColCode);
    QTableWidgetItem* asItem   = table_->item(row, ColAssessment);
    if (!codeItem || !asItem) return;

    edCode_->setText(codeItem->data(Qt::UserRole).toString());
    if (codeItem->data(Qt::UserRole + 1).toBool()) {
        // "No Assignments" / "Synced Subject": solo el código
        edAssessment_->clear();
        edWeightedMark_->clear();
        edMarkWeight_->clear();
        return;
    }
    edAssessment_->setText(asItem->data(Qt::UserRole).toString());
    edWeightedMark_->setText(table_->item(row, ColWeighted)->text());
    edMarkWeight_->setText(table_->item(row, ColWeight)->text().remove('%'));
}

/* =================== Materias =================== */

void MainWindow::onAddSubject() {
    Semester sem;
    if (!currentSemester(&sem)) return;

    AddSubjectDialog dlg(sem, this);
    if (dlg.exec() != QDialog::Accepted) return;
    if (dlg.subjectCode().isEmpty()) {
        QMessageBox::warning(this, tr("Error"), tr("Subject code cannot be empty."));
        return;
    }

    MarkError err;
    if (!engine_.addSubject(sem, dlg.subjectCode(), dlg.subjectName(), dlg.syncSubject(), nullptr, &err))
        showError(tr("Failed to add subject"), err);
}

void MainWindow::onDeleteSubject() {
    Semester sem;
    if (!currentSemester(&sem)) return;

    const QString code = selectedSubjectCode();
    if (code.isEmpty()) {
        QMessageBox::warning(this, tr("Error"), tr("Please select a subject to delete."));
        return;
    }
    if (QMessageBox::question(this, tr("Delete Subject"),
                              tr("Delete subject %1 and all of its assessments?").arg(code))
        != QMessageBox::Yes)
        return;

    MarkError err;
    if (!engine_.deleteSubject(sem, code, &err))
        showError(tr("Failed to delete subject"), err);
}

/* =================== Evaluaciones =================== */

void MainWindow::onAddEntry() {
    Semester sem;
    if (!currentSemester(&sem)) return;

    MarkError err;
    if (!engine_.addEntry(sem, edCode_->text(), edAssessment_->text(),
                          edWeightedMark_->text(), edMarkWeight_->text(), &err))
        showError(tr("Failed to add entry"), err);
}

void MainWindow::onDeleteEntry() {
    Semester sem;
    if (!currentSemester(&sem)) return;

    const QModelIndexList rows = table_->selectionModel()->selectedRows();
    if (rows.isEmpty()) {
        QMessageBox::warning(this, tr("Error"), tr("Please select an entry to delete."));
        return;
    }

    QVector<QPair<QString, QString>> entries;
    for (const QModelIndex& ix : rows) {
        QTableWidgetItem* codeItem = table_->item(ix.row(), ColCode);
        QTableWidgetItem* asItem   = table_->item(ix.row(), ColAssessment);
        if (!codeItem || !asItem || codeItem->data(Qt::UserRole + 1).toBool()) continue;
        entries.append({ codeItem->data(Qt::UserRole).toString(), asItem->data(Qt::UserRole).toString() });
    }
    if (entries.isEmpty()) {
        QMessageBox::warning(this, tr("Error"), tr("The selected rows have no assessments to delete."));
        return;
    }

    QStringList failures;
    engine_.deleteEntries(sem, entries, &failures);
    if (!failures.isEmpty())
        QMessageBox::critical(this, tr("Failed to delete entry"), failures.join('\n'));
}

/* =================== Examen / total =================== */

void MainWindow::onCalculateExamMark() {
    Semester sem;
    if (!currentSemester(&sem)) return;

    const QString code = edCode_->text().trimmed();
    if (code.isEmpty()) {
        QMessageBox::critical(this, tr("Error"), tr("Please enter a Subject Code."));
        return;
    }

    std::optional<double> mark;
    MarkError err;
    if (!engine_.calculateExamMark(sem, code, &mark, &err)) {
        showError(tr("Calculate Exam Mark"), err);
        return;
    }
    if (!mark) {
        QMessageBox::information(this, tr("Calculate Exam Mark"),
                                 tr("Subject %1 has no exam weight; the exam mark does not apply.").arg(code));
        return;
    }
    QMessageBox::information(this, tr("Calculate Exam Mark"),
                             tr("Exam mark needed for %1: %2").arg(code, QString::number(*mark, 'f', 2)));
}

void MainWindow::onSetTotalMark() {
    Semester sem;
    if (!currentSemester(&sem)) return;

    const QString code = selectedSubjectCode();
    if (code.isEmpty()) {
        QMessageBox::warning(this, tr("Error"), tr("Please select a subject to manage the Total Mark."));
        return;
    }

    SubjectRecord rec;
    MarkError err;
    if (!engine_.subject(sem, code, &rec, &err)) {
        showError(tr("Set Total Mark"), err);
        return;
    }

    bool ok = false;
    const double value = QInputDialog::getDouble(this, tr("Set Total Mark"),
                                                 tr("Enter Total Mark for %1:").arg(code),
                                                 rec.totalMark, 0.0, 100.0, 2, &ok);
    // Aceptar fija el total; cancelar lo limpia
    const bool done = ok ? engine_.setTotalMark(sem, code, value, &err)
                         : engine_.clearTotalMark(sem, code, &err);
    if (!done) {
        showError(tr("Set Total Mark"), err);
        return;
    }
    QMessageBox::information(this, tr("Success"),
                             ok ? tr("Total Mark for %1 set to %2.").arg(code, QString::number(value, 'f', 2))
                                : tr("Total Mark for %1 cleared.").arg(code));
}

void MainWindow::onSetExamWeight() {
    Semester sem;
    if (!currentSemester(&sem)) return;

    QString code = edCode_->text().trimmed();
    if (code.isEmpty()) code = selectedSubjectCode();
    if (code.isEmpty()) {
        QMessageBox::critical(this, tr("Error"), tr("Please enter a Subject Code."));
        return;
    }

    SubjectRecord rec;
    MarkError err;
    if (!engine_.subject(sem, code, &rec, &err)) {
        showError(tr("Set Exam Weight"), err);
        return;
    }

    bool ok = false;
    const double weight = QInputDialog::getDouble(this, tr("Set Exam Weight"),
                                                  tr("Exam Weight (%) for %1:").arg(code),
                                                  rec.examination.examWeight, 0.0, 100.0, 2, &ok);
    if (!ok) return;
    if (!engine_.setExamWeight(sem, code, weight, &err))
        showError(tr("Set Exam Weight"), err);
}

/* =================== Exportar / semestres =================== */

void MainWindow::onExportPdf() {
    Semester sem;
    if (!currentSemester(&sem)) return;

    const QString title = tr("%1 %2").arg(semesterName(sem)).arg(loadedYear_);
    const QString file = QFileDialog::getSaveFileName(this, tr("Export PDF"),
                                                      title + ".pdf", tr("PDF (*.pdf)"));
    if (file.isEmpty()) return;

    QString err;
    if (!report_.exportPdf(file, title, engine_.viewData(sem), &err))
        QMessageBox::warning(this, tr("PDF"), err);
    else
        QMessageBox::information(this, tr("PDF"), tr("Exported successfully."));
}

void MainWindow::onAddSemester() {
    QStringList missing;
    for (Semester s : allSemesters())
        if (!store_.hasSemester(s)) missing << semesterName(s);
    if (missing.isEmpty()) {
        QMessageBox::information(this, tr("Add Semester"), tr("All semesters already exist for %1.").arg(loadedYear_));
        return;
    }

    bool ok = false;
    const QString name = QInputDialog::getItem(this, tr("Add Semester"), tr("Semester:"), missing, 0, false, &ok);
    if (!ok) return;
    const SemesterRef ref = resolveSemester(name);
    if (!ref.isResolved()) return;

    store_.addSemester(ref.semester);
    MarkError err;
    if (!store_.save(&err)) showError(tr("Add Semester"), err);
    refreshSemesterCombo(semesterName(ref.semester));
}

void MainWindow::onRemoveSemester() {
    QStringList present;
    for (Semester s : store_.semesters()) present << semesterName(s);
    if (present.isEmpty()) return;

    bool ok = false;
    const QString name = QInputDialog::getItem(this, tr("Remove Semester"), tr("Semester:"), present,
                                               qMax(0, present.indexOf(semesterCombo_->currentText())),
                                               false, &ok);
    if (!ok) return;
    const SemesterRef ref = resolveSemester(name);
    if (!ref.isResolved()) return;

    if (QMessageBox::question(this, tr("Remove Semester"),
                              tr("Remove %1 and all of its subjects from %2?").arg(name).arg(loadedYear_))
        != QMessageBox::Yes)
        return;

    store_.removeSemester(ref.semester);
    MarkError err;
    if (!store_.save(&err)) showError(tr("Remove Semester"), err);
    refreshSemesterCombo();
}

void MainWindow::closeEvent(QCloseEvent* e) {
    QSettings settings(AppConfig::organizationName(), AppConfig::applicationName());
    config_.saveSession(settings);
    e->accept();
}
