#ifndef MARKENGINE_H
#define MARKENGINE_H

#include <QObject>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>
#include "marksdata.h"
#include "markerror.h"

class YearStore;

// Fila de la vista de un semestre (mismo orden que las columnas de la tabla).
struct ViewRow {
    QString subjectCode;
    QString subjectName;
    QString assessment;      // nombre, "No Assignments" o "Synced Subject"
    QString unweightedMark;  // reservado, siempre vacío
    QString weightedMark;
    QString markWeight;      // con '%' al final
    QString totalMark;

    bool synced = false;       // proyectada desde Annual (solo lectura)
    bool placeholder = false;  // fila "No Assignments"

    QStringList cells() const {
        return { subjectCode, subjectName, assessment, unweightedMark,
                 weightedMark, markWeight, totalMark };
    }
};

extern const char* const kNoAssignmentsText;
extern const char* const kSyncedSubjectText;

/* ========================= Motor de notas ========================= */
class MarkEngine : public QObject {
    Q_OBJECT
public:
    struct Options {
        // Exigir Σ markWeight + examWeight <= 100 (por defecto confía en el usuario)
        bool enforceWeightLimit = false;
    };

    explicit MarkEngine(YearStore& store, QObject* parent = nullptr);
    MarkEngine(YearStore& store, const Options& options, QObject* parent = nullptr);

    const Options& options() const { return m_options; }
    void setOptions(const Options& o) { m_options = o; }

    /* ---------- Evaluaciones ---------- */
    // Texto vacío -> 0; texto no numérico -> Validation.
    bool addEntry(Semester semester, const QString& code, const QString& assessment,
                  const QString& weightedMarkText, const QString& markWeightText,
                  MarkError* err = nullptr);
    bool addEntry(Semester semester, const QString& code, const QString& assessment,
                  double weightedMark, double markWeight, MarkError* err = nullptr);

    // Devuelve el peso liberado al examen: examWeight += markWeight borrado.
    bool deleteEntry(Semester semester, const QString& code, const QString& assessment,
                     MarkError* err = nullptr);

    // Cada par (código, evaluación) se borra por separado; un fallo no deshace los demás.
    int deleteEntries(Semester semester, const QVector<QPair<QString, QString>>& entries,
                      QStringList* failures = nullptr);

    /* ---------- Examen ---------- */
    // *result = nullopt si examWeight <= 0 (no aplica); en ese caso no se toca examMark.
    bool calculateExamMark(Semester semester, const QString& code,
                           std::optional<double>* result, MarkError* err = nullptr);
    bool setExamWeight(Semester semester, const QString& code, double weight,
                       MarkError* err = nullptr);

    /* ---------- Materias ---------- */
    bool addSubject(Semester semester, const QString& code, const QString& name,
                    bool syncSubject, SubjectRecord* out = nullptr, MarkError* err = nullptr);
    bool deleteSubject(Semester semester, const QString& code, MarkError* err = nullptr);

    bool setTotalMark(Semester semester, const QString& code, std::optional<double> value,
                      MarkError* err = nullptr);
    bool clearTotalMark(Semester semester, const QString& code, MarkError* err = nullptr) {
        return setTotalMark(semester, code, std::nullopt, err);
    }

    /* ---------- Consulta ---------- */
    bool subject(Semester semester, const QString& code, SubjectRecord* out,
                 MarkError* err = nullptr) const;
    QVector<SubjectRecord> syncedSubjects(Semester semester) const;
    QVector<ViewRow> viewData(Semester semester) const;

    // Semestre dueño del registro: el propio, o Annual si es materia sincronizada.
    bool resolveOwner(Semester semester, const QString& code, Semester* owner,
                      MarkError* err = nullptr) const;

signals:
    void subjectsChanged(Semester owner);

private:
    SubjectRecord* ownedRecord(Semester semester, const QString& code, Semester* owner,
                               MarkError* err);
    bool persist(Semester owner, MarkError* err);
    bool checkWeightLimit(const SubjectRecord& rec, double assessmentWeights,
                          double examWeight, MarkError* err) const;

    static bool parseNumber(const QString& text, const QString& field, double* out,
                            MarkError* err);
    static QString formatNumber(double v);

    YearStore& m_store;
    Options    m_options;
};

#endif // MARKENGINE_H
