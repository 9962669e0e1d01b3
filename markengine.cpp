#include "markengine.h"
#include "yearstore.h"
#include "markslog.h"

#include <QLocale>
#include <QtGlobal>

const char* const kNoAssignmentsText = "No Assignments";
const char* const kSyncedSubjectText = "Synced Subject";

// Tolerancia para la suma de pesos (los porcentajes vienen de texto)
static constexpr double kWeightEpsilon = 1e-9;

MarkEngine::MarkEngine(YearStore& store, QObject* parent)
    : QObject(parent), m_store(store) {}

MarkEngine::MarkEngine(YearStore& store, const Options& options, QObject* parent)
    : QObject(parent), m_store(store), m_options(options) {}

/* ====================== Helpers ====================== */

bool MarkEngine::parseNumber(const QString& text, const QString& field, double* out,
                             MarkError* err) {
    const QString t = text.trimmed();
    if (t.isEmpty()) { *out = 0.0; return true; }
    bool ok = false;
    const double d = t.toDouble(&ok);
    if (!ok || !qIsFinite(d))
        return fail(err, MarkErrorKind::Validation, tr("%1 must be a valid number.").arg(field));
    *out = d;
    return true;
}

QString MarkEngine::formatNumber(double v) {
    return QString::number(v, 'g', QLocale::FloatingPointShortest);
}

bool MarkEngine::resolveOwner(Semester semester, const QString& code, Semester* owner,
                              MarkError* err) const {
    if (m_store.find(semester, code)) {
        if (owner) *owner = semester;
        return true;
    }
    if (semester != Semester::Annual) {
        const SubjectRecord* annual = m_store.find(Semester::Annual, code);
        if (annual && annual->syncSource) {
            if (owner) *owner = Semester::Annual;
            return true;
        }
    }
    return fail(err, MarkErrorKind::NotFound, tr("Subject %1 not found.").arg(code));
}

SubjectRecord* MarkEngine::ownedRecord(Semester semester, const QString& code, Semester* owner,
                                       MarkError* err) {
    if (!resolveOwner(semester, code, owner, err)) {
        qCWarning(lcEngine) << "materia no encontrada" << code << "en" << semesterName(semester);
        return nullptr;
    }
    return m_store.find(*owner, code);
}

bool MarkEngine::persist(Semester owner, MarkError* err) {
    MarkError saveErr;
    const bool ok = m_store.save(&saveErr);
    // La mutación en memoria ya ocurrió: se notifica aunque falle el guardado
    emit subjectsChanged(owner);
    if (!ok) {
        qCWarning(lcEngine) << "cambio en" << semesterName(owner) << "no guardado:" << saveErr.message;
        return fail(err, MarkErrorKind::IO,
                    tr("%1 The change may not survive a restart.").arg(saveErr.message));
    }
    return true;
}

bool MarkEngine::checkWeightLimit(const SubjectRecord& rec, double assessmentWeights,
                                  double examWeight, MarkError* err) const {
    if (!m_options.enforceWeightLimit) return true;
    const double total = assessmentWeights + examWeight;
    if (total > 100.0 + kWeightEpsilon) {
        return fail(err, MarkErrorKind::Validation,
                    tr("Weights for %1 would add up to %2%, above 100%.")
                        .arg(rec.code, formatNumber(total)));
    }
    return true;
}

/* ====================== Evaluaciones ====================== */

bool MarkEngine::addEntry(Semester semester, const QString& code, const QString& assessment,
                          const QString& weightedMarkText, const QString& markWeightText,
                          MarkError* err) {
    double weighted = 0.0, weight = 0.0;
    if (!parseNumber(weightedMarkText, tr("Weighted Mark"), &weighted, err)) return false;
    if (!parseNumber(markWeightText, tr("Mark Weight"), &weight, err)) return false;
    return addEntry(semester, code, assessment, weighted, weight, err);
}

bool MarkEngine::addEntry(Semester semester, const QString& code, const QString& assessment,
                          double weightedMark, double markWeight, MarkError* err) {
    const QString name = assessment.trimmed();
    if (name.isEmpty())
        return fail(err, MarkErrorKind::Validation, tr("Assessment name cannot be empty."));

    Semester owner = semester;
    SubjectRecord* rec = ownedRecord(semester, code.trimmed(), &owner, err);
    if (!rec) return false;

    const int ix = rec->indexOfAssessment(name);
    const double previous = ix >= 0 ? rec->assessments[ix].markWeight : 0.0;
    if (!checkWeightLimit(*rec, rec->weightTotal() - previous + markWeight,
                          rec->examination.examWeight, err))
        return false;

    if (ix >= 0) {
        // Reemplazo en su misma posición
        rec->assessments[ix].weightedMark = weightedMark;
        rec->assessments[ix].markWeight   = markWeight;
    } else {
        Assessment a;
        a.name = name;
        a.weightedMark = weightedMark;
        a.markWeight = markWeight;
        rec->assessments.push_back(a);
    }
    qCDebug(lcEngine) << (ix >= 0 ? "reemplazada" : "agregada") << name << "en"
                      << rec->code << semesterName(owner);
    return persist(owner, err);
}

bool MarkEngine::deleteEntry(Semester semester, const QString& code, const QString& assessment,
                             MarkError* err) {
    Semester owner = semester;
    SubjectRecord* rec = ownedRecord(semester, code.trimmed(), &owner, err);
    if (!rec) return false;

    const int ix = rec->indexOfAssessment(assessment.trimmed());
    if (ix < 0) {
        qCWarning(lcEngine) << "evaluación no encontrada" << assessment << "en" << rec->code;
        return fail(err, MarkErrorKind::NotFound,
                    tr("Assessment %1 not found in subject %2.").arg(assessment, rec->code));
    }

    const Assessment removed = rec->assessments.takeAt(ix);
    rec->examination.examWeight += removed.markWeight;
    qCDebug(lcEngine) << "borrada" << removed.name << "de" << rec->code
                      << "peso examen ->" << rec->examination.examWeight;
    return persist(owner, err);
}

int MarkEngine::deleteEntries(Semester semester, const QVector<QPair<QString, QString>>& entries,
                              QStringList* failures) {
    int deleted = 0;
    for (const auto& e : entries) {
        MarkError err;
        if (deleteEntry(semester, e.first, e.second, &err)) {
            ++deleted;
        } else if (failures) {
            failures->append(err.message);
        }
    }
    return deleted;
}

/* ====================== Examen ====================== */

bool MarkEngine::calculateExamMark(Semester semester, const QString& code,
                                   std::optional<double>* result, MarkError* err) {
    Semester owner = semester;
    SubjectRecord* rec = ownedRecord(semester, code.trimmed(), &owner, err);
    if (!rec) return false;

    const double assignmentsTotal = rec->weightedTotal();
    const double examWeight = rec->examination.examWeight;
    if (examWeight <= 0.0) {
        qCDebug(lcEngine) << "nota de examen no aplica para" << rec->code << "(peso" << examWeight << ")";
        if (result) *result = std::nullopt;
        return true;
    }

    const double examMark = (100.0 - assignmentsTotal) * 100.0 / examWeight;
    rec->examination.examMark = examMark;
    if (result) *result = examMark;
    qCDebug(lcEngine) << "nota de examen" << rec->code << "=" << examMark;
    return persist(owner, err);
}

bool MarkEngine::setExamWeight(Semester semester, const QString& code, double weight,
                               MarkError* err) {
    if (!qIsFinite(weight) || weight < 0.0 || weight > 100.0)
        return fail(err, MarkErrorKind::Validation, tr("Exam Weight must be between 0 and 100."));

    Semester owner = semester;
    SubjectRecord* rec = ownedRecord(semester, code.trimmed(), &owner, err);
    if (!rec) return false;
    if (!checkWeightLimit(*rec, rec->weightTotal(), weight, err)) return false;

    rec->examination.examWeight = weight;
    return persist(owner, err);
}

/* ====================== Materias ====================== */

bool MarkEngine::addSubject(Semester semester, const QString& code, const QString& name,
                            bool syncSubject, SubjectRecord* out, MarkError* err) {
    const QString c = code.trimmed();
    if (c.isEmpty())
        return fail(err, MarkErrorKind::Validation, tr("Subject code cannot be empty."));

    if (const SubjectRecord* existing = m_store.find(semester, c)) {
        // Creación idempotente: no se toca ni se guarda
        if (out) *out = *existing;
        return true;
    }

    const bool sync = syncSubject && semester == Semester::Annual;
    const SubjectRecord& rec = m_store.getOrCreate(semester, c, name.trimmed(), sync);
    if (out) *out = rec;
    qCInfo(lcEngine) << "materia" << c << "agregada a" << semesterName(semester)
                     << (sync ? "(sincronizada)" : "");
    return persist(semester, err);
}

bool MarkEngine::deleteSubject(Semester semester, const QString& code, MarkError* err) {
    const QString c = code.trimmed();
    if (!m_store.find(semester, c)) {
        const SubjectRecord* annual = m_store.find(Semester::Annual, c);
        if (semester != Semester::Annual && annual && annual->syncSource)
            return fail(err, MarkErrorKind::NotFound,
                        tr("Subject %1 is synced from Annual; delete it from Annual.").arg(c));
        return fail(err, MarkErrorKind::NotFound, tr("Subject %1 not found.").arg(c));
    }
    m_store.remove(semester, c);
    qCInfo(lcEngine) << "materia" << c << "borrada de" << semesterName(semester);
    return persist(semester, err);
}

bool MarkEngine::setTotalMark(Semester semester, const QString& code, std::optional<double> value,
                              MarkError* err) {
    if (value && !qIsFinite(*value))
        return fail(err, MarkErrorKind::Validation, tr("Total Mark must be a valid number."));

    Semester owner = semester;
    SubjectRecord* rec = ownedRecord(semester, code.trimmed(), &owner, err);
    if (!rec) return false;

    rec->totalMark = value.value_or(0.0);
    return persist(owner, err);
}

/* ====================== Consulta ====================== */

bool MarkEngine::subject(Semester semester, const QString& code, SubjectRecord* out,
                         MarkError* err) const {
    Semester owner = semester;
    if (!resolveOwner(semester, code.trimmed(), &owner, err)) return false;
    return m_store.get(owner, code.trimmed(), out, err);
}

QVector<SubjectRecord> MarkEngine::syncedSubjects(Semester semester) const {
    QVector<SubjectRecord> out;
    if (semester == Semester::Annual) return out;
    const SubjectMap& local = m_store.subjects(semester);
    for (const auto& rec : m_store.subjects(Semester::Annual)) {
        if (rec.syncSource && !local.contains(rec.code)) out << rec;
    }
    return out;
}

QVector<ViewRow> MarkEngine::viewData(Semester semester) const {
    QVector<ViewRow> rows;
    for (const auto& rec : m_store.subjects(semester)) {
        if (rec.assessments.isEmpty()) {
            ViewRow r;
            r.subjectCode = rec.code;
            r.subjectName = rec.name;
            r.assessment  = QString::fromLatin1(kNoAssignmentsText);
            r.totalMark   = formatNumber(rec.totalMark);
            r.placeholder = true;
            rows << r;
            continue;
        }
        for (const auto& a : rec.assessments) {
            ViewRow r;
            r.subjectCode  = rec.code;
            r.subjectName  = rec.name;
            r.assessment   = a.name;
            r.weightedMark = formatNumber(a.weightedMark);
            r.markWeight   = formatNumber(a.markWeight) + "%";
            r.totalMark    = formatNumber(rec.totalMark);
            rows << r;
        }
    }

    for (const auto& rec : syncedSubjects(semester)) {
        ViewRow r;
        r.subjectCode = rec.code;
        r.subjectName = rec.name;
        r.assessment  = QString::fromLatin1(kSyncedSubjectText);
        r.synced      = true;
        rows << r;
    }
    return rows;
}
