#include "marksdata.h"

#include <QJsonValue>

static const char* kSubjectName  = "Subject Name";
static const char* kAssignments  = "Assignments";
static const char* kAssessment   = "Subject Assessment";
static const char* kWeightedMark = "Weighted Mark";
static const char* kMarkWeight   = "Mark Weight";
static const char* kTotalMark    = "Total Mark";
static const char* kExaminations = "Examinations";
static const char* kExamMark     = "Exam Mark";
static const char* kExamWeight   = "Exam Weight";
static const char* kSyncSource   = "Sync Source";

SemesterRef resolveSemester(const QString& name) {
    SemesterRef ref;
    ref.rawName = name;
    const QString t = name.trimmed();
    for (Semester s : allSemesters()) {
        if (QString::compare(t, semesterName(s), Qt::CaseInsensitive) == 0) {
            ref.kind = SemesterRef::Kind::Resolved;
            ref.semester = s;
            break;
        }
    }
    return ref;
}

int SubjectRecord::indexOfAssessment(const QString& assessmentName) const {
    for (int i = 0; i < assessments.size(); ++i)
        if (assessments[i].name == assessmentName) return i;
    return -1;
}

double SubjectRecord::weightedTotal() const {
    double sum = 0.0;
    for (const auto& a : assessments) sum += a.weightedMark;
    return sum;
}

double SubjectRecord::weightTotal() const {
    double sum = 0.0;
    for (const auto& a : assessments) sum += a.markWeight;
    return sum;
}

QJsonObject SubjectRecord::toJson() const {
    QJsonObject o;
    o[kSubjectName] = name;

    QJsonArray list;
    for (const auto& a : assessments) {
        QJsonObject ao;
        ao[kAssessment]   = a.name;
        ao[kWeightedMark] = a.weightedMark;
        ao[kMarkWeight]   = a.markWeight;
        list.push_back(ao);
    }
    o[kAssignments] = list;

    o[kTotalMark] = totalMark;

    QJsonObject exam;
    exam[kExamMark]   = examination.examMark;
    exam[kExamWeight] = examination.examWeight;
    o[kExaminations] = exam;

    o[kSyncSource] = syncSource;
    return o;
}

// Los archivos viejos pueden traer números como texto ("20") o campos ausentes.
static double numberOf(const QJsonValue& v, double def = 0.0) {
    if (v.isDouble()) return v.toDouble();
    if (v.isString()) {
        bool ok = false;
        const double d = v.toString().trimmed().toDouble(&ok);
        return ok ? d : def;
    }
    return def;
}

SubjectRecord SubjectRecord::fromJson(const QString& code, const QJsonObject& o) {
    SubjectRecord r;
    r.code = code;
    r.name = o.value(kSubjectName).toString();

    for (auto av : o.value(kAssignments).toArray()) {
        const auto ao = av.toObject();
        Assessment a;
        a.name         = ao.value(kAssessment).toString();
        a.weightedMark = numberOf(ao.value(kWeightedMark));
        a.markWeight   = numberOf(ao.value(kMarkWeight));
        r.assessments.push_back(a);
    }

    r.totalMark = numberOf(o.value(kTotalMark));

    const auto eo = o.value(kExaminations).toObject();
    r.examination.examMark   = numberOf(eo.value(kExamMark));
    r.examination.examWeight = numberOf(eo.value(kExamWeight));

    r.syncSource = o.value(kSyncSource).toBool(false);
    return r;
}
