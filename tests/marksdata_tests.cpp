/*
Subject record JSON codec and semester name resolution.
*/
#include "marksdata.h"
#include "testutil.h"

#include <QJsonDocument>

static int test_resolve_semester(void)
{
    SemesterRef ref = resolveSemester("Autumn");
    EXPECT(ref.isResolved(), "Autumn resolves");
    EXPECT(ref.semester == Semester::Autumn, "Autumn value");

    ref = resolveSemester("  annual ");
    EXPECT(ref.isResolved(), "case/space insensitive");
    EXPECT(ref.semester == Semester::Annual, "Annual value");

    ref = resolveSemester("Summer");
    EXPECT(!ref.isResolved(), "unknown stays unresolved");
    EXPECT(ref.rawName == "Summer", "raw name kept");

    ref = resolveSemester(QString());
    EXPECT(!ref.isResolved(), "empty stays unresolved");
    return 0;
}

static int test_record_to_json_layout(void)
{
    SubjectRecord rec;
    rec.code = "COMP101";
    rec.name = "Programming";
    rec.assessments.push_back({"Assignment 1", 20.0, 20.0});
    rec.totalMark = 75.5;
    rec.examination.examWeight = 50.0;
    rec.syncSource = true;

    const QJsonObject o = rec.toJson();
    EXPECT(o.value("Subject Name").toString() == "Programming", "subject name key");
    EXPECT(o.value("Assignments").toArray().size() == 1, "assignments array");
    const QJsonObject a = o.value("Assignments").toArray().at(0).toObject();
    EXPECT(a.value("Subject Assessment").toString() == "Assignment 1", "assessment key");
    EXPECT(nearly(a.value("Weighted Mark").toDouble(), 20.0), "weighted mark key");
    EXPECT(nearly(a.value("Mark Weight").toDouble(), 20.0), "mark weight key");
    EXPECT(nearly(o.value("Total Mark").toDouble(), 75.5), "total mark key");
    EXPECT(nearly(o.value("Examinations").toObject().value("Exam Weight").toDouble(), 50.0), "exam weight key");
    EXPECT(o.value("Examinations").toObject().contains("Exam Mark"), "exam mark key");
    EXPECT(o.value("Sync Source").toBool(), "sync source key");
    EXPECT(!o.contains("code"), "code lives in the parent key");
    return 0;
}

static int test_legacy_record_defaults(void)
{
    // Registro viejo: sin exámenes ni Sync Source, números como texto
    const QByteArray raw = R"({
        "Subject Name": "Maths",
        "Assignments": [ {"Subject Assessment": "Quiz", "Weighted Mark": "7.5", "Mark Weight": 10} ]
    })";
    const SubjectRecord rec = SubjectRecord::fromJson("MATH1", QJsonDocument::fromJson(raw).object());
    EXPECT(rec.code == "MATH1", "code from key");
    EXPECT(rec.assessments.size() == 1, "one assessment");
    EXPECT(nearly(rec.assessments[0].weightedMark, 7.5), "string number coerced");
    EXPECT(nearly(rec.totalMark, 0.0), "total default 0");
    EXPECT(nearly(rec.examination.examMark, 0.0), "exam mark default 0");
    EXPECT(nearly(rec.examination.examWeight, 0.0), "exam weight default 0");
    EXPECT(!rec.syncSource, "sync default false");
    return 0;
}

static int test_totals_and_lookup(void)
{
    SubjectRecord rec;
    rec.assessments.push_back({"A", 20.0, 20.0});
    rec.assessments.push_back({"B", 25.0, 30.0});
    EXPECT(nearly(rec.weightedTotal(), 45.0), "weighted total");
    EXPECT(nearly(rec.weightTotal(), 50.0), "weight total");
    EXPECT(rec.indexOfAssessment("B") == 1, "index of B");
    EXPECT(rec.indexOfAssessment("C") == -1, "missing assessment");
    return 0;
}

int main(void)
{
    if (test_resolve_semester() != 0) return 1;
    if (test_record_to_json_layout() != 0) return 1;
    if (test_legacy_record_defaults() != 0) return 1;
    if (test_totals_and_lookup() != 0) return 1;
    return 0;
}
