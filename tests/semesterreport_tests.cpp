/*
Semester report: HTML table and subject summary line.
*/
#include "semesterreport.h"
#include "testutil.h"

#include <QDir>
#include <QFile>
#include <QGuiApplication>
#include <QTemporaryDir>

static ViewRow makeRow(const QString& code, const QString& assessment)
{
    ViewRow r;
    r.subjectCode = code;
    r.subjectName = "Name of " + code;
    r.assessment = assessment;
    return r;
}

static int test_html_table(void)
{
    SemesterReport report;
    QVector<ViewRow> rows;
    rows << makeRow("COMP101", "Essay <draft> & notes");
    ViewRow empty = makeRow("MATH1", kNoAssignmentsText);
    empty.placeholder = true;
    rows << empty;
    ViewRow synced = makeRow("PHYS200", kSyncedSubjectText);
    synced.synced = true;
    rows << synced;

    const QString html = report.toHtml("2025 Autumn", rows);
    for (const auto& h : SemesterReport::columnHeaders())
        EXPECT(html.contains("<th>" + h + "</th>"), "header present");
    EXPECT(SemesterReport::columnHeaders().size() == 7, "seven columns");
    EXPECT(html.contains("Essay &lt;draft&gt; &amp; notes"), "cells escaped");
    EXPECT(!html.contains("<draft>"), "no raw markup");
    EXPECT(html.contains("<tr class='synced'>"), "synced row styled");
    EXPECT(html.contains("<tr class='empty'>"), "placeholder row styled");
    EXPECT(html.contains("Rows: 3"), "row count");
    EXPECT(html.contains("2025 Autumn"), "title");
    return 0;
}

static int test_summary_line(void)
{
    SubjectRecord rec;
    rec.code = "COMP101";
    rec.assessments.push_back({"A1", 20.0, 30.0});
    rec.assessments.push_back({"A2", 25.0, 20.0});
    rec.examination.examWeight = 50.0;
    rec.examination.examMark = 110.0;

    EXPECT(SemesterReport::summaryLine(rec) ==
               "2 assessments, weight 50.00%, exam weight 50.00%, exam mark 110.00",
           "summary text");
    return 0;
}

static int test_pdf_to_unwritable_path(void)
{
    QTemporaryDir dir;
    SemesterReport report;
    QString err;
    const QString path = QDir(dir.path()).filePath("missing/sub/report.pdf");
    EXPECT(!report.exportPdf(path, "2025 Autumn", {}, &err), "export fails");
    EXPECT(!err.isEmpty(), "message");
    EXPECT(!QFile::exists(path), "nothing created");
    return 0;
}

static bool startsWithPdfHeader(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return false;
    return f.size() > 0 && f.read(5) == "%PDF-";
}

static int test_pdf_export_writes_file(void)
{
    QTemporaryDir dir;
    SemesterReport report;
    QVector<ViewRow> rows;
    rows << makeRow("COMP101", "Assignment 1");

    const QString path = QDir(dir.path()).filePath("autumn.pdf");
    QString err;
    EXPECT(report.exportPdf(path, "2025 Autumn", rows, &err), "export");
    EXPECT(err.isEmpty(), "no message");
    EXPECT(startsWithPdfHeader(path), "pdf file written");
    EXPECT(!QFile::exists(path + ".part"), "no leftover");
    return 0;
}

static int test_pdf_export_replaces_existing_file(void)
{
    QTemporaryDir dir;
    const QString path = QDir(dir.path()).filePath("spring.pdf");
    {
        QFile old(path);
        EXPECT(old.open(QIODevice::WriteOnly), "write old file");
        old.write("old contents");
    }

    SemesterReport report;
    QString err;
    EXPECT(report.exportPdf(path, "2025 Spring", { makeRow("MATH1", "Quiz") }, &err), "export");
    EXPECT(startsWithPdfHeader(path), "old file replaced by pdf");
    return 0;
}

int main(int argc, char** argv)
{
    // QTextDocument y QPrinter necesitan una aplicación gráfica (offscreen en CTest)
    QGuiApplication app(argc, argv);

    if (test_html_table() != 0) return 1;
    if (test_summary_line() != 0) return 1;
    if (test_pdf_to_unwritable_path() != 0) return 1;
    if (test_pdf_export_writes_file() != 0) return 1;
    if (test_pdf_export_replaces_existing_file() != 0) return 1;
    return 0;
}
