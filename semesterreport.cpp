#include "semesterreport.h"
#include "markslog.h"

#include <QFile>
#include <QFileInfo>
#include <QLocale>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QTextDocument>
#include <QtPrintSupport/QPrinter>

SemesterReport::SemesterReport(QObject* parent) : QObject(parent) {}

QStringList SemesterReport::columnHeaders() {
    return { tr("Subject Code"), tr("Subject Name"), tr("Assessment"), tr("Unweighted Mark"),
             tr("Weighted Mark"), tr("Mark Weight"), tr("Total Mark") };
}

static QString cssBase() {
    return QString(R"(
        <style>
        body{font-family:Segoe UI,Arial,sans-serif; font-size:12px; margin:0;}
        .title{font-size:16px; font-weight:bold; margin:10px 0;}
        table{border-collapse:collapse; width:100%;}
        th, td{border:1px solid #ccc; padding:4px 6px; vertical-align:middle;}
        th{background:#f0f0f0; text-align:left;}
        tr.synced td{color:#666; font-style:italic;}
        tr.empty td{color:#888;}
        </style>
    )");
}

QString SemesterReport::toHtml(const QString& title, const QVector<ViewRow>& rows) const {
    QString h;
    h += "<html><head>";
    h += cssBase();
    h += "</head><body>";
    h += QString("<div class='title'>%1</div>").arg(title.toHtmlEscaped());

    h += "<table><thead><tr>";
    for (const auto& c : columnHeaders()) h += "<th>" + c.toHtmlEscaped() + "</th>";
    h += "</tr></thead><tbody>";

    for (const auto& r : rows) {
        if (r.synced)           h += "<tr class='synced'>";
        else if (r.placeholder) h += "<tr class='empty'>";
        else                    h += "<tr>";
        for (const auto& v : r.cells())
            h += "<td>" + v.toHtmlEscaped() + "</td>";
        h += "</tr>";
    }
    h += "</tbody></table>";

    h += QString("<div style='margin-top:8px;color:#666;'>%1</div>").arg(tr("Rows: %1").arg(rows.size()));
    h += "</body></html>";
    return h;
}

bool SemesterReport::exportPdf(const QString& filePath, const QString& title,
                               const QVector<ViewRow>& rows, QString* err) const {
    // QPrinter no informa errores de escritura: se revisa la carpeta destino antes
    const QFileInfo target(filePath);
    const QFileInfo folder(target.absolutePath());
    if (!folder.isDir() || !folder.isWritable()) {
        if (err) *err = tr("Cannot write %1: folder %2 is not writable.").arg(filePath, folder.filePath());
        return false;
    }

    // Se imprime aparte y se reemplaza al final; un fallo no toca el PDF anterior
    const QString partial = filePath + ".part";
    QFile::remove(partial);

    QTextDocument doc;
    doc.setHtml(toHtml(title, rows));

    QPrinter printer(QPrinter::HighResolution);
    printer.setPageSize(QPageSize(QPageSize::A4));
    printer.setOutputFormat(QPrinter::PdfFormat);
    printer.setOutputFileName(partial);
    printer.setPageMargins(QMarginsF(12, 12, 12, 12), QPageLayout::Millimeter);
    doc.print(&printer);

    if (QFileInfo(partial).size() <= 0) {
        qCWarning(lcUi) << "PDF vacío tras exportar" << filePath;
        QFile::remove(partial);
        if (err) *err = tr("Could not export the PDF.");
        return false;
    }
    if (target.exists() && !QFile::remove(filePath)) {
        qCWarning(lcUi) << "no se pudo reemplazar" << filePath;
        QFile::remove(partial);
        if (err) *err = tr("Cannot replace %1.").arg(filePath);
        return false;
    }
    if (!QFile::rename(partial, filePath)) {
        if (err) *err = tr("Cannot write %1.").arg(filePath);
        return false;
    }
    qCDebug(lcUi) << "PDF exportado" << filePath << "filas" << rows.size();
    return true;
}

QString SemesterReport::summaryLine(const SubjectRecord& rec) {
    const QLocale c = QLocale::c();
    return tr("%1 assessments, weight %2%, exam weight %3%, exam mark %4")
        .arg(rec.assessments.size())
        .arg(c.toString(rec.weightTotal(), 'f', 2))
        .arg(c.toString(rec.examination.examWeight, 'f', 2))
        .arg(c.toString(rec.examination.examMark, 'f', 2));
}
