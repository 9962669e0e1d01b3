#ifndef SEMESTERREPORT_H
#define SEMESTERREPORT_H

#include <QObject>
#include <QString>
#include <QVector>
#include "markengine.h"

class SemesterReport : public QObject {
    Q_OBJECT
public:
    explicit SemesterReport(QObject* parent = nullptr);

    static QStringList columnHeaders();

    // HTML listo para previsualizar o imprimir
    QString toHtml(const QString& title, const QVector<ViewRow>& rows) const;

    // Exporta a PDF (A4) usando QTextDocument
    bool exportPdf(const QString& filePath, const QString& title, const QVector<ViewRow>& rows,
                   QString* err = nullptr) const;

    // Resumen de una materia para tooltips: evaluaciones, pesos y examen
    static QString summaryLine(const SubjectRecord& rec);
};

#endif // SEMESTERREPORT_H
