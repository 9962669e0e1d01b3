#ifndef YEARSTORE_H
#define YEARSTORE_H

#include <QObject>
#include <QMap>
#include <QString>
#include <QVector>
#include "marksdata.h"
#include "markerror.h"

using SubjectMap = QMap<QString, SubjectRecord>; // código -> materia (ordenado)

/**
 * Documento de un año académico: semestre -> (código -> materia).
 * Se guarda en "<dataDir>/<año>.json". Un semestre presente pero sin
 * materias está inicializado; uno ausente no existe para ese año.
 */
class YearStore : public QObject {
    Q_OBJECT
public:
    explicit YearStore(QString dataDir = QStringLiteral("data"), QObject* parent = nullptr);

    void setDataDir(const QString& dir) { m_dataDir = dir; }
    QString dataDir() const { return m_dataDir; }
    QString filePath(int year) const;

    int  year() const { return m_year; }
    bool exists(int year) const;

    /* ---------- Persistencia ---------- */
    bool load(int year, MarkError* err = nullptr);
    bool save(MarkError* err = nullptr) const;
    // Año nuevo: semestres vacíos (los tres si la lista viene vacía) y guarda.
    bool initializeYear(int year, QVector<Semester> semesters, MarkError* err = nullptr);

    /* ---------- Semestres ---------- */
    bool hasSemester(Semester s) const { return m_semesters.contains(s); }
    QVector<Semester> semesters() const;
    bool addSemester(Semester s);        // false si ya estaba
    bool removeSemester(Semester s);     // borra también sus materias
    Semester defaultSemester() const;

    /* ---------- Materias ---------- */
    const SubjectMap& subjects(Semester s) const;
    const SubjectRecord* find(Semester s, const QString& code) const;
    SubjectRecord* find(Semester s, const QString& code);
    bool get(Semester s, const QString& code, SubjectRecord* out, MarkError* err = nullptr) const;

    // Única vía de creación: inserta el semestre si hace falta y la materia con
    // valores por defecto. Si ya existe la devuelve sin tocarla.
    SubjectRecord& getOrCreate(Semester s, const QString& code,
                               const QString& name = QString(), bool syncSource = false);
    bool remove(Semester s, const QString& code);

    static QVector<int> selectableYears(int currentYear);

signals:
    void yearLoaded(int year);

private:
    QString m_dataDir;
    int     m_year = 0;
    QMap<Semester, SubjectMap> m_semesters;
};

#endif // YEARSTORE_H
