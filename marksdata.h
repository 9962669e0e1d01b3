#ifndef MARKSDATA_H
#define MARKSDATA_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>
#include <QMetaType>

/* ========================= Semestres ========================= */
enum class Semester { Autumn, Spring, Annual };

inline QString semesterName(Semester s) {
    switch (s) {
    case Semester::Autumn: return QStringLiteral("Autumn");
    case Semester::Spring: return QStringLiteral("Spring");
    case Semester::Annual: return QStringLiteral("Annual");
    }
    return QString();
}

Q_DECLARE_METATYPE(Semester)

inline QVector<Semester> allSemesters() {
    return { Semester::Autumn, Semester::Spring, Semester::Annual };
}

// Nombre de semestre ya resuelto (o no) antes de llegar al motor.
struct SemesterRef {
    enum class Kind { Resolved, Unresolved };

    Kind     kind = Kind::Unresolved;
    Semester semester = Semester::Autumn; // válido solo si Resolved
    QString  rawName;                     // texto original (para mensajes)

    bool isResolved() const { return kind == Kind::Resolved; }
};

// Acepta mayúsculas/minúsculas y espacios alrededor.
SemesterRef resolveSemester(const QString& name);

/* ========================= Registros ========================= */
struct Assessment {
    QString name;
    double  weightedMark = 0.0; // ya expresado como % del total de la materia
    double  markWeight   = 0.0; // peso de la evaluación sobre 100
};

struct Examination {
    double examMark   = 0.0;
    double examWeight = 0.0;
};

struct SubjectRecord {
    QString code;
    QString name;
    QVector<Assessment> assessments; // orden de inserción = orden de despliegue
    double  totalMark = 0.0;
    Examination examination;
    bool    syncSource = false;      // materia de "Annual" proyectada en Autumn/Spring

    int    indexOfAssessment(const QString& assessmentName) const;
    double weightedTotal() const;    // suma de weightedMark
    double weightTotal() const;      // suma de markWeight

    // ==== Serialización (el código va como clave en el documento del año) ====
    QJsonObject toJson() const;
    static SubjectRecord fromJson(const QString& code, const QJsonObject& o);
};

#endif // MARKSDATA_H
