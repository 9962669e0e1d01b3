#include "yearstore.h"
#include "markslog.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <utility>

YearStore::YearStore(QString dataDir, QObject* parent)
    : QObject(parent), m_dataDir(std::move(dataDir)) {}

QString YearStore::filePath(int year) const {
    return QDir(m_dataDir).filePath(QString::number(year) + ".json");
}

bool YearStore::exists(int year) const {
    return QFileInfo::exists(filePath(year));
}

/* ====================== Persistencia ====================== */

bool YearStore::load(int year, MarkError* err) {
    const QString path = filePath(year);
    QFile f(path);
    if (!f.exists()) {
        // Año sin archivo: documento vacío, ningún semestre inicializado
        m_semesters.clear();
        m_year = year;
        qCDebug(lcStore) << "sin archivo para" << year << "->" << path;
        emit yearLoaded(year);
        return true;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        qCWarning(lcStore) << "no se puede abrir" << path << f.errorString();
        return fail(err, MarkErrorKind::IO, tr("Cannot open %1: %2").arg(path, f.errorString()));
    }

    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError) {
        qCWarning(lcStore) << "JSON inválido en" << path << pe.errorString();
        return fail(err, MarkErrorKind::IO, tr("Invalid JSON in %1: %2").arg(path, pe.errorString()));
    }
    if (!doc.isObject()) {
        return fail(err, MarkErrorKind::IO, tr("Invalid year document %1: root is not an object").arg(path));
    }

    QMap<Semester, SubjectMap> loaded;
    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        const SemesterRef ref = resolveSemester(it.key());
        if (!ref.isResolved()) {
            qCWarning(lcStore) << "semestre desconocido ignorado:" << it.key() << "en" << path;
            continue;
        }
        SubjectMap& subjects = loaded[ref.semester];
        const QJsonObject so = it.value().toObject();
        for (auto jt = so.begin(); jt != so.end(); ++jt) {
            const QString code = jt.key().trimmed();
            if (code.isEmpty()) continue;
            subjects.insert(code, SubjectRecord::fromJson(code, jt.value().toObject()));
        }
    }

    m_semesters = loaded;
    m_year = year;
    qCDebug(lcStore) << "cargado" << path << "semestres:" << m_semesters.size();
    emit yearLoaded(year);
    return true;
}

bool YearStore::save(MarkError* err) const {
    if (m_year <= 0)
        return fail(err, MarkErrorKind::IO, tr("No year loaded"));

    if (!QDir().mkpath(m_dataDir)) {
        qCWarning(lcStore) << "no se pudo crear el directorio" << m_dataDir;
        return fail(err, MarkErrorKind::IO, tr("Cannot create data directory %1").arg(m_dataDir));
    }

    QJsonObject root;
    for (auto it = m_semesters.constBegin(); it != m_semesters.constEnd(); ++it) {
        QJsonObject so;
        for (const auto& rec : it.value())
            so.insert(rec.code, rec.toJson());
        root.insert(semesterName(it.key()), so);
    }

    // Reemplazo atómico: en disco queda el documento anterior o el nuevo completo
    const QString path = filePath(m_year);
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcStore) << "no se puede escribir" << path << f.errorString();
        return fail(err, MarkErrorKind::IO, tr("Cannot write %1: %2").arg(path, f.errorString()));
    }
    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        qCWarning(lcStore) << "no se pudo confirmar" << path << f.errorString();
        return fail(err, MarkErrorKind::IO, tr("Cannot save %1: %2").arg(path, f.errorString()));
    }
    qCDebug(lcStore) << "guardado" << path;
    return true;
}

bool YearStore::initializeYear(int year, QVector<Semester> semesters, MarkError* err) {
    if (semesters.isEmpty()) semesters = allSemesters();
    m_semesters.clear();
    for (Semester s : semesters) m_semesters.insert(s, {});
    m_year = year;
    qCInfo(lcStore) << "año" << year << "inicializado con" << semesters.size() << "semestres";
    const bool ok = save(err);
    emit yearLoaded(year);
    return ok;
}

/* ====================== Semestres ====================== */

QVector<Semester> YearStore::semesters() const {
    QVector<Semester> out;
    for (Semester s : allSemesters())
        if (m_semesters.contains(s)) out << s;
    return out;
}

bool YearStore::addSemester(Semester s) {
    if (m_semesters.contains(s)) return false;
    m_semesters.insert(s, {});
    return true;
}

bool YearStore::removeSemester(Semester s) {
    return m_semesters.remove(s) > 0;
}

Semester YearStore::defaultSemester() const {
    // Primero uno vacío o sin materias sincronizadas (Annual suele tenerlas)
    for (Semester s : semesters()) {
        const SubjectMap& subs = subjects(s);
        bool hasSync = false;
        for (const auto& rec : subs)
            if (rec.syncSource) { hasSync = true; break; }
        if (!hasSync) return s;
    }
    const auto present = semesters();
    return present.isEmpty() ? Semester::Autumn : present.first();
}

/* ====================== Materias ====================== */

const SubjectMap& YearStore::subjects(Semester s) const {
    static const SubjectMap empty;
    auto it = m_semesters.constFind(s);
    return it == m_semesters.constEnd() ? empty : it.value();
}

const SubjectRecord* YearStore::find(Semester s, const QString& code) const {
    auto it = m_semesters.constFind(s);
    if (it == m_semesters.constEnd()) return nullptr;
    auto jt = it.value().constFind(code);
    return jt == it.value().constEnd() ? nullptr : &jt.value();
}

SubjectRecord* YearStore::find(Semester s, const QString& code) {
    auto it = m_semesters.find(s);
    if (it == m_semesters.end()) return nullptr;
    auto jt = it.value().find(code);
    return jt == it.value().end() ? nullptr : &jt.value();
}

bool YearStore::get(Semester s, const QString& code, SubjectRecord* out, MarkError* err) const {
    const SubjectRecord* rec = find(s, code);
    if (!rec)
        return fail(err, MarkErrorKind::NotFound,
                    tr("Subject %1 not found in %2.").arg(code, semesterName(s)));
    if (out) *out = *rec;
    return true;
}

SubjectRecord& YearStore::getOrCreate(Semester s, const QString& code,
                                      const QString& name, bool syncSource) {
    SubjectMap& subs = m_semesters[s];
    auto it = subs.find(code);
    if (it != subs.end()) return it.value();

    SubjectRecord rec;
    rec.code = code;
    rec.name = name;
    rec.syncSource = syncSource;
    return subs.insert(code, rec).value();
}

bool YearStore::remove(Semester s, const QString& code) {
    auto it = m_semesters.find(s);
    if (it == m_semesters.end()) return false;
    return it.value().remove(code) > 0;
}

QVector<int> YearStore::selectableYears(int currentYear) {
    QVector<int> years;
    for (int y = currentYear - 3; y <= currentYear + 1; ++y) years << y;
    return years;
}
