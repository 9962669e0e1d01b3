#include "appconfig.h"
#include "marksdata.h"
#include "markslog.h"

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDate>
#include <QSettings>
#include <QStringList>

static const char* kKeyDataDir     = "storage/dataDir";
static const char* kKeyYear        = "session/year";
static const char* kKeySemester    = "session/semester";
static const char* kKeyWeightLimit = "marks/enforceWeightLimit";

const char* AppConfig::organizationName() { return "UniMarks"; }
const char* AppConfig::applicationName()  { return "University Marks Manager"; }

void AppConfig::loadSettings(const QSettings& s) {
    dataDir            = s.value(kKeyDataDir, dataDir).toString();
    year               = s.value(kKeyYear, year).toInt();
    semester           = s.value(kKeySemester, semester).toString();
    enforceWeightLimit = s.value(kKeyWeightLimit, enforceWeightLimit).toBool();
    if (dataDir.trimmed().isEmpty()) dataDir = QStringLiteral("data");
    qCDebug(lcConfig) << "settings:" << s.fileName() << "dataDir" << dataDir << "year" << year;
}

void AppConfig::saveSettings(QSettings& s) const {
    s.setValue(kKeyDataDir, dataDir);
    s.setValue(kKeyYear, year);
    s.setValue(kKeySemester, semester);
    s.setValue(kKeyWeightLimit, enforceWeightLimit);
}

void AppConfig::saveSession(QSettings& s) const {
    s.setValue(kKeyYear, year);
    s.setValue(kKeySemester, semester);
}

void AppConfig::configureParser(QCommandLineParser& parser) {
    parser.setApplicationDescription(
        QCoreApplication::translate("AppConfig", "Tracks subjects, assessment marks and exam marks per semester."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption({{"d", "data-dir"},
                      QCoreApplication::translate("AppConfig", "Directory holding one <year>.json per year"),
                      QCoreApplication::translate("AppConfig", "path")});
    parser.addOption({{"y", "year"},
                      QCoreApplication::translate("AppConfig", "Academic year to open"),
                      QCoreApplication::translate("AppConfig", "year")});
    parser.addOption({{"s", "semester"},
                      QCoreApplication::translate("AppConfig", "Semester to show (Autumn, Spring or Annual)"),
                      QCoreApplication::translate("AppConfig", "name")});
    parser.addOption({"enforce-weight-limit",
                      QCoreApplication::translate("AppConfig", "Reject assessment and exam weights above 100%")});
}

bool AppConfig::applyParser(const QCommandLineParser& parser, QString* err) {
    bool ok = true;
    QStringList problems;

    if (parser.isSet("data-dir")) {
        const QString dir = parser.value("data-dir").trimmed();
        if (dir.isEmpty()) { ok = false; problems << QStringLiteral("--data-dir is empty"); }
        else dataDir = dir;
    }
    if (parser.isSet("year")) {
        bool okYear = false;
        const int y = parser.value("year").toInt(&okYear);
        if (!okYear || y < 1900 || y > 9999) {
            ok = false;
            problems << QStringLiteral("invalid --year '%1'").arg(parser.value("year"));
            qCWarning(lcConfig) << "año inválido" << parser.value("year");
        } else {
            year = y;
        }
    }
    if (parser.isSet("semester")) {
        const SemesterRef ref = resolveSemester(parser.value("semester"));
        if (!ref.isResolved()) {
            ok = false;
            problems << QStringLiteral("unknown --semester '%1'").arg(parser.value("semester"));
            qCWarning(lcConfig) << "semestre desconocido" << parser.value("semester");
        } else {
            semester = semesterName(ref.semester);
        }
    }
    if (parser.isSet("enforce-weight-limit")) enforceWeightLimit = true;

    if (!ok && err) *err = problems.join("; ");
    return ok;
}

int AppConfig::effectiveYear() const {
    return year > 0 ? year : QDate::currentDate().year();
}
