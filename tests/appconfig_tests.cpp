/*
Configuration: defaults, QSettings round trip and command line overrides.
*/
#include "appconfig.h"
#include "testutil.h"

#include <QCommandLineParser>
#include <QDate>
#include <QDir>
#include <QSettings>
#include <QStringList>
#include <QTemporaryDir>

static int test_defaults(void)
{
    AppConfig config;
    EXPECT(config.dataDir == "data", "default data dir");
    EXPECT(config.year == 0, "no year");
    EXPECT(!config.enforceWeightLimit, "limit off");
    EXPECT(config.effectiveYear() == QDate::currentDate().year(), "current year");
    return 0;
}

static int test_settings_round_trip(void)
{
    QTemporaryDir dir;
    const QString path = QDir(dir.path()).filePath("marks.ini");

    AppConfig saved;
    saved.dataDir = "/tmp/marks";
    saved.year = 2024;
    saved.semester = "Spring";
    saved.enforceWeightLimit = true;
    {
        QSettings s(path, QSettings::IniFormat);
        saved.saveSettings(s);
        s.sync();
        EXPECT(s.status() == QSettings::NoError, "settings written");
    }

    AppConfig loaded;
    QSettings s(path, QSettings::IniFormat);
    loaded.loadSettings(s);
    EXPECT(loaded.dataDir == "/tmp/marks", "data dir");
    EXPECT(loaded.year == 2024, "year");
    EXPECT(loaded.semester == "Spring", "semester");
    EXPECT(loaded.enforceWeightLimit, "limit");
    EXPECT(loaded.effectiveYear() == 2024, "effective year");
    return 0;
}

static int test_command_line_overrides(void)
{
    QCommandLineParser parser;
    AppConfig::configureParser(parser);
    EXPECT(parser.parse({"marksmanager", "--data-dir", "/srv/marks", "-y", "2023",
                         "--semester", " annual ", "--enforce-weight-limit"}), "parse");

    AppConfig config;
    QString err;
    EXPECT(config.applyParser(parser, &err), "apply");
    EXPECT(err.isEmpty(), "no error");
    EXPECT(config.dataDir == "/srv/marks", "data dir");
    EXPECT(config.year == 2023, "year");
    EXPECT(config.semester == "Annual", "canonical semester name");
    EXPECT(config.enforceWeightLimit, "limit");
    return 0;
}

static int test_invalid_options_keep_the_rest(void)
{
    QCommandLineParser parser;
    AppConfig::configureParser(parser);
    EXPECT(parser.parse({"marksmanager", "--year", "20x5", "--semester", "Summer",
                         "--data-dir", "other"}), "parse");

    AppConfig config;
    config.year = 2020;
    QString err;
    EXPECT(!config.applyParser(parser, &err), "rejected");
    EXPECT(err.contains("--year"), "year reported");
    EXPECT(err.contains("--semester"), "semester reported");
    EXPECT(config.year == 2020, "year kept");
    EXPECT(config.semester.isEmpty(), "semester kept");
    EXPECT(config.dataDir == "other", "valid option applied");
    return 0;
}

static int test_session_save_keeps_command_line_out(void)
{
    QTemporaryDir dir;
    const QString path = QDir(dir.path()).filePath("marks.ini");
    {
        QSettings s(path, QSettings::IniFormat);
        AppConfig stored;
        stored.dataDir = "/home/marks";
        stored.saveSettings(s);
    }

    AppConfig config;
    {
        QSettings s(path, QSettings::IniFormat);
        config.loadSettings(s);
    }
    QCommandLineParser parser;
    AppConfig::configureParser(parser);
    EXPECT(parser.parse({"marksmanager", "--data-dir", "/tmp/once", "--enforce-weight-limit",
                         "--year", "2024", "--semester", "spring"}), "parse");
    EXPECT(config.applyParser(parser), "apply");
    EXPECT(config.enforceWeightLimit, "limit on for this run");

    {
        QSettings s(path, QSettings::IniFormat);
        config.saveSession(s);
    }

    QSettings s(path, QSettings::IniFormat);
    EXPECT(s.value("storage/dataDir").toString() == "/home/marks", "data dir not overwritten");
    EXPECT(!s.value("marks/enforceWeightLimit").toBool(), "limit not persisted");
    EXPECT(s.value("session/year").toInt() == 2024, "year persisted");
    EXPECT(s.value("session/semester").toString() == "Spring", "semester persisted");

    AppConfig next;
    next.loadSettings(s);
    EXPECT(!next.enforceWeightLimit, "next start without the limit");
    EXPECT(next.dataDir == "/home/marks", "next start with stored data dir");
    return 0;
}

int main(void)
{
    if (test_defaults() != 0) return 1;
    if (test_settings_round_trip() != 0) return 1;
    if (test_command_line_overrides() != 0) return 1;
    if (test_invalid_options_keep_the_rest() != 0) return 1;
    if (test_session_save_keeps_command_line_out() != 0) return 1;
    return 0;
}
