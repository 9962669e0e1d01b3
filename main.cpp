#include <QApplication>
#include <QCommandLineParser>
#include <QFont>
#include <QSettings>
#include "appconfig.h"
#include "mainwindow.h"
#include "markslog.h"

int main(int argc, char* argv[]) {
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    QGuiApplication::setHighDpiScaleFactorRoundingPolicy(
        Qt::HighDpiScaleFactorRoundingPolicy::PassThrough);
#else
    QApplication::setAttribute(Qt::AA_EnableHighDpiScaling);
    QApplication::setAttribute(Qt::AA_UseHighDpiPixmaps);
#endif

    QApplication app(argc, argv);
    QApplication::setOrganizationName(AppConfig::organizationName());
    QApplication::setApplicationName(AppConfig::applicationName());
    QApplication::setApplicationVersion(QStringLiteral(MARKSMANAGER_VERSION));

#ifdef Q_OS_WIN
    // Estilo estable (evita rarezas de tema claro/oscuro del SO)
    QApplication::setStyle("Fusion");
    qApp->setFont(QFont("Segoe UI", 9));
#endif

    // Defaults -> QSettings -> línea de comandos
    AppConfig config;
    {
        QSettings settings(AppConfig::organizationName(), AppConfig::applicationName());
        config.loadSettings(settings);
    }
    QCommandLineParser parser;
    AppConfig::configureParser(parser);
    parser.process(app);
    QString err;
    if (!config.applyParser(parser, &err))
        qCWarning(lcConfig) << "opciones ignoradas:" << err;

    MainWindow w(config);
    w.resize(1500, 900);
    w.show();
    return app.exec();
}
