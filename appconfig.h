#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QString>

class QSettings;
class QCommandLineParser;

/**
 * Configuración de la aplicación. Orden de carga:
 * valores por defecto -> QSettings -> línea de comandos.
 */
struct AppConfig {
    QString dataDir = QStringLiteral("data"); // un <año>.json por año
    int     year = 0;                         // 0 => año actual
    QString semester;                         // semestre preferido (puede ir vacío)
    bool    enforceWeightLimit = false;

    static const char* organizationName();
    static const char* applicationName();

    void loadSettings(const QSettings& s);
    void saveSettings(QSettings& s) const;
    // Solo año y semestre: lo que viene de la línea de comandos no se persiste
    void saveSession(QSettings& s) const;

    static void configureParser(QCommandLineParser& parser);
    // false si algún valor no es válido (el resto se aplica igual)
    bool applyParser(const QCommandLineParser& parser, QString* err = nullptr);

    int effectiveYear() const; // year o el año actual
};

#endif // APPCONFIG_H
