#include "services/governance/governance_service.h"
#include "core/engine/governance_engine.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>

#include <cstdio>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("verdict-engine"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Governance decision engine speaking newline-delimited JSON on stdin/stdout"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Settings file."),
                                          QStringLiteral("path"));
    const QCommandLineOption dataDirOption(QStringLiteral("data-dir"),
                                           QStringLiteral("Directory for the database and models."),
                                           QStringLiteral("path"));
    const QCommandLineOption writeConfigOption(QStringLiteral("write-default-config"),
                                               QStringLiteral("Write the effective settings and exit."));
    parser.addOption(configOption);
    parser.addOption(dataDirOption);
    parser.addOption(writeConfigOption);
    parser.process(app);

    const QString configPath = parser.isSet(configOption)
        ? parser.value(configOption)
        : vd::SettingsManager::settingsFilePath();

    vd::EngineSettings settings;
    if (std::optional<vd::EngineSettings> loaded = vd::SettingsManager::load(configPath)) {
        settings = *loaded;
        LOG_INFO(vdService, "Loaded settings from %s", qUtf8Printable(configPath));
    } else {
        LOG_INFO(vdService, "Using default settings (%s not loaded)", qUtf8Printable(configPath));
    }
    vd::SettingsManager::resolvePaths(&settings);
    // The command line wins over $VERDICT_DATA_DIR and the settings file.
    if (parser.isSet(dataDirOption)) {
        const QDir dataDir(parser.value(dataDirOption));
        settings.dataDir = dataDir.absolutePath();
        settings.dbPath = dataDir.filePath(QStringLiteral("verdict.db"));
        settings.modelsDir = dataDir.filePath(QStringLiteral("models"));
    }

    if (parser.isSet(writeConfigOption)) {
        return vd::SettingsManager::save(settings, configPath) ? 0 : 1;
    }

    vd::GovernanceEngine engine(settings);
    QString error;
    if (!engine.initialize(&error)) {
        std::fprintf(stderr, "verdict-engine: %s\n", qUtf8Printable(error));
        return 1;
    }

    vd::GovernanceService service(&engine);
    QObject::connect(&service, &vd::GovernanceService::inputClosed, &app, &QCoreApplication::quit);
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&service, &engine]() {
        service.stop();
        engine.shutdown();
    });
    service.start();

    return app.exec();
}
