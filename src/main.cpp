#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFileInfo>
#include <signal.h>
#include <memory>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/common/SignalWatcher.hpp"
#include "core/monitor/ResourceSampler.hpp"
#include "core/storage/SqliteTaskStore.hpp"
#include "core/tasks/TaskOrchestrator.hpp"
#include "core/torrent/TorrentAdapter.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("sluiced");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Sluice");

    QCommandLineParser parser;
    parser.setApplicationDescription("Concurrency-limited transfer task daemon");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{"c", "config"}, "Read settings from INI <file>.", "file");
    QCommandLineOption databaseOption(QStringList{"d", "database"}, "Task database <file>.", "file");
    QCommandLineOption logLevelOption(QStringList{"l", "log-level"},
                                      "trace, debug, info, warn, error or critical.", "level");
    parser.addOption(configOption);
    parser.addOption(databaseOption);
    parser.addOption(logLevelOption);
    parser.process(app);

    auto& config = Sluice::Config::instance();
    if (parser.isSet(configOption)) {
        const QString path = parser.value(configOption);
        if (!QFileInfo::exists(path)) {
            Sluice::Logger::instance().critical("Configuration file not found: {}", path.toStdString());
            return 1;
        }
        config.initializeFromFile(path);
    } else {
        config.initialize();
    }

    const auto logging = config.getLoggingSettings();
    const QString levelName = parser.isSet(logLevelOption) ? parser.value(logLevelOption) : logging.level;
    const auto level = Sluice::Logger::parseLevel(levelName.toStdString());
    if (!level) {
        Sluice::Logger::instance().critical("Unknown log level: {}", levelName.toStdString());
        return 1;
    }
    Sluice::Logger::instance().initialize(logging.filePath.toStdString(), *level);
    SLUICE_INFO("Starting sluiced v{}", app.applicationVersion().toStdString());

    const auto settings = config.getOrchestratorSettings();
    auto valid = Sluice::Config::validate(settings);
    if (valid.hasError()) {
        SLUICE_CRITICAL("Invalid configuration: {}", Sluice::toString(valid.error()).toStdString());
        return 1;
    }

    Sluice::SqliteTaskStore store;
    const QString databasePath = parser.isSet(databaseOption)
        ? parser.value(databaseOption)
        : config.getStorageSettings().databasePath;
    auto opened = store.initialize(databasePath);
    if (opened.hasError()) {
        SLUICE_CRITICAL("Cannot open task database: {}", Sluice::toString(opened.error()).toStdString());
        return 1;
    }

    Sluice::TaskOrchestrator orchestrator(settings, &store,
                                          std::make_shared<Sluice::SystemResourceSampler>());
    orchestrator.registerEngine(std::make_shared<Sluice::TorrentAdapter>(config.getTorrentSettings()));

    QObject::connect(&orchestrator, &Sluice::TaskOrchestrator::statusEvent,
                     [](const Sluice::StatusEvent& event) {
                         SLUICE_INFO("[{}] task {} {}: {}", Sluice::toString(event.type).toStdString(),
                                     event.taskId, Sluice::toString(event.phase).toStdString(),
                                     event.message.toStdString());
                     });

    auto restored = orchestrator.restoreIncomplete();
    if (restored.hasError()) {
        SLUICE_ERROR("Continuing without restored tasks: {}", Sluice::toString(restored.error()).toStdString());
    }

    Sluice::SignalWatcher signalWatcher;
    auto watching = signalWatcher.watch({SIGINT, SIGTERM});
    if (watching.hasError()) {
        SLUICE_CRITICAL("Cannot watch termination signals: {}", Sluice::toString(watching.error()).toStdString());
        return 1;
    }
    QObject::connect(&signalWatcher, &Sluice::SignalWatcher::terminationRequested, &app,
                     [](int) { QCoreApplication::quit(); });
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&orchestrator]() {
        SLUICE_INFO("Shutting down");
        orchestrator.stop();
    });

    orchestrator.start();
    return app.exec();
}
