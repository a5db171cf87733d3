#pragma once

#include <QtCore/QHash>
#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <chrono>
#include <memory>
#include "Expected.hpp"

namespace Sluice {

enum class ConfigError {
    NegativeLimit,
    CategoryLimitExceedsTotal,
    TotalExceedsCategorySum,
    InvalidStatusInterval,
    InvalidStatusLimit,
    InvalidConsecutiveChecks,
    InvalidPressureMarks,
    NegativeDuration,
    InvalidEngineSettings
};

QString toString(ConfigError error);

class Config {
public:
    static Config& instance();

    // Native settings store for organization/application
    void initialize(const QString& organizationName = "Sluice",
                   const QString& applicationName = "sluiced");
    // INI file, used by the daemon's --config option and by tests
    void initializeFromFile(const QString& iniPath);

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    qint64 getInt64(const QString& key, qint64 defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;

    // A limit of 0 means unlimited throughout
    struct QueueSettings {
        int limitAll = 0;
        int limitDownload = 0;
        int limitUpload = 0;
        int userMaxTasks = 0;
        int botMaxTasks = 0;
        std::chrono::seconds userTimeInterval{0};
        int dailyTaskLimit = 0;
        qint64 dailyDownloadLimitBytes = 0;
        qint64 dailyUploadLimitBytes = 0;
        QHash<QString, qint64> sizeLimitBytes;  // per engine kind
    };

    struct StatusSettings {
        std::chrono::seconds updateInterval{3};
        int limit = 10;
    };

    struct MonitorSettings {
        bool enabled = true;
        std::chrono::seconds interval{60};
        qint64 speedThresholdBps = 50 * 1024;
        int consecutiveChecks = 20;
        std::chrono::seconds elapsedThreshold{3600};
        std::chrono::seconds waitTime{600};
        std::chrono::seconds etaThreshold{86400};
        std::chrono::seconds completionThreshold{86400};
        int cpuHigh = 90;
        int cpuLow = 60;
        int memoryHigh = 75;
        int memoryLow = 60;
    };

    struct EngineSettings {
        int startRetries = 3;
        std::chrono::milliseconds startBackoff{500};
        std::chrono::milliseconds startTimeout{10000};
        std::chrono::milliseconds progressTimeout{5000};
        std::chrono::milliseconds cancelAckTimeout{3000};
        int maxProgressFailures = 5;
        int pollConcurrency = 8;
    };

    struct TorrentSettings {
        QString downloadPath;
        int maxConnections = 100;
        int uploadRateLimit = -1;  // -1 = unlimited
        int downloadRateLimit = -1;
        bool enableDHT = true;
    };

    struct StorageSettings {
        QString databasePath;
    };

    struct LoggingSettings {
        QString filePath;
        QString level = "info";
    };

    struct OrchestratorSettings {
        QueueSettings queue;
        StatusSettings status;
        MonitorSettings monitor;
        EngineSettings engine;
    };

    QueueSettings getQueueSettings() const;
    StatusSettings getStatusSettings() const;
    MonitorSettings getMonitorSettings() const;
    EngineSettings getEngineSettings() const;
    TorrentSettings getTorrentSettings() const;
    StorageSettings getStorageSettings() const;
    LoggingSettings getLoggingSettings() const;
    OrchestratorSettings getOrchestratorSettings() const;

    void setQueueSettings(const QueueSettings& settings);

    static Expected<void, ConfigError> validate(const OrchestratorSettings& settings);

    QString getDataPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
};

} // namespace Sluice
