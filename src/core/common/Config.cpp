#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <algorithm>

namespace Sluice {

QString toString(ConfigError error) {
    switch (error) {
        case ConfigError::NegativeLimit: return QStringLiteral("queue limits must not be negative");
        case ConfigError::CategoryLimitExceedsTotal:
            return QStringLiteral("limit_all must be at least max(limit_download, limit_upload)");
        case ConfigError::TotalExceedsCategorySum:
            return QStringLiteral("limit_all must not exceed limit_download + limit_upload");
        case ConfigError::InvalidStatusInterval: return QStringLiteral("status update interval must be at least 2 seconds");
        case ConfigError::InvalidStatusLimit: return QStringLiteral("status limit must be at least 1");
        case ConfigError::InvalidConsecutiveChecks: return QStringLiteral("consecutive_checks must be at least 1");
        case ConfigError::InvalidPressureMarks:
            return QStringLiteral("pressure marks must lie within 0..100 with low below high");
        case ConfigError::NegativeDuration: return QStringLiteral("durations must not be negative");
        case ConfigError::InvalidEngineSettings: return QStringLiteral("engine call settings are out of range");
    }
    return QStringLiteral("unknown configuration error");
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    SLUICE_INFO("Config initialized for {}/{}",
                organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    SLUICE_INFO("Config initialized from {}", iniPath.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

qint64 Config::getInt64(const QString& key, qint64 defaultValue) const {
    return getValue(key, defaultValue).toLongLong();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

double Config::getDouble(const QString& key, double defaultValue) const {
    return getValue(key, defaultValue).toDouble();
}

Config::QueueSettings Config::getQueueSettings() const {
    QueueSettings settings;
    settings.limitAll = getInt("queue/limit_all", 0);
    settings.limitDownload = getInt("queue/limit_download", 0);
    settings.limitUpload = getInt("queue/limit_upload", 0);
    settings.userMaxTasks = getInt("queue/user_max_tasks", 0);
    settings.botMaxTasks = getInt("queue/bot_max_tasks", 0);
    settings.userTimeInterval = std::chrono::seconds(getInt("queue/user_time_interval", 0));
    settings.dailyTaskLimit = getInt("queue/daily_task_limit", 0);
    settings.dailyDownloadLimitBytes = getInt64("queue/daily_download_limit_bytes", 0);
    settings.dailyUploadLimitBytes = getInt64("queue/daily_upload_limit_bytes", 0);

    if (settings_) {
        settings_->beginGroup("queue/size_limit");
        const QStringList kinds = settings_->childKeys();
        for (const QString& kind : kinds) {
            settings.sizeLimitBytes.insert(kind, settings_->value(kind).toLongLong());
        }
        settings_->endGroup();
    }
    return settings;
}

Config::StatusSettings Config::getStatusSettings() const {
    StatusSettings settings;
    settings.updateInterval = std::chrono::seconds(getInt("status/update_interval", 3));
    settings.limit = getInt("status/limit", 10);
    return settings;
}

Config::MonitorSettings Config::getMonitorSettings() const {
    MonitorSettings settings;
    settings.enabled = getBool("monitor/enabled", true);
    settings.interval = std::chrono::seconds(getInt("monitor/interval", 60));
    // Configured in KiB/s
    settings.speedThresholdBps = getInt64("monitor/speed_threshold", 50) * 1024;
    settings.consecutiveChecks = getInt("monitor/consecutive_checks", 20);
    settings.elapsedThreshold = std::chrono::seconds(getInt("monitor/elapsed_threshold", 3600));
    settings.waitTime = std::chrono::seconds(getInt("monitor/wait_time", 600));
    settings.etaThreshold = std::chrono::seconds(getInt("monitor/eta_threshold", 86400));
    settings.completionThreshold = std::chrono::seconds(getInt("monitor/completion_threshold", 86400));
    settings.cpuHigh = getInt("monitor/cpu_high", 90);
    settings.cpuLow = getInt("monitor/cpu_low", 60);
    settings.memoryHigh = getInt("monitor/memory_high", 75);
    settings.memoryLow = getInt("monitor/memory_low", 60);
    return settings;
}

Config::EngineSettings Config::getEngineSettings() const {
    EngineSettings settings;
    settings.startRetries = getInt("engine/start_retries", 3);
    settings.startBackoff = std::chrono::milliseconds(getInt("engine/start_backoff_ms", 500));
    settings.startTimeout = std::chrono::milliseconds(getInt("engine/start_timeout_ms", 10000));
    settings.progressTimeout = std::chrono::milliseconds(getInt("engine/progress_timeout_ms", 5000));
    settings.cancelAckTimeout = std::chrono::milliseconds(getInt("engine/cancel_ack_timeout_ms", 3000));
    settings.maxProgressFailures = getInt("engine/max_progress_failures", 5);
    settings.pollConcurrency = getInt("engine/poll_concurrency", 8);
    return settings;
}

Config::TorrentSettings Config::getTorrentSettings() const {
    TorrentSettings settings;
    settings.downloadPath = getString("torrent/download_path",
        QStandardPaths::writableLocation(QStandardPaths::DownloadLocation));
    settings.maxConnections = getInt("torrent/max_connections", 100);
    settings.uploadRateLimit = getInt("torrent/upload_rate_limit", -1);
    settings.downloadRateLimit = getInt("torrent/download_rate_limit", -1);
    settings.enableDHT = getBool("torrent/enable_dht", true);
    return settings;
}

Config::StorageSettings Config::getStorageSettings() const {
    StorageSettings settings;
    settings.databasePath = getString("storage/database_path", getDataPath() + "/sluice.db");
    return settings;
}

Config::LoggingSettings Config::getLoggingSettings() const {
    LoggingSettings settings;
    settings.filePath = getString("logging/file", getDataPath() + "/sluiced.log");
    settings.level = getString("logging/level", "info");
    return settings;
}

Config::OrchestratorSettings Config::getOrchestratorSettings() const {
    OrchestratorSettings settings;
    settings.queue = getQueueSettings();
    settings.status = getStatusSettings();
    settings.monitor = getMonitorSettings();
    settings.engine = getEngineSettings();
    return settings;
}

void Config::setQueueSettings(const QueueSettings& settings) {
    setValue("queue/limit_all", settings.limitAll);
    setValue("queue/limit_download", settings.limitDownload);
    setValue("queue/limit_upload", settings.limitUpload);
    setValue("queue/user_max_tasks", settings.userMaxTasks);
    setValue("queue/bot_max_tasks", settings.botMaxTasks);
    setValue("queue/user_time_interval", static_cast<int>(settings.userTimeInterval.count()));
    setValue("queue/daily_task_limit", settings.dailyTaskLimit);
    setValue("queue/daily_download_limit_bytes", settings.dailyDownloadLimitBytes);
    setValue("queue/daily_upload_limit_bytes", settings.dailyUploadLimitBytes);
    for (auto it = settings.sizeLimitBytes.constBegin(); it != settings.sizeLimitBytes.constEnd(); ++it) {
        setValue("queue/size_limit/" + it.key(), it.value());
    }
}

Expected<void, ConfigError> Config::validate(const OrchestratorSettings& settings) {
    const QueueSettings& queue = settings.queue;
    if (queue.limitAll < 0 || queue.limitDownload < 0 || queue.limitUpload < 0 ||
        queue.userMaxTasks < 0 || queue.botMaxTasks < 0 || queue.dailyTaskLimit < 0 ||
        queue.dailyDownloadLimitBytes < 0 || queue.dailyUploadLimitBytes < 0) {
        return makeUnexpected(ConfigError::NegativeLimit);
    }
    for (qint64 limit : queue.sizeLimitBytes) {
        if (limit < 0) {
            return makeUnexpected(ConfigError::NegativeLimit);
        }
    }

    // Only finite limits constrain each other
    if (queue.limitAll > 0) {
        if (std::max(queue.limitDownload, queue.limitUpload) > queue.limitAll) {
            return makeUnexpected(ConfigError::CategoryLimitExceedsTotal);
        }
        if (queue.limitDownload > 0 && queue.limitUpload > 0 &&
            queue.limitAll > queue.limitDownload + queue.limitUpload) {
            return makeUnexpected(ConfigError::TotalExceedsCategorySum);
        }
    }

    if (queue.userTimeInterval.count() < 0) {
        return makeUnexpected(ConfigError::NegativeDuration);
    }

    if (settings.status.updateInterval < std::chrono::seconds(2)) {
        return makeUnexpected(ConfigError::InvalidStatusInterval);
    }
    if (settings.status.limit < 1) {
        return makeUnexpected(ConfigError::InvalidStatusLimit);
    }

    const MonitorSettings& monitor = settings.monitor;
    if (monitor.consecutiveChecks < 1) {
        return makeUnexpected(ConfigError::InvalidConsecutiveChecks);
    }
    if (monitor.interval.count() <= 0 || monitor.speedThresholdBps < 0 ||
        monitor.elapsedThreshold.count() < 0 || monitor.waitTime.count() < 0 ||
        monitor.etaThreshold.count() < 0 || monitor.completionThreshold.count() < 0) {
        return makeUnexpected(ConfigError::NegativeDuration);
    }

    auto marksValid = [](int low, int high) {
        if (high == 0) {
            return true;  // pressure check disabled
        }
        return low >= 0 && high <= 100 && low < high;
    };
    if (!marksValid(monitor.cpuLow, monitor.cpuHigh) ||
        !marksValid(monitor.memoryLow, monitor.memoryHigh)) {
        return makeUnexpected(ConfigError::InvalidPressureMarks);
    }

    const EngineSettings& engine = settings.engine;
    if (engine.startRetries < 0 || engine.startBackoff.count() < 0 ||
        engine.startTimeout.count() <= 0 || engine.progressTimeout.count() <= 0 ||
        engine.cancelAckTimeout.count() <= 0 || engine.maxProgressFailures < 1 ||
        engine.pollConcurrency < 1) {
        return makeUnexpected(ConfigError::InvalidEngineSettings);
    }

    return {};
}

QString Config::getDataPath() const {
    const QString path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir;
    if (!dir.mkpath(path)) {
        SLUICE_WARN("Failed to create directory: {}", path.toStdString());
    }
    return path;
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

} // namespace Sluice
