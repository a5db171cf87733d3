#include "SqliteTaskStore.hpp"
#include "../common/Logger.hpp"
#include "../common/RetryManager.hpp"
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QMutexLocker>
#include <QtCore/QStringList>

namespace Sluice {

namespace {

const char* const kUpsertTask = R"(
    INSERT OR REPLACE INTO tasks (id, owner_id, chat_ref, category, kind, name, source,
                                  destination, options, phase, size_bytes, transferred_bytes,
                                  speed_bps, eta_seconds, created_at, admitted_at,
                                  last_progress_at, retry_count, priority, error, cancel_reason)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
)";

const char* const kSelectIncomplete = R"(
    SELECT id, owner_id, chat_ref, category, kind, name, source, destination, options, phase,
           size_bytes, transferred_bytes, speed_bps, eta_seconds, created_at, admitted_at,
           last_progress_at, retry_count, priority, error, cancel_reason
    FROM tasks WHERE phase IN ('Queued', 'Active', 'Stalled')
    ORDER BY created_at ASC, id ASC
)";

QVariant timeValue(const QDateTime& time) {
    return time.isValid() ? QVariant(time.toMSecsSinceEpoch()) : QVariant();
}

QDateTime timeFromValue(const QVariant& value) {
    if (value.isNull()) {
        return QDateTime();
    }
    return QDateTime::fromMSecsSinceEpoch(value.toLongLong()).toUTC();
}

} // namespace

QString toString(StorageError error) {
    switch (error) {
        case StorageError::DatabaseNotOpen: return QStringLiteral("database not open");
        case StorageError::ConnectionFailed: return QStringLiteral("database connection failed");
        case StorageError::QueryFailed: return QStringLiteral("query failed");
        case StorageError::InvalidData: return QStringLiteral("invalid stored data");
        case StorageError::ConstraintViolation: return QStringLiteral("constraint violation");
        case StorageError::TransactionFailed: return QStringLiteral("transaction failed");
        case StorageError::MigrationFailed: return QStringLiteral("schema migration failed");
    }
    return QStringLiteral("unknown storage error");
}

SqliteTaskStore::SqliteTaskStore(QObject* parent)
    : QObject(parent)
    , connectionName_(QString("SluiceDB_%1_%2").arg(QDateTime::currentMSecsSinceEpoch())
                          .arg(reinterpret_cast<quintptr>(this), 0, 16)) {
}

SqliteTaskStore::~SqliteTaskStore() {
    close();
}

Expected<void, StorageError> SqliteTaskStore::initialize(const QString& databasePath) {
    QMutexLocker locker(&databaseMutex_);

    const QString directory = QFileInfo(databasePath).absolutePath();
    if (!QDir().mkpath(directory)) {
        SLUICE_WARN("Failed to create database directory: {}", directory.toStdString());
    }

    RetryManager retry(RetryConfigs::database());
    auto opened = retry.execute<void, StorageError>(
        [this, databasePath]() { return openDatabase(databasePath); },
        [](const StorageError& error) { return error == StorageError::ConnectionFailed; });
    if (opened.hasError()) {
        SLUICE_ERROR("Could not open task database {}: {}", databasePath.toStdString(),
                     toString(opened.error()).toStdString());
        emit databaseError(StorageError::ConnectionFailed, toString(opened.error()));
        return makeUnexpected(StorageError::ConnectionFailed);
    }

    QSqlQuery config(database_);
    for (const char* pragma : {"PRAGMA journal_mode = WAL", "PRAGMA synchronous = NORMAL"}) {
        if (!config.exec(pragma)) {
            SLUICE_WARN("{} failed: {}", pragma, config.lastError().text().toStdString());
        }
    }

    auto created = createTables();
    if (created.hasError()) {
        return created;
    }

    auto validated = validateSchema();
    if (validated.hasError()) {
        return validated;
    }

    SLUICE_INFO("Task database initialized: {}", databasePath.toStdString());
    return {};
}

Expected<void, StorageError> SqliteTaskStore::openDatabase(const QString& path) {
    if (database_.isOpen()) {
        database_.close();
    }
    if (!QSqlDatabase::contains(connectionName_)) {
        database_ = QSqlDatabase::addDatabase("QSQLITE", connectionName_);
    }
    database_.setDatabaseName(path);

    if (!database_.open()) {
        SLUICE_WARN("Failed to open database: {}", database_.lastError().text().toStdString());
        return makeUnexpected(StorageError::ConnectionFailed);
    }
    return {};
}

void SqliteTaskStore::close() {
    QMutexLocker locker(&databaseMutex_);

    if (database_.isOpen()) {
        database_.close();
    }

    // Release reference to the connection
    database_ = QSqlDatabase();
    if (QSqlDatabase::contains(connectionName_)) {
        QSqlDatabase::removeDatabase(connectionName_);
    }
}

bool SqliteTaskStore::isOpen() const {
    QMutexLocker locker(&databaseMutex_);
    return database_.isOpen();
}

int SqliteTaskStore::schemaVersion() const {
    QMutexLocker locker(&databaseMutex_);
    if (!database_.isOpen()) {
        return 0;
    }
    QSqlQuery query(database_);
    if (!query.exec("SELECT MAX(version) FROM schema_version") || !query.next()) {
        return 0;
    }
    return query.value(0).toInt();
}

Expected<void, StorageError> SqliteTaskStore::save(const TaskSnapshot& snapshot) {
    QMutexLocker locker(&databaseMutex_);
    if (!database_.isOpen()) {
        return makeUnexpected(StorageError::DatabaseNotOpen);
    }

    QSqlQuery query(database_);
    if (!query.prepare(kUpsertTask)) {
        SLUICE_ERROR("Failed to prepare query: {}", query.lastError().text().toStdString());
        return makeUnexpected(StorageError::QueryFailed);
    }

    const QByteArray options = QJsonDocument(QJsonObject::fromVariantMap(snapshot.options))
                                   .toJson(QJsonDocument::Compact);

    query.addBindValue(static_cast<qint64>(snapshot.id));
    query.addBindValue(snapshot.ownerId);
    query.addBindValue(snapshot.chatRef);
    query.addBindValue(toString(snapshot.category));
    query.addBindValue(snapshot.kind);
    query.addBindValue(snapshot.name);
    query.addBindValue(snapshot.source);
    query.addBindValue(snapshot.destination);
    query.addBindValue(QString::fromUtf8(options));
    query.addBindValue(toString(snapshot.phase));
    query.addBindValue(snapshot.sizeBytes ? QVariant(*snapshot.sizeBytes) : QVariant());
    query.addBindValue(snapshot.transferredBytes);
    query.addBindValue(snapshot.speedBps);
    query.addBindValue(snapshot.etaSeconds);
    query.addBindValue(timeValue(snapshot.createdAt));
    query.addBindValue(timeValue(snapshot.admittedAt));
    query.addBindValue(timeValue(snapshot.lastProgressAt));
    query.addBindValue(snapshot.retryCount);
    query.addBindValue(snapshot.priority);
    query.addBindValue(snapshot.error);
    query.addBindValue(snapshot.cancelReason ? QVariant(toString(*snapshot.cancelReason)) : QVariant());

    return executeQuery(query);
}

Expected<void, StorageError> SqliteTaskStore::remove(TaskId id) {
    QMutexLocker locker(&databaseMutex_);
    if (!database_.isOpen()) {
        return makeUnexpected(StorageError::DatabaseNotOpen);
    }

    QSqlQuery query(database_);
    if (!query.prepare("DELETE FROM tasks WHERE id = ?")) {
        SLUICE_ERROR("Failed to prepare query: {}", query.lastError().text().toStdString());
        return makeUnexpected(StorageError::QueryFailed);
    }
    query.addBindValue(static_cast<qint64>(id));
    return executeQuery(query);
}

Expected<QList<TaskSnapshot>, StorageError> SqliteTaskStore::loadIncomplete() {
    QMutexLocker locker(&databaseMutex_);
    if (!database_.isOpen()) {
        return makeUnexpected(StorageError::DatabaseNotOpen);
    }

    QSqlQuery query(database_);
    if (!query.exec(kSelectIncomplete)) {
        SLUICE_ERROR("Query execution failed: {}", query.lastError().text().toStdString());
        return makeUnexpected(mapSqlError(query.lastError()));
    }

    QList<TaskSnapshot> snapshots;
    while (query.next()) {
        auto snapshot = snapshotFromQuery(query);
        if (snapshot.hasError()) {
            SLUICE_WARN("Skipping unreadable task row {}", query.value(0).toULongLong());
            continue;
        }
        snapshots.append(snapshot.value());
    }
    return snapshots;
}

Expected<void, StorageError> SqliteTaskStore::createTables() {
    const QStringList createStatements = {
        R"(CREATE TABLE IF NOT EXISTS tasks (
            id INTEGER PRIMARY KEY CHECK(id > 0),
            owner_id TEXT NOT NULL,
            chat_ref TEXT NOT NULL DEFAULT '',
            category TEXT NOT NULL CHECK(category IN ('Download', 'Upload')),
            kind TEXT NOT NULL CHECK(length(trim(kind)) > 0),
            name TEXT NOT NULL DEFAULT '',
            source TEXT NOT NULL DEFAULT '',
            destination TEXT NOT NULL DEFAULT '',
            options TEXT NOT NULL DEFAULT '{}',
            phase TEXT NOT NULL CHECK(phase IN ('Queued', 'Active', 'Stalled', 'Completed', 'Failed', 'Cancelled')),
            size_bytes INTEGER CHECK(size_bytes IS NULL OR size_bytes >= 0),
            transferred_bytes INTEGER NOT NULL DEFAULT 0 CHECK(transferred_bytes >= 0),
            speed_bps INTEGER NOT NULL DEFAULT 0,
            eta_seconds INTEGER NOT NULL DEFAULT -1,
            created_at INTEGER NOT NULL,
            admitted_at INTEGER,
            last_progress_at INTEGER,
            retry_count INTEGER NOT NULL DEFAULT 0,
            priority INTEGER NOT NULL DEFAULT 0,
            error TEXT NOT NULL DEFAULT '',
            cancel_reason TEXT
        ))",
        "CREATE INDEX IF NOT EXISTS idx_tasks_phase ON tasks(phase)",
        "CREATE INDEX IF NOT EXISTS idx_tasks_created ON tasks(created_at, id)",
        R"(CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY,
            applied_at INTEGER NOT NULL
        ))"
    };

    for (const QString& statement : createStatements) {
        QSqlQuery query(database_);
        if (!query.exec(statement)) {
            SLUICE_ERROR("Failed to create schema: {}", query.lastError().text().toStdString());
            return makeUnexpected(StorageError::MigrationFailed);
        }
    }

    QSqlQuery version(database_);
    version.prepare(QStringLiteral("INSERT OR IGNORE INTO schema_version (version, applied_at) VALUES (?, ?)"));
    version.addBindValue(CURRENT_SCHEMA_VERSION);
    version.addBindValue(QDateTime::currentMSecsSinceEpoch());
    if (!version.exec()) {
        SLUICE_ERROR("Failed to record schema version: {}", version.lastError().text().toStdString());
        return makeUnexpected(StorageError::MigrationFailed);
    }
    return {};
}

Expected<void, StorageError> SqliteTaskStore::validateSchema() {
    QSqlQuery query(database_);
    if (!query.exec("SELECT MAX(version) FROM schema_version") || !query.next()) {
        return makeUnexpected(StorageError::QueryFailed);
    }
    const int version = query.value(0).toInt();
    if (version > CURRENT_SCHEMA_VERSION) {
        SLUICE_ERROR("Database schema version {} is newer than supported version {}", version,
                     CURRENT_SCHEMA_VERSION);
        return makeUnexpected(StorageError::MigrationFailed);
    }
    return {};
}

Expected<void, StorageError> SqliteTaskStore::executeQuery(QSqlQuery& query) {
    if (!query.exec()) {
        SLUICE_ERROR("Query execution failed: {}", query.lastError().text().toStdString());
        const StorageError error = mapSqlError(query.lastError());
        emit databaseError(error, query.lastError().text());
        return makeUnexpected(error);
    }
    return {};
}

Expected<TaskSnapshot, StorageError> SqliteTaskStore::snapshotFromQuery(const QSqlQuery& query) const {
    TaskSnapshot snapshot;
    snapshot.id = query.value(0).toULongLong();
    snapshot.ownerId = query.value(1).toString();
    snapshot.chatRef = query.value(2).toString();

    const auto category = categoryFromString(query.value(3).toString());
    const auto phase = phaseFromString(query.value(9).toString());
    if (snapshot.id == 0 || !category || !phase) {
        return makeUnexpected(StorageError::InvalidData);
    }
    snapshot.category = *category;
    snapshot.phase = *phase;

    snapshot.kind = query.value(4).toString();
    snapshot.name = query.value(5).toString();
    snapshot.source = query.value(6).toString();
    snapshot.destination = query.value(7).toString();

    QJsonParseError parseError;
    const QJsonDocument options = QJsonDocument::fromJson(query.value(8).toString().toUtf8(), &parseError);
    if (parseError.error == QJsonParseError::NoError && options.isObject()) {
        snapshot.options = options.object().toVariantMap();
    }

    if (!query.value(10).isNull()) {
        snapshot.sizeBytes = query.value(10).toLongLong();
    }
    snapshot.transferredBytes = query.value(11).toLongLong();
    snapshot.speedBps = query.value(12).toLongLong();
    snapshot.etaSeconds = query.value(13).toLongLong();
    snapshot.createdAt = timeFromValue(query.value(14));
    snapshot.admittedAt = timeFromValue(query.value(15));
    snapshot.lastProgressAt = timeFromValue(query.value(16));
    snapshot.retryCount = query.value(17).toInt();
    snapshot.priority = query.value(18).toInt();
    snapshot.error = query.value(19).toString();
    if (!query.value(20).isNull()) {
        snapshot.cancelReason = cancelReasonFromString(query.value(20).toString());
    }
    return snapshot;
}

StorageError SqliteTaskStore::mapSqlError(const QSqlError& error) const {
    const QString errorText = error.text().toLower();
    if (errorText.contains("constraint")) {
        return StorageError::ConstraintViolation;
    }

    switch (error.type()) {
        case QSqlError::ConnectionError:
            return StorageError::ConnectionFailed;
        case QSqlError::TransactionError:
            return StorageError::TransactionFailed;
        case QSqlError::StatementError:
        case QSqlError::UnknownError:
        default:
            return StorageError::QueryFailed;
    }
}

} // namespace Sluice
