#pragma once

#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtSql/QSqlDatabase>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include "TaskStore.hpp"

namespace Sluice {

class SqliteTaskStore : public QObject, public TaskStore {
    Q_OBJECT

public:
    explicit SqliteTaskStore(QObject* parent = nullptr);
    ~SqliteTaskStore() override;

    Expected<void, StorageError> initialize(const QString& databasePath);
    void close();
    bool isOpen() const;
    int schemaVersion() const;

    Expected<void, StorageError> save(const TaskSnapshot& snapshot) override;
    Expected<void, StorageError> remove(TaskId id) override;
    Expected<QList<TaskSnapshot>, StorageError> loadIncomplete() override;

signals:
    void databaseError(Sluice::StorageError error, const QString& message);

private:
    Expected<void, StorageError> openDatabase(const QString& path);
    Expected<void, StorageError> createTables();
    Expected<void, StorageError> validateSchema();
    Expected<void, StorageError> executeQuery(QSqlQuery& query);
    Expected<TaskSnapshot, StorageError> snapshotFromQuery(const QSqlQuery& query) const;
    StorageError mapSqlError(const QSqlError& error) const;

    static constexpr int CURRENT_SCHEMA_VERSION = 1;

    mutable QMutex databaseMutex_;
    QSqlDatabase database_;
    QString connectionName_;
};

} // namespace Sluice
