#pragma once

#include "core/learning/snapshot_backend.h"

#include <QString>

#include <memory>
#include <mutex>

struct sqlite3;

namespace ci {

// SqliteSnapshotBackend -- SQLite-backed snapshot log.
//
// Tables:
//   model_versions(version_id PK, sequence UNIQUE, created_at, payload)
//   model_state(key PK, value)       -- holds 'current_version'
//
// Rows in model_versions are never updated or deleted.
class SqliteSnapshotBackend : public SnapshotBackend {
public:
    ~SqliteSnapshotBackend() override;

    SqliteSnapshotBackend(const SqliteSnapshotBackend&) = delete;
    SqliteSnapshotBackend& operator=(const SqliteSnapshotBackend&) = delete;

    // Open or create the database at dbPath and make sure the schema exists.
    static std::unique_ptr<SqliteSnapshotBackend> open(const QString& dbPath,
                                                       QString* errorOut = nullptr);

    bool append(const SnapshotRecord& record, bool makeCurrent, QString* errorOut) override;
    std::optional<QVector<SnapshotRecord>> listVersions(QString* errorOut) const override;
    std::optional<SnapshotRecord> read(const QString& versionId, QString* errorOut) const override;
    bool setCurrent(const QString& versionId, QString* errorOut) override;
    std::optional<QString> current(QString* errorOut) const override;

    // Exposed for tests and maintenance tooling.
    sqlite3* rawDb() const { return m_db; }

private:
    SqliteSnapshotBackend() = default;

    bool init(const QString& dbPath, QString* errorOut);
    bool execSql(const char* sql, QString* errorOut) const;
    void rollbackTransaction() const;
    bool setCurrentUnlocked(const QString& versionId, QString* errorOut);
    QString lastError() const;

    sqlite3* m_db = nullptr;
    mutable std::mutex m_mutex;
};

} // namespace ci
