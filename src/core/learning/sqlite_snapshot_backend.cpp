#include "core/learning/sqlite_snapshot_backend.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

#include <sqlite3.h>

namespace ci {

namespace {

constexpr const char* kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS model_versions (
        version_id TEXT PRIMARY KEY,
        sequence INTEGER NOT NULL UNIQUE,
        created_at REAL NOT NULL,
        payload TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS model_state (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL
    );
)";

constexpr const char* kCurrentVersionKey = "current_version";

void assignError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

SqliteSnapshotBackend::~SqliteSnapshotBackend()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SqliteSnapshotBackend> SqliteSnapshotBackend::open(const QString& dbPath,
                                                                   QString* errorOut)
{
    std::unique_ptr<SqliteSnapshotBackend> backend(new SqliteSnapshotBackend());
    if (!backend->init(dbPath, errorOut)) {
        return nullptr;
    }
    return backend;
}

bool SqliteSnapshotBackend::init(const QString& dbPath, QString* errorOut)
{
    if (dbPath != QLatin1String(":memory:")) {
        const QString parentDir = QFileInfo(dbPath).absolutePath();
        if (!QDir().mkpath(parentDir)) {
            assignError(errorOut, QStringLiteral("cannot create directory %1").arg(parentDir));
            LOG_ERROR(ciStore, "Failed to create snapshot directory: %s", qUtf8Printable(parentDir));
            return false;
        }
    }

    const int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        assignError(errorOut, lastError());
        LOG_ERROR(ciStore, "Failed to open snapshot database %s: %s",
                  qUtf8Printable(dbPath), qUtf8Printable(lastError()));
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql("PRAGMA journal_mode=WAL", errorOut)
        || !execSql("PRAGMA synchronous=NORMAL", errorOut)
        || !execSql(kSchemaSql, errorOut)) {
        LOG_ERROR(ciStore, "Failed to prepare snapshot schema in %s", qUtf8Printable(dbPath));
        return false;
    }

    LOG_INFO(ciStore, "Snapshot database ready: %s", qUtf8Printable(dbPath));
    return true;
}

bool SqliteSnapshotBackend::execSql(const char* sql, QString* errorOut) const
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        LOG_WARN(ciStore, "Snapshot SQL failed: %s", qUtf8Printable(message));
        sqlite3_free(errMsg);
        assignError(errorOut, message);
        return false;
    }
    return true;
}

void SqliteSnapshotBackend::rollbackTransaction() const
{
    execSql("ROLLBACK", nullptr);
}

QString SqliteSnapshotBackend::lastError() const
{
    return m_db ? QString::fromUtf8(sqlite3_errmsg(m_db)) : QStringLiteral("database not open");
}

bool SqliteSnapshotBackend::append(const SnapshotRecord& record, bool makeCurrent, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kInsertSql = R"(
        INSERT INTO model_versions (version_id, sequence, created_at, payload)
        VALUES (?1, ?2, ?3, ?4)
    )";

    if (!execSql("BEGIN IMMEDIATE TRANSACTION", errorOut)) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        assignError(errorOut, lastError());
        rollbackTransaction();
        return false;
    }

    const QByteArray versionUtf8 = record.versionId.toUtf8();
    sqlite3_bind_text(stmt, 1, versionUtf8.constData(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, record.sequence);
    sqlite3_bind_double(stmt, 3, record.createdAt);
    sqlite3_bind_text(stmt, 4, record.payload.constData(), record.payload.size(), SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        assignError(errorOut, lastError());
        LOG_WARN(ciStore, "Snapshot insert failed for %s: %s",
                 qUtf8Printable(record.versionId), qUtf8Printable(lastError()));
        rollbackTransaction();
        return false;
    }

    if (makeCurrent && !setCurrentUnlocked(record.versionId, errorOut)) {
        rollbackTransaction();
        return false;
    }

    if (!execSql("COMMIT", errorOut)) {
        rollbackTransaction();
        return false;
    }
    return true;
}

std::optional<QVector<SnapshotRecord>> SqliteSnapshotBackend::listVersions(QString* errorOut) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql =
        "SELECT version_id, sequence, created_at FROM model_versions ORDER BY sequence ASC";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        assignError(errorOut, lastError());
        return std::nullopt;
    }

    QVector<SnapshotRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        SnapshotRecord record;
        const char* versionId = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        record.versionId = QString::fromUtf8(versionId ? versionId : "");
        record.sequence = sqlite3_column_int64(stmt, 1);
        record.createdAt = sqlite3_column_double(stmt, 2);
        records.push_back(std::move(record));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        assignError(errorOut, lastError());
        return std::nullopt;
    }
    return records;
}

std::optional<SnapshotRecord> SqliteSnapshotBackend::read(const QString& versionId,
                                                          QString* errorOut) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql =
        "SELECT version_id, sequence, created_at, payload FROM model_versions WHERE version_id = ?1";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        assignError(errorOut, lastError());
        return std::nullopt;
    }

    const QByteArray versionUtf8 = versionId.toUtf8();
    sqlite3_bind_text(stmt, 1, versionUtf8.constData(), -1, SQLITE_TRANSIENT);

    std::optional<SnapshotRecord> result;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        SnapshotRecord record;
        const char* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        record.versionId = QString::fromUtf8(id ? id : "");
        record.sequence = sqlite3_column_int64(stmt, 1);
        record.createdAt = sqlite3_column_double(stmt, 2);
        const char* payload = reinterpret_cast<const char*>(sqlite3_column_blob(stmt, 3));
        const int payloadBytes = sqlite3_column_bytes(stmt, 3);
        if (payload && payloadBytes > 0) {
            record.payload = QByteArray(payload, payloadBytes);
        }
        result = std::move(record);
    } else if (rc == SQLITE_DONE) {
        assignError(errorOut, QStringLiteral("version %1 not found").arg(versionId));
    } else {
        assignError(errorOut, lastError());
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SqliteSnapshotBackend::setCurrent(const QString& versionId, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return setCurrentUnlocked(versionId, errorOut);
}

bool SqliteSnapshotBackend::setCurrentUnlocked(const QString& versionId, QString* errorOut)
{
    static constexpr const char* kSql = R"(
        INSERT INTO model_state (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        assignError(errorOut, lastError());
        return false;
    }

    const QByteArray versionUtf8 = versionId.toUtf8();
    sqlite3_bind_text(stmt, 1, kCurrentVersionKey, -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, versionUtf8.constData(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        assignError(errorOut, lastError());
        return false;
    }
    return true;
}

std::optional<QString> SqliteSnapshotBackend::current(QString* errorOut) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    static constexpr const char* kSql = "SELECT value FROM model_state WHERE key = ?1";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        assignError(errorOut, lastError());
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, kCurrentVersionKey, -1, SQLITE_STATIC);

    std::optional<QString> result;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const char* value = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        result = QString::fromUtf8(value ? value : "");
    } else if (rc == SQLITE_DONE) {
        result = QString();
    } else {
        assignError(errorOut, lastError());
    }
    sqlite3_finalize(stmt);
    return result;
}

} // namespace ci
