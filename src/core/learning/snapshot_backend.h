#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>

#include <cstdint>
#include <optional>

namespace ci {

// One persisted model snapshot. payload is the encoded ModelVersion.
struct SnapshotRecord {
    QString versionId;
    int64_t sequence = 0;
    double createdAt = 0.0;   // seconds since epoch, UTC
    QByteArray payload;
};

// SnapshotBackend -- durable, append-only blob store keyed by version id,
// plus a single movable "current" pointer.
class SnapshotBackend {
public:
    virtual ~SnapshotBackend() = default;

    // Append a record. When makeCurrent is set, the current pointer moves
    // to the new record in the same transaction.
    virtual bool append(const SnapshotRecord& record, bool makeCurrent, QString* errorOut) = 0;

    // All records in sequence order, without payloads. nullopt on failure.
    virtual std::optional<QVector<SnapshotRecord>> listVersions(QString* errorOut) const = 0;

    // Full record for versionId. nullopt on failure or when it is absent.
    virtual std::optional<SnapshotRecord> read(const QString& versionId, QString* errorOut) const = 0;

    virtual bool setCurrent(const QString& versionId, QString* errorOut) = 0;

    // Current version id, empty when nothing was saved yet. nullopt on failure.
    virtual std::optional<QString> current(QString* errorOut) const = 0;
};

} // namespace ci
