#pragma once

#include "core/learning/learning_types.h"
#include "core/learning/snapshot_backend.h"

#include <QByteArray>
#include <QString>
#include <QVector>

#include <memory>
#include <mutex>
#include <optional>

namespace ci {

// ModelStore -- versioned snapshots of the adaptive weights.
//
// History is a flat append-only log with a movable "current" pointer.
// rollback() only moves the pointer; later saves take the next id after the
// newest recorded version, never after the rolled-back one, so ids stay
// unique and the log never branches.
class ModelStore {
public:
    ModelStore(std::unique_ptr<SnapshotBackend> backend, AdaptiveWeights defaults);

    ModelStore(const ModelStore&) = delete;
    ModelStore& operator=(const ModelStore&) = delete;

    // Appends a snapshot of weights and makes it current.
    // Fails with StorageUnavailable when the backend rejects the write.
    std::optional<ModelVersion> save(const AdaptiveWeights& weights, LearningError* errorOut = nullptr);

    // Weights of the current version, or the defaults when nothing has been
    // saved yet. CorruptState when the stored record cannot be decoded.
    std::optional<AdaptiveWeights> load(LearningError* errorOut = nullptr) const;

    // Repoints current to versionId. Returns false (VersionNotFound) when the
    // id was never recorded; no history entry is ever removed.
    bool rollback(const QString& versionId,
                  AdaptiveWeights* restoredOut = nullptr,
                  LearningError* errorOut = nullptr);

    // Version metadata in save order. Weights are not populated.
    std::optional<QVector<ModelVersion>> history(LearningError* errorOut = nullptr) const;

    // Empty when nothing has been saved yet.
    QString currentVersionId(LearningError* errorOut = nullptr) const;

    const AdaptiveWeights& defaults() const { return m_defaults; }

    static QByteArray encode(const ModelVersion& version);
    static std::optional<ModelVersion> decode(const QByteArray& payload, QString* errorOut = nullptr);

    // "1.0.0" for an empty history, otherwise the patch bump of latestId.
    static QString nextVersionId(const QString& latestId);

private:
    std::optional<ModelVersion> readVersionUnlocked(const QString& versionId,
                                                    LearningError* errorOut) const;
    AdaptiveWeights conformToDefaults(const AdaptiveWeights& stored) const;

    std::unique_ptr<SnapshotBackend> m_backend;
    AdaptiveWeights m_defaults;
    mutable std::mutex m_mutex;
};

} // namespace ci
