#pragma once

#include <QDateTime>
#include <QMap>
#include <QString>
#include <QVector>

#include <cstdint>

namespace ci {

// One observation of result relevance, supplied by a user or an automated
// judge. Immutable once handed to the service.
struct FeedbackEvent {
    QString query;
    QString resultId;
    double relevanceScore = 0.0;  // [0,1], 1 = highly relevant
    QDateTime timestamp;
    QString userId;               // optional
};

struct AdaptiveWeight {
    QString name;
    double value = 0.0;
    double confidence = 0.0;
    QDateTime lastUpdated;
};

bool operator==(const AdaptiveWeight& a, const AdaptiveWeight& b);
inline bool operator!=(const AdaptiveWeight& a, const AdaptiveWeight& b) { return !(a == b); }

// Keyed by feature name. The key set is fixed once the service is built.
using AdaptiveWeights = QMap<QString, AdaptiveWeight>;

struct ModelVersion {
    QString versionId;   // "major.minor.patch"
    AdaptiveWeights weights;
    QDateTime createdAt;
};

struct PerformanceSample {
    QDateTime timestamp;
    double accuracy = 0.0;
    int64_t feedbackCount = 0;
};

struct PerformanceSnapshot {
    int64_t totalFeedback = 0;
    int64_t positiveFeedback = 0;
    int64_t negativeFeedback = 0;
    double modelAccuracy = 0.0;
    QVector<PerformanceSample> performanceHistory;
    int64_t batchesProcessed = 0;
    int64_t persistFailures = 0;
    int lastBatchSize = 0;
    QString lastPersistError;
};

enum class AdaptationAlgorithm {
    ExponentialMovingAverage,
    ConfidenceWeighted,
    RegretBased,
};

QString adaptationAlgorithmToString(AdaptationAlgorithm algorithm);
// Unknown names fall back to ExponentialMovingAverage and clear *ok.
AdaptationAlgorithm adaptationAlgorithmFromString(const QString& str, bool* ok = nullptr);

enum class LearningErrorKind {
    None,
    InvalidInput,
    EmptyBatch,
    StorageUnavailable,
    CorruptState,
    VersionNotFound,
};

QString learningErrorKindToString(LearningErrorKind kind);

struct LearningError {
    LearningErrorKind kind = LearningErrorKind::None;
    QString message;
};

// Writes kind/message into errorOut when the caller asked for it.
void setLearningError(LearningError* errorOut, LearningErrorKind kind, const QString& message);

} // namespace ci
