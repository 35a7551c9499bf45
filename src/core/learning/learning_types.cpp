#include "core/learning/learning_types.h"

namespace ci {

bool operator==(const AdaptiveWeight& a, const AdaptiveWeight& b)
{
    return a.name == b.name
        && a.value == b.value
        && a.confidence == b.confidence
        && a.lastUpdated == b.lastUpdated;
}

QString adaptationAlgorithmToString(AdaptationAlgorithm algorithm)
{
    switch (algorithm) {
    case AdaptationAlgorithm::ExponentialMovingAverage: return QStringLiteral("ema");
    case AdaptationAlgorithm::ConfidenceWeighted:       return QStringLiteral("confidence_weighted");
    case AdaptationAlgorithm::RegretBased:              return QStringLiteral("regret");
    }
    return QStringLiteral("ema");
}

AdaptationAlgorithm adaptationAlgorithmFromString(const QString& str, bool* ok)
{
    if (ok) {
        *ok = true;
    }
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("ema"))                 return AdaptationAlgorithm::ExponentialMovingAverage;
    if (normalized == QLatin1String("confidence_weighted")) return AdaptationAlgorithm::ConfidenceWeighted;
    if (normalized == QLatin1String("regret"))              return AdaptationAlgorithm::RegretBased;
    if (ok) {
        *ok = false;
    }
    return AdaptationAlgorithm::ExponentialMovingAverage;
}

QString learningErrorKindToString(LearningErrorKind kind)
{
    switch (kind) {
    case LearningErrorKind::None:               return QStringLiteral("none");
    case LearningErrorKind::InvalidInput:       return QStringLiteral("invalid_input");
    case LearningErrorKind::EmptyBatch:         return QStringLiteral("empty_batch");
    case LearningErrorKind::StorageUnavailable: return QStringLiteral("storage_unavailable");
    case LearningErrorKind::CorruptState:       return QStringLiteral("corrupt_state");
    case LearningErrorKind::VersionNotFound:    return QStringLiteral("version_not_found");
    }
    return QStringLiteral("none");
}

void setLearningError(LearningError* errorOut, LearningErrorKind kind, const QString& message)
{
    if (!errorOut) {
        return;
    }
    errorOut->kind = kind;
    errorOut->message = message;
}

} // namespace ci
