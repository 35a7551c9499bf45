#pragma once

#include "core/learning/learning_types.h"

#include <QHash>
#include <QVector>

namespace ci {

// Per-feature observation extracted from one batch.
struct FeatureSignal {
    double observed = 0.0;    // target value in [0,1]
    double confidence = 0.0;  // [0,1]
    int samples = 0;          // events that produced the signal
};

// SignalExtractor -- abstract collaborator mapping a feedback batch onto the
// ranking features. Implementations must be callable from the learning
// consumer thread and must not retain the batch.
class SignalExtractor {
public:
    virtual ~SignalExtractor() = default;

    // Returns signals keyed by feature name. Features missing from the
    // result are left untouched by the adaptation step; unknown names are
    // ignored. An empty result means the batch carries no verdict.
    virtual QHash<QString, FeatureSignal> extract(const QVector<FeedbackEvent>& batch,
                                                  const AdaptiveWeights& currentWeights) const = 0;
};

// Groups feedback by query and scales every weight proportionally to its own
// value, once per decisive query: x1.05 when the query mean is >= 0.7,
// x0.9 when it is <= 0.3. Queries in between leave the weights alone, so a
// batch without decisive queries yields no signal. Ratios between features
// are preserved. Confidence is the share of decisive queries.
class QueryGroupedSignalExtractor : public SignalExtractor {
public:
    static constexpr double kReinforceBand = 0.7;
    static constexpr double kPenalizeBand = 0.3;
    static constexpr double kReinforceFactor = 0.05;
    static constexpr double kPenalizeFactor = 0.1;

    QHash<QString, FeatureSignal> extract(const QVector<FeedbackEvent>& batch,
                                          const AdaptiveWeights& currentWeights) const override;
};

} // namespace ci
