#include "core/learning/signal_extractor.h"

#include <QMap>

#include <algorithm>

namespace ci {

QHash<QString, FeatureSignal> QueryGroupedSignalExtractor::extract(
    const QVector<FeedbackEvent>& batch,
    const AdaptiveWeights& currentWeights) const
{
    QHash<QString, FeatureSignal> extracted;
    if (batch.isEmpty() || currentWeights.isEmpty()) {
        return extracted;
    }

    struct QueryAccumulator {
        double relevanceSum = 0.0;
        int count = 0;
    };

    QMap<QString, QueryAccumulator> byQuery;
    for (const FeedbackEvent& event : batch) {
        QueryAccumulator& acc = byQuery[event.query];
        acc.relevanceSum += std::clamp(event.relevanceScore, 0.0, 1.0);
        ++acc.count;
    }

    // Relative step per decisive query, in query order.
    QVector<double> steps;
    int decisiveEvents = 0;
    for (auto it = byQuery.cbegin(); it != byQuery.cend(); ++it) {
        const double queryMean = it->relevanceSum / static_cast<double>(it->count);
        if (queryMean >= kReinforceBand) {
            steps.push_back(kReinforceFactor);
        } else if (queryMean <= kPenalizeBand) {
            steps.push_back(-kPenalizeFactor);
        } else {
            continue;
        }
        decisiveEvents += it->count;
    }
    if (steps.isEmpty()) {
        return extracted;
    }

    const double confidence = static_cast<double>(steps.size())
        / static_cast<double>(byQuery.size());

    for (auto it = currentWeights.cbegin(); it != currentWeights.cend(); ++it) {
        double target = it->value;
        for (double step : steps) {
            target = std::clamp(target + target * step, 0.0, 1.0);
        }

        FeatureSignal featureSignal;
        featureSignal.observed = target;
        featureSignal.confidence = confidence;
        featureSignal.samples = decisiveEvents;
        extracted.insert(it.key(), featureSignal);
    }
    return extracted;
}

} // namespace ci
