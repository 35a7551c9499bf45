#include "core/learning/weight_adaptation.h"

#include "core/learning/signal_extractor.h"

#include <QDateTime>

#include <algorithm>
#include <cmath>

namespace ci {

namespace {

// Confidence gained per unit of weight movement.
constexpr double kConfidenceGainPerDelta = 0.1;

} // namespace

double WeightAdaptationEngine::clamp(double value, double lo, double hi)
{
    return std::max(lo, std::min(hi, value));
}

double WeightAdaptationEngine::exponentialMovingAverage(double previous, double observed, double alpha)
{
    return previous + alpha * (observed - previous);
}

double WeightAdaptationEngine::confidenceWeightedAverage(const QVector<ConfidenceSample>& samples,
                                                         bool* ok)
{
    if (ok) {
        *ok = false;
    }
    if (samples.isEmpty()) {
        return 0.0;
    }

    double weightedSum = 0.0;
    double confidenceSum = 0.0;
    for (const ConfidenceSample& sample : samples) {
        weightedSum += sample.value * sample.confidence;
        confidenceSum += sample.confidence;
    }

    if (confidenceSum == 0.0 || !std::isfinite(confidenceSum)) {
        return 0.0;
    }
    if (ok) {
        *ok = true;
    }
    return weightedSum / confidenceSum;
}

double WeightAdaptationEngine::regretBasedAdjustment(double current, double observedReward,
                                                     double learningRate)
{
    return current - learningRate * (observedReward - current);
}

std::optional<AdaptiveWeights> WeightAdaptationEngine::apply(const QVector<FeedbackEvent>& batch,
                                                             const AdaptiveWeights& currentWeights,
                                                             const Params& params,
                                                             const SignalExtractor& extractor,
                                                             LearningError* errorOut)
{
    if (batch.isEmpty()) {
        setLearningError(errorOut, LearningErrorKind::EmptyBatch,
                         QStringLiteral("feedback batch is empty"));
        return std::nullopt;
    }

    const QHash<QString, FeatureSignal> extracted = extractor.extract(batch, currentWeights);
    if (extracted.isEmpty()) {
        setLearningError(errorOut, LearningErrorKind::EmptyBatch,
                         QStringLiteral("batch carries no decisive feedback"));
        return std::nullopt;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    AdaptiveWeights updated = currentWeights;

    for (auto it = updated.begin(); it != updated.end(); ++it) {
        const auto signalIt = extracted.constFind(it.key());
        if (signalIt == extracted.cend() || signalIt->samples <= 0) {
            continue;
        }

        const FeatureSignal& observed = signalIt.value();
        AdaptiveWeight& weight = it.value();
        double next = weight.value;

        switch (params.algorithm) {
        case AdaptationAlgorithm::ExponentialMovingAverage:
            next = exponentialMovingAverage(weight.value, observed.observed, params.alpha);
            break;
        case AdaptationAlgorithm::ConfidenceWeighted: {
            bool ok = false;
            const double blended = confidenceWeightedAverage(
                {{weight.value, weight.confidence}, {observed.observed, observed.confidence}}, &ok);
            if (ok) {
                next = blended;
            }
            break;
        }
        case AdaptationAlgorithm::RegretBased:
            next = regretBasedAdjustment(weight.value, observed.observed, params.learningRate);
            break;
        }

        if (!std::isfinite(next)) {
            continue;
        }
        next = clamp(next, 0.0, 1.0);

        const double delta = std::abs(next - weight.value);
        weight.confidence = clamp(weight.confidence + delta * kConfidenceGainPerDelta, 0.0, 1.0);
        weight.value = next;
        weight.lastUpdated = now;
    }

    setLearningError(errorOut, LearningErrorKind::None, QString());
    return updated;
}

} // namespace ci
