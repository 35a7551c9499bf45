#pragma once

#include "core/learning/learning_types.h"

#include <QVector>

#include <optional>

namespace ci {

class SignalExtractor;

struct ConfidenceSample {
    double value = 0.0;
    double confidence = 0.0;
};

// WeightAdaptationEngine -- stateless update rules for the adaptive weights.
// Nothing here touches shared state; callers decide when to commit.
class WeightAdaptationEngine {
public:
    struct Params {
        AdaptationAlgorithm algorithm = AdaptationAlgorithm::ExponentialMovingAverage;
        double alpha = 0.3;          // EMA, (0,1]
        double learningRate = 0.1;   // regret
    };

    // previous + alpha * (observed - previous)
    static double exponentialMovingAverage(double previous, double observed, double alpha);

    // sum(value * confidence) / sum(confidence). Returns 0.0 and clears *ok
    // when samples is empty or every confidence is zero.
    static double confidenceWeightedAverage(const QVector<ConfidenceSample>& samples,
                                            bool* ok = nullptr);

    // current - learningRate * (observedReward - current). A reward above
    // the current value lowers the weight.
    static double regretBasedAdjustment(double current, double observedReward, double learningRate);

    // Computes the weights that would result from applying batch to
    // currentWeights. currentWeights is left untouched. Returns nullopt with
    // EmptyBatch when there is nothing to learn from.
    static std::optional<AdaptiveWeights> apply(const QVector<FeedbackEvent>& batch,
                                                const AdaptiveWeights& currentWeights,
                                                const Params& params,
                                                const SignalExtractor& extractor,
                                                LearningError* errorOut = nullptr);

private:
    static double clamp(double value, double lo, double hi);
};

} // namespace ci
