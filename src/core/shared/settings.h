#pragma once

#include <QString>
#include <QVector>

#include <cstdint>

namespace ci {

struct FeatureWeightDefault {
    QString name;
    double value = 0.0;
    double confidence = 0.0;
};

// Ranking features seeded into a fresh model.
QVector<FeatureWeightDefault> defaultFeatureWeights();

struct LearningSettings {
    // Database holding model snapshots
    QString dbPath;

    // Feedback batching
    int batchThreshold = 10;
    int64_t flushIntervalMs = 0;             // 0 = threshold-only flushing

    // Classification and monitoring
    double positiveThreshold = 0.5;
    int maxHistoryLength = 100;              // 0 = unbounded

    // Adaptation
    QString algorithm = QStringLiteral("ema");
    double emaAlpha = 0.3;
    double regretLearningRate = 0.1;

    // Model lifecycle
    bool checkpointEveryBatch = true;
    bool restoreOnStart = true;

    QVector<FeatureWeightDefault> defaultWeights = defaultFeatureWeights();
};

} // namespace ci
