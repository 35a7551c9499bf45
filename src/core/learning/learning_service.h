#pragma once

#include "core/learning/learning_types.h"
#include "core/learning/weight_adaptation.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>
#include <QVector>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace ci {

class FeedbackBuffer;
class ModelStore;
class PerformanceMonitor;
class SignalExtractor;

enum class LearningState {
    Idle,
    Flushing,
};

// The three update rules, as plain callables.
struct AdaptiveAlgorithms {
    std::function<double(double, double, double)> exponentialMovingAverage;
    std::function<double(const QVector<ConfidenceSample>&)> confidenceWeightedAverage;
    std::function<double(double, double, double)> regretBasedAdjustment;
};

// LearningService -- owns the live adaptive weights and the feedback loop.
//
// Producers call collectFeedback() from any thread. A full buffer is handed
// to a batch channel and consumed by the single learning thread, which is
// the only writer of the live weights during a flush cycle:
//   extract signals -> apply rule -> commit -> persist snapshot -> monitor.
//
// Commit, persist, load, rollback and saveModel share one model lock, so a
// rollback never interleaves with a flush writing the weights. Readers of
// the weights take a separate short lock and never wait on a flush.
class LearningService {
public:
    // store must be non-null. A null extractor selects
    // QueryGroupedSignalExtractor.
    LearningService(const LearningSettings& settings,
                    std::unique_ptr<ModelStore> store,
                    std::unique_ptr<SignalExtractor> extractor = nullptr);
    ~LearningService();

    LearningService(const LearningService&) = delete;
    LearningService& operator=(const LearningService&) = delete;

    // Restores the current model when restoreOnStart is set, then starts the
    // learning thread. A restore failure is reported through errorOut and
    // the service keeps its default weights.
    bool initialize(LearningError* errorOut = nullptr);

    // Drains pending feedback and stops the learning thread. Idempotent.
    void shutdown();

    bool collectFeedback(const FeedbackEvent& event, LearningError* errorOut = nullptr);

    // Forces a flush of the partial buffer and waits until every batch
    // handed over before this call has been processed.
    void flushFeedbackBuffer();

    AdaptiveWeights getAdaptiveWeights() const;
    static AdaptiveAlgorithms getAdaptiveAlgorithms();

    std::optional<ModelVersion> saveModel(LearningError* errorOut = nullptr);
    bool loadModel(LearningError* errorOut = nullptr);
    // Live weights not yet held by any snapshot (checkpointEveryBatch off,
    // or a failed checkpoint) are saved as a new version first, so a
    // rollback never discards training.
    bool rollbackToVersion(const QString& versionId, LearningError* errorOut = nullptr);

    PerformanceSnapshot getPerformanceMonitoring() const;

    LearningState state() const;
    QJsonObject healthSnapshot() const;
    QString currentVersionId() const;

    static bool validateFeedback(const FeedbackEvent& event, LearningError* errorOut = nullptr);

    // Initial weights for settings.defaultWeights, stamped with the current
    // time. Also used to seed the ModelStore defaults.
    static AdaptiveWeights defaultWeights(const LearningSettings& settings);

private:
    struct PendingBatch {
        uint64_t ticket = 0;
        QVector<FeedbackEvent> events;
    };

    void enqueueBatch(QVector<FeedbackEvent> events);
    void runLoop();
    void drainInline();
    void processBatch(const QVector<FeedbackEvent>& batch);
    void replaceWeights(const AdaptiveWeights& weights);
    // Saves live weights that no snapshot holds yet, after checking that
    // targetVersionId exists. Caller holds m_modelMutex.
    bool preserveUnsavedWeights(const QString& targetVersionId, LearningError* errorOut);

    const LearningSettings m_settings;
    WeightAdaptationEngine::Params m_params;

    std::unique_ptr<FeedbackBuffer> m_buffer;
    std::unique_ptr<ModelStore> m_store;
    std::unique_ptr<SignalExtractor> m_extractor;
    std::unique_ptr<PerformanceMonitor> m_monitor;

    // Live weights; short critical sections only.
    mutable std::mutex m_weightsMutex;
    AdaptiveWeights m_weights;

    // Exclusive region for commit/persist/load/rollback/save.
    mutable std::mutex m_modelMutex;
    bool m_unsavedChanges = false;  // guarded by m_modelMutex

    // Batch channel between producers and the learning thread.
    mutable std::mutex m_channelMutex;
    std::condition_variable m_channelCv;
    std::condition_variable m_completedCv;
    std::deque<PendingBatch> m_channel;
    uint64_t m_nextTicket = 1;
    uint64_t m_completedTicket = 0;
    bool m_workerActive = false;
    bool m_stopping = false;

    // Serializes batches processed on a caller thread when no learning
    // thread is running (before initialize() or after shutdown()).
    std::mutex m_inlineMutex;

    std::thread m_worker;
    std::atomic<LearningState> m_state{LearningState::Idle};
};

} // namespace ci
