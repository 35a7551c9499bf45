#include "core/learning/learning_service.h"

#include "core/feedback/feedback_buffer.h"
#include "core/learning/model_store.h"
#include "core/learning/performance_monitor.h"
#include "core/learning/signal_extractor.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QElapsedTimer>
#include <QJsonObject>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace ci {

namespace {

QString stateToString(LearningState state)
{
    switch (state) {
    case LearningState::Idle:     return QStringLiteral("idle");
    case LearningState::Flushing: return QStringLiteral("flushing");
    }
    return QStringLiteral("idle");
}

} // namespace

LearningService::LearningService(const LearningSettings& settings,
                                 std::unique_ptr<ModelStore> store,
                                 std::unique_ptr<SignalExtractor> extractor)
    : m_settings(settings)
    , m_buffer(std::make_unique<FeedbackBuffer>(settings.batchThreshold))
    , m_store(std::move(store))
    , m_extractor(std::move(extractor))
    , m_monitor(std::make_unique<PerformanceMonitor>(settings.positiveThreshold,
                                                     settings.maxHistoryLength))
    , m_weights(defaultWeights(settings))
{
    bool knownAlgorithm = false;
    m_params.algorithm = adaptationAlgorithmFromString(m_settings.algorithm, &knownAlgorithm);
    if (!knownAlgorithm) {
        LOG_WARN(ciLearning, "Unknown adaptation algorithm '%s', using ema",
                 qUtf8Printable(m_settings.algorithm));
    }
    m_params.alpha = m_settings.emaAlpha;
    m_params.learningRate = m_settings.regretLearningRate;

    if (!m_extractor) {
        m_extractor = std::make_unique<QueryGroupedSignalExtractor>();
    }

    LOG_INFO(ciLearning, "LearningService created (features=%d batchThreshold=%d algorithm=%s)",
             static_cast<int>(m_weights.size()),
             m_buffer->batchThreshold(),
             qUtf8Printable(adaptationAlgorithmToString(m_params.algorithm)));
}

LearningService::~LearningService()
{
    shutdown();
}

AdaptiveWeights LearningService::defaultWeights(const LearningSettings& settings)
{
    const QVector<FeatureWeightDefault> defaults = settings.defaultWeights.isEmpty()
        ? defaultFeatureWeights()
        : settings.defaultWeights;

    const QDateTime now = QDateTime::currentDateTimeUtc();
    AdaptiveWeights weights;
    for (const FeatureWeightDefault& entry : defaults) {
        AdaptiveWeight weight;
        weight.name = entry.name;
        weight.value = entry.value;
        weight.confidence = entry.confidence;
        weight.lastUpdated = now;
        weights.insert(entry.name, weight);
    }
    return weights;
}

bool LearningService::initialize(LearningError* errorOut)
{
    {
        std::lock_guard<std::mutex> lock(m_channelMutex);
        if (m_stopping) {
            setLearningError(errorOut, LearningErrorKind::StorageUnavailable,
                             QStringLiteral("service has been shut down"));
            LOG_WARN(ciLearning, "LearningService::initialize called after shutdown");
            return false;
        }
        if (m_workerActive) {
            return true;
        }
    }

    setLearningError(errorOut, LearningErrorKind::None, QString());
    if (m_settings.restoreOnStart) {
        LearningError restoreError;
        if (!loadModel(&restoreError)) {
            LOG_WARN(ciLearning, "Model restore failed (%s): %s; keeping default weights",
                     qUtf8Printable(learningErrorKindToString(restoreError.kind)),
                     qUtf8Printable(restoreError.message));
            if (errorOut) {
                *errorOut = restoreError;
            }
        }
    }

    {
        // Waits out a caller thread that is draining batches inline, so the
        // channel never has two consumers.
        std::lock_guard<std::mutex> inlineLock(m_inlineMutex);
        {
            std::lock_guard<std::mutex> lock(m_channelMutex);
            m_workerActive = true;
        }
        m_worker = std::thread([this]() { runLoop(); });
    }

    LOG_INFO(ciLearning, "LearningService started (flushIntervalMs=%lld)",
             static_cast<long long>(m_settings.flushIntervalMs));
    return true;
}

void LearningService::shutdown()
{
    flushFeedbackBuffer();

    {
        std::lock_guard<std::mutex> lock(m_channelMutex);
        if (!m_stopping) {
            m_stopping = true;
            LOG_INFO(ciLearning, "LearningService shutting down (completedBatches=%llu)",
                     static_cast<unsigned long long>(m_completedTicket));
        }
        m_channelCv.notify_all();
    }

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

bool LearningService::validateFeedback(const FeedbackEvent& event, LearningError* errorOut)
{
    if (!std::isfinite(event.relevanceScore)
        || event.relevanceScore < 0.0 || event.relevanceScore > 1.0) {
        setLearningError(errorOut, LearningErrorKind::InvalidInput,
                         QStringLiteral("relevanceScore %1 outside [0,1]").arg(event.relevanceScore));
        return false;
    }
    if (event.query.trimmed().isEmpty()) {
        setLearningError(errorOut, LearningErrorKind::InvalidInput, QStringLiteral("query is empty"));
        return false;
    }
    if (event.resultId.trimmed().isEmpty()) {
        setLearningError(errorOut, LearningErrorKind::InvalidInput, QStringLiteral("resultId is empty"));
        return false;
    }
    if (!event.timestamp.isValid()) {
        setLearningError(errorOut, LearningErrorKind::InvalidInput, QStringLiteral("timestamp is invalid"));
        return false;
    }
    setLearningError(errorOut, LearningErrorKind::None, QString());
    return true;
}

bool LearningService::collectFeedback(const FeedbackEvent& event, LearningError* errorOut)
{
    if (!validateFeedback(event, errorOut)) {
        LOG_WARN(ciLearning, "Feedback rejected query=\"%s\" resultId=%s relevance=%f",
                 qUtf8Printable(event.query), qUtf8Printable(event.resultId), event.relevanceScore);
        return false;
    }

    LOG_DEBUG(ciLearning, "Feedback collected query=\"%s\" resultId=%s relevance=%f",
              qUtf8Printable(event.query), qUtf8Printable(event.resultId), event.relevanceScore);

    std::optional<QVector<FeedbackEvent>> batch = m_buffer->collect(event);
    if (batch.has_value()) {
        enqueueBatch(std::move(batch.value()));
    }
    return true;
}

void LearningService::enqueueBatch(QVector<FeedbackEvent> events)
{
    std::lock_guard<std::mutex> lock(m_channelMutex);
    PendingBatch pending;
    pending.ticket = m_nextTicket++;
    pending.events = std::move(events);
    m_channel.push_back(std::move(pending));
    m_channelCv.notify_one();
}

void LearningService::flushFeedbackBuffer()
{
    QVector<FeedbackEvent> partial = m_buffer->flush();
    if (!partial.isEmpty()) {
        LOG_INFO(ciLearning, "Manual flush of %d buffered feedback event(s)",
                 static_cast<int>(partial.size()));
        enqueueBatch(std::move(partial));
    }

    std::unique_lock<std::mutex> lock(m_channelMutex);
    const uint64_t target = m_nextTicket - 1;
    for (;;) {
        m_completedCv.wait(lock, [this, target] {
            return m_completedTicket >= target || !m_workerActive;
        });
        if (m_completedTicket >= target) {
            return;
        }
        lock.unlock();
        drainInline();
        lock.lock();
    }
}

void LearningService::drainInline()
{
    std::lock_guard<std::mutex> inlineLock(m_inlineMutex);
    for (;;) {
        PendingBatch pending;
        {
            std::lock_guard<std::mutex> lock(m_channelMutex);
            if (m_channel.empty() || m_workerActive) {
                return;
            }
            pending = std::move(m_channel.front());
            m_channel.pop_front();
        }

        processBatch(pending.events);

        std::lock_guard<std::mutex> lock(m_channelMutex);
        m_completedTicket = std::max(m_completedTicket, pending.ticket);
        m_completedCv.notify_all();
    }
}

void LearningService::runLoop()
{
    const auto interval = std::chrono::milliseconds(m_settings.flushIntervalMs);
    std::unique_lock<std::mutex> lock(m_channelMutex);

    for (;;) {
        const auto ready = [this] { return m_stopping || !m_channel.empty(); };
        if (m_settings.flushIntervalMs > 0) {
            m_channelCv.wait_for(lock, interval, ready);
        } else {
            m_channelCv.wait(lock, ready);
        }

        if (m_channel.empty()) {
            if (m_stopping) {
                break;
            }
            // Flush interval elapsed with a partially filled buffer.
            lock.unlock();
            QVector<FeedbackEvent> partial = m_buffer->flush();
            if (!partial.isEmpty()) {
                LOG_DEBUG(ciLearning, "Interval flush of %d feedback event(s)",
                          static_cast<int>(partial.size()));
                enqueueBatch(std::move(partial));
            }
            lock.lock();
            continue;
        }

        PendingBatch pending = std::move(m_channel.front());
        m_channel.pop_front();
        lock.unlock();

        processBatch(pending.events);

        lock.lock();
        m_completedTicket = pending.ticket;
        m_completedCv.notify_all();
    }

    m_workerActive = false;
    m_completedCv.notify_all();
}

void LearningService::processBatch(const QVector<FeedbackEvent>& batch)
{
    std::lock_guard<std::mutex> modelLock(m_modelMutex);
    m_state.store(LearningState::Flushing);

    QElapsedTimer timer;
    timer.start();
    LOG_INFO(ciLearning, "Processing feedback batch size=%d", static_cast<int>(batch.size()));

    LearningError applyError;
    const std::optional<AdaptiveWeights> next = WeightAdaptationEngine::apply(
        batch, getAdaptiveWeights(), m_params, *m_extractor, &applyError);

    if (next.has_value()) {
        replaceWeights(next.value());
        m_unsavedChanges = true;

        if (m_settings.checkpointEveryBatch) {
            LearningError saveError;
            const std::optional<ModelVersion> saved = m_store->save(next.value(), &saveError);
            if (!saved.has_value()) {
                // The fresh weights stay live; only durability is lost.
                m_monitor->recordPersistFailure(saveError.message);
                LOG_WARN(ciLearning, "Batch checkpoint failed (%s): %s",
                         qUtf8Printable(learningErrorKindToString(saveError.kind)),
                         qUtf8Printable(saveError.message));
            } else {
                m_unsavedChanges = false;
            }
        }
    } else if (applyError.kind == LearningErrorKind::EmptyBatch) {
        LOG_INFO(ciLearning, "Batch commit skipped: %s", qUtf8Printable(applyError.message));
    } else {
        LOG_WARN(ciLearning, "Batch commit skipped (%s): %s",
                 qUtf8Printable(learningErrorKindToString(applyError.kind)),
                 qUtf8Printable(applyError.message));
    }

    m_monitor->record(batch);

    LOG_INFO(ciLearning, "Feedback batch committed size=%d committed=%s elapsedMs=%lld",
             static_cast<int>(batch.size()),
             next.has_value() ? "true" : "false",
             static_cast<long long>(timer.elapsed()));
    m_state.store(LearningState::Idle);
}

void LearningService::replaceWeights(const AdaptiveWeights& weights)
{
    std::lock_guard<std::mutex> lock(m_weightsMutex);
    m_weights = weights;
}

AdaptiveWeights LearningService::getAdaptiveWeights() const
{
    std::lock_guard<std::mutex> lock(m_weightsMutex);
    return m_weights;
}

AdaptiveAlgorithms LearningService::getAdaptiveAlgorithms()
{
    AdaptiveAlgorithms algorithms;
    algorithms.exponentialMovingAverage = [](double previous, double observed, double alpha) {
        return WeightAdaptationEngine::exponentialMovingAverage(previous, observed, alpha);
    };
    algorithms.confidenceWeightedAverage = [](const QVector<ConfidenceSample>& samples) {
        return WeightAdaptationEngine::confidenceWeightedAverage(samples);
    };
    algorithms.regretBasedAdjustment = [](double current, double reward, double learningRate) {
        return WeightAdaptationEngine::regretBasedAdjustment(current, reward, learningRate);
    };
    return algorithms;
}

std::optional<ModelVersion> LearningService::saveModel(LearningError* errorOut)
{
    std::lock_guard<std::mutex> modelLock(m_modelMutex);
    LOG_INFO(ciLearning, "Saving learning model");

    LearningError saveError;
    std::optional<ModelVersion> saved = m_store->save(getAdaptiveWeights(), &saveError);
    if (!saved.has_value()) {
        LOG_WARN(ciLearning, "Saving learning model failed (%s): %s",
                 qUtf8Printable(learningErrorKindToString(saveError.kind)),
                 qUtf8Printable(saveError.message));
    } else {
        m_unsavedChanges = false;
        LOG_INFO(ciLearning, "Learning model saved version=%s", qUtf8Printable(saved->versionId));
    }
    if (errorOut) {
        *errorOut = saveError;
    }
    return saved;
}

bool LearningService::loadModel(LearningError* errorOut)
{
    std::lock_guard<std::mutex> modelLock(m_modelMutex);
    LOG_INFO(ciLearning, "Loading learning model");

    LearningError loadError;
    const std::optional<AdaptiveWeights> loaded = m_store->load(&loadError);
    if (errorOut) {
        *errorOut = loadError;
    }
    if (!loaded.has_value()) {
        LOG_WARN(ciLearning, "Loading learning model failed (%s): %s",
                 qUtf8Printable(learningErrorKindToString(loadError.kind)),
                 qUtf8Printable(loadError.message));
        return false;
    }

    replaceWeights(loaded.value());
    m_unsavedChanges = false;
    LOG_INFO(ciLearning, "Learning model loaded (features=%d)", static_cast<int>(loaded->size()));
    return true;
}

bool LearningService::rollbackToVersion(const QString& versionId, LearningError* errorOut)
{
    std::lock_guard<std::mutex> modelLock(m_modelMutex);
    LOG_INFO(ciLearning, "Rolling back model version=%s", qUtf8Printable(versionId));

    LearningError rollbackError;
    if (m_unsavedChanges && !preserveUnsavedWeights(versionId, &rollbackError)) {
        if (errorOut) {
            *errorOut = rollbackError;
        }
        LOG_WARN(ciLearning, "Model rollback aborted version=%s reason=%s: %s",
                 qUtf8Printable(versionId),
                 qUtf8Printable(learningErrorKindToString(rollbackError.kind)),
                 qUtf8Printable(rollbackError.message));
        return false;
    }

    AdaptiveWeights restored;
    const bool ok = m_store->rollback(versionId, &restored, &rollbackError);
    if (errorOut) {
        *errorOut = rollbackError;
    }
    if (!ok) {
        LOG_WARN(ciLearning, "Model rollback failed version=%s reason=%s: %s",
                 qUtf8Printable(versionId),
                 qUtf8Printable(learningErrorKindToString(rollbackError.kind)),
                 qUtf8Printable(rollbackError.message));
        return false;
    }

    replaceWeights(restored);
    m_unsavedChanges = false;
    LOG_INFO(ciLearning, "Model rollback completed version=%s", qUtf8Printable(versionId));
    return true;
}

bool LearningService::preserveUnsavedWeights(const QString& targetVersionId, LearningError* errorOut)
{
    const std::optional<QVector<ModelVersion>> history = m_store->history(errorOut);
    if (!history.has_value()) {
        return false;
    }
    const bool known = std::any_of(history->cbegin(), history->cend(),
                                   [&targetVersionId](const ModelVersion& version) {
                                       return version.versionId == targetVersionId;
                                   });
    if (!known) {
        setLearningError(errorOut, LearningErrorKind::VersionNotFound,
                         QStringLiteral("version %1 not found").arg(targetVersionId));
        return false;
    }

    const std::optional<ModelVersion> saved = m_store->save(getAdaptiveWeights(), errorOut);
    if (!saved.has_value()) {
        return false;
    }
    m_unsavedChanges = false;
    LOG_INFO(ciLearning, "Unsaved weights kept as version=%s before rollback",
             qUtf8Printable(saved->versionId));
    return true;
}

PerformanceSnapshot LearningService::getPerformanceMonitoring() const
{
    return m_monitor->snapshot();
}

LearningState LearningService::state() const
{
    return m_state.load();
}

QString LearningService::currentVersionId() const
{
    return m_store->currentVersionId();
}

QJsonObject LearningService::healthSnapshot() const
{
    const AdaptiveWeights weights = getAdaptiveWeights();
    QJsonObject weightsJson;
    for (auto it = weights.cbegin(); it != weights.cend(); ++it) {
        QJsonObject entry;
        entry[QStringLiteral("value")] = it->value;
        entry[QStringLiteral("confidence")] = it->confidence;
        entry[QStringLiteral("lastUpdated")] = it->lastUpdated.toString(Qt::ISODateWithMs);
        weightsJson[it.key()] = entry;
    }

    int pendingBatches = 0;
    {
        std::lock_guard<std::mutex> lock(m_channelMutex);
        pendingBatches = static_cast<int>(m_channel.size());
    }

    QJsonObject health;
    health[QStringLiteral("state")] = stateToString(state());
    health[QStringLiteral("algorithm")] = adaptationAlgorithmToString(m_params.algorithm);
    health[QStringLiteral("batchThreshold")] = m_buffer->batchThreshold();
    health[QStringLiteral("bufferedFeedback")] = m_buffer->size();
    health[QStringLiteral("pendingBatches")] = pendingBatches;
    health[QStringLiteral("currentVersion")] = currentVersionId();
    health[QStringLiteral("weights")] = weightsJson;
    health[QStringLiteral("performance")] = m_monitor->toJson();
    return health;
}

} // namespace ci
