#include <QtTest/QtTest>
#include "core/learning/weight_adaptation.h"
#include "core/learning/signal_extractor.h"

#include <cmath>
#include <utility>

namespace {

class FixedSignalExtractor : public ci::SignalExtractor {
public:
    explicit FixedSignalExtractor(QHash<QString, ci::FeatureSignal> fixed)
        : m_fixed(std::move(fixed)) {}

    QHash<QString, ci::FeatureSignal> extract(const QVector<ci::FeedbackEvent>& /*batch*/,
                                              const ci::AdaptiveWeights& /*currentWeights*/) const override
    {
        return m_fixed;
    }

private:
    QHash<QString, ci::FeatureSignal> m_fixed;
};

ci::AdaptiveWeights makeWeights()
{
    const QDateTime stamp = QDateTime::fromString(QStringLiteral("2026-01-01T00:00:00.000Z"),
                                                  Qt::ISODateWithMs);
    ci::AdaptiveWeights weights;
    weights.insert(QStringLiteral("semantic"), {QStringLiteral("semantic"), 0.3, 0.8, stamp});
    weights.insert(QStringLiteral("graph"), {QStringLiteral("graph"), 0.2, 0.7, stamp});
    weights.insert(QStringLiteral("recency"), {QStringLiteral("recency"), 0.05, 0.5, stamp});
    return weights;
}

QVector<ci::FeedbackEvent> makeBatch()
{
    ci::FeedbackEvent event;
    event.query = QStringLiteral("parse config");
    event.resultId = QStringLiteral("src/config.cpp");
    event.relevanceScore = 1.0;
    event.timestamp = QDateTime::currentDateTimeUtc();
    return {event};
}

ci::FeatureSignal strongSignal()
{
    ci::FeatureSignal signal;
    signal.observed = 1.0;
    signal.confidence = 1.0;
    signal.samples = 1;
    return signal;
}

} // namespace

class TestWeightAdaptation : public QObject {
    Q_OBJECT

private slots:
    void testExponentialMovingAverage();
    void testConfidenceWeightedAverage();
    void testConfidenceWeightedAverageDegenerate();
    void testRegretBasedAdjustment();
    void testApplyEma();
    void testApplyConfidenceWeighted();
    void testApplyRegretClampsToUnitRange();
    void testApplyLeavesInputUntouched();
    void testApplyEmptyBatch();
    void testApplyWithoutSignals();
};

void TestWeightAdaptation::testExponentialMovingAverage()
{
    const double result = ci::WeightAdaptationEngine::exponentialMovingAverage(0.5, 0.8, 0.3);
    QVERIFY(std::abs(result - 0.59) < 1e-4);

    // alpha = 1 jumps straight to the observation.
    QCOMPARE(ci::WeightAdaptationEngine::exponentialMovingAverage(0.2, 0.9, 1.0), 0.9);
}

void TestWeightAdaptation::testConfidenceWeightedAverage()
{
    bool ok = false;
    const double result = ci::WeightAdaptationEngine::confidenceWeightedAverage(
        {{0.5, 0.8}, {0.7, 0.6}}, &ok);
    QVERIFY(ok);
    QVERIFY(std::abs(result - 0.586) < 1e-3);
}

void TestWeightAdaptation::testConfidenceWeightedAverageDegenerate()
{
    bool ok = true;
    QCOMPARE(ci::WeightAdaptationEngine::confidenceWeightedAverage({}, &ok), 0.0);
    QVERIFY(!ok);

    ok = true;
    QCOMPARE(ci::WeightAdaptationEngine::confidenceWeightedAverage({{0.4, 0.0}, {0.9, 0.0}}, &ok),
             0.0);
    QVERIFY(!ok);
}

void TestWeightAdaptation::testRegretBasedAdjustment()
{
    const double result = ci::WeightAdaptationEngine::regretBasedAdjustment(0.5, 0.8, 0.1);
    QVERIFY(std::abs(result - 0.47) < 1e-9);
    QVERIFY(result < 0.5);
}

void TestWeightAdaptation::testApplyEma()
{
    QHash<QString, ci::FeatureSignal> fixed;
    fixed.insert(QStringLiteral("semantic"), strongSignal());
    FixedSignalExtractor extractor(fixed);

    ci::WeightAdaptationEngine::Params params;
    params.algorithm = ci::AdaptationAlgorithm::ExponentialMovingAverage;
    params.alpha = 0.3;

    ci::LearningError error;
    const auto updated = ci::WeightAdaptationEngine::apply(
        makeBatch(), makeWeights(), params, extractor, &error);
    QVERIFY(updated.has_value());
    QCOMPARE(error.kind, ci::LearningErrorKind::None);

    const ci::AdaptiveWeight& semantic = updated->value(QStringLiteral("semantic"));
    QVERIFY(std::abs(semantic.value - 0.51) < 1e-9);
    QVERIFY(std::abs(semantic.confidence - 0.821) < 1e-9);
    QVERIFY(semantic.lastUpdated > makeWeights().value(QStringLiteral("semantic")).lastUpdated);

    // No signal for graph: untouched, timestamp included.
    QVERIFY(updated->value(QStringLiteral("graph")) == makeWeights().value(QStringLiteral("graph")));
    QCOMPARE(updated->size(), makeWeights().size());
}

void TestWeightAdaptation::testApplyConfidenceWeighted()
{
    QHash<QString, ci::FeatureSignal> fixed;
    fixed.insert(QStringLiteral("semantic"), strongSignal());
    FixedSignalExtractor extractor(fixed);

    ci::WeightAdaptationEngine::Params params;
    params.algorithm = ci::AdaptationAlgorithm::ConfidenceWeighted;

    const auto updated = ci::WeightAdaptationEngine::apply(
        makeBatch(), makeWeights(), params, extractor);
    QVERIFY(updated.has_value());

    // (0.3 * 0.8 + 1.0 * 1.0) / (0.8 + 1.0)
    const double expected = 1.24 / 1.8;
    QVERIFY(std::abs(updated->value(QStringLiteral("semantic")).value - expected) < 1e-9);
}

void TestWeightAdaptation::testApplyRegretClampsToUnitRange()
{
    QHash<QString, ci::FeatureSignal> fixed;
    fixed.insert(QStringLiteral("semantic"), strongSignal());
    fixed.insert(QStringLiteral("recency"), strongSignal());
    FixedSignalExtractor extractor(fixed);

    ci::WeightAdaptationEngine::Params params;
    params.algorithm = ci::AdaptationAlgorithm::RegretBased;
    params.learningRate = 0.1;

    auto updated = ci::WeightAdaptationEngine::apply(
        makeBatch(), makeWeights(), params, extractor);
    QVERIFY(updated.has_value());
    QVERIFY(std::abs(updated->value(QStringLiteral("semantic")).value - 0.23) < 1e-9);

    params.learningRate = 1.0;
    updated = ci::WeightAdaptationEngine::apply(makeBatch(), makeWeights(), params, extractor);
    QVERIFY(updated.has_value());
    // 0.05 - 1.0 * (1.0 - 0.05) is negative and clamps to zero.
    QCOMPARE(updated->value(QStringLiteral("recency")).value, 0.0);
    QCOMPARE(updated->value(QStringLiteral("semantic")).value, 0.0);
}

void TestWeightAdaptation::testApplyLeavesInputUntouched()
{
    QHash<QString, ci::FeatureSignal> fixed;
    fixed.insert(QStringLiteral("semantic"), strongSignal());
    fixed.insert(QStringLiteral("graph"), strongSignal());
    FixedSignalExtractor extractor(fixed);

    const ci::AdaptiveWeights before = makeWeights();
    ci::AdaptiveWeights input = before;
    const auto updated = ci::WeightAdaptationEngine::apply(
        makeBatch(), input, ci::WeightAdaptationEngine::Params{}, extractor);
    QVERIFY(updated.has_value());
    QVERIFY(input == before);
    QVERIFY(updated.value() != before);
}

void TestWeightAdaptation::testApplyEmptyBatch()
{
    QHash<QString, ci::FeatureSignal> fixed;
    fixed.insert(QStringLiteral("semantic"), strongSignal());
    FixedSignalExtractor extractor(fixed);

    ci::LearningError error;
    const auto updated = ci::WeightAdaptationEngine::apply(
        {}, makeWeights(), ci::WeightAdaptationEngine::Params{}, extractor, &error);
    QVERIFY(!updated.has_value());
    QCOMPARE(error.kind, ci::LearningErrorKind::EmptyBatch);
}

void TestWeightAdaptation::testApplyWithoutSignals()
{
    FixedSignalExtractor extractor(QHash<QString, ci::FeatureSignal>{});

    ci::LearningError error;
    const auto updated = ci::WeightAdaptationEngine::apply(
        makeBatch(), makeWeights(), ci::WeightAdaptationEngine::Params{}, extractor, &error);
    QVERIFY(!updated.has_value());
    QCOMPARE(error.kind, ci::LearningErrorKind::EmptyBatch);
}

QTEST_MAIN(TestWeightAdaptation)
#include "test_weight_adaptation.moc"
