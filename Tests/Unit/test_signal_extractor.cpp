#include <QtTest/QtTest>
#include "core/learning/signal_extractor.h"

#include <cmath>

class TestSignalExtractor : public QObject {
    Q_OBJECT

private slots:
    void testNeutralBatchYieldsNoSignal();
    void testPositiveQueryScalesEveryWeight();
    void testMixedQueries();
    void testKeepsFeatureRatios();
    void testTargetClampedAtOne();
    void testEmptyInputs();

private:
    static ci::FeedbackEvent makeEvent(const QString& query, double relevance);
    static ci::AdaptiveWeights makeWeights();
};

ci::FeedbackEvent TestSignalExtractor::makeEvent(const QString& query, double relevance)
{
    ci::FeedbackEvent event;
    event.query = query;
    event.resultId = QStringLiteral("lib/%1.h").arg(query);
    event.relevanceScore = relevance;
    event.timestamp = QDateTime::currentDateTimeUtc();
    return event;
}

ci::AdaptiveWeights TestSignalExtractor::makeWeights()
{
    ci::AdaptiveWeights weights;
    ci::AdaptiveWeight semantic;
    semantic.name = QStringLiteral("semantic");
    semantic.value = 0.3;
    semantic.confidence = 0.8;
    weights.insert(semantic.name, semantic);

    ci::AdaptiveWeight recency;
    recency.name = QStringLiteral("recency");
    recency.value = 0.1;
    recency.confidence = 0.6;
    weights.insert(recency.name, recency);
    return weights;
}

void TestSignalExtractor::testNeutralBatchYieldsNoSignal()
{
    const QVector<ci::FeedbackEvent> batch = {
        makeEvent(QStringLiteral("tokenize"), 0.5),
        makeEvent(QStringLiteral("tokenize"), 0.6),
        makeEvent(QStringLiteral("lexer"), 0.4),
    };

    ci::QueryGroupedSignalExtractor extractor;
    QVERIFY(extractor.extract(batch, makeWeights()).isEmpty());
}

void TestSignalExtractor::testPositiveQueryScalesEveryWeight()
{
    const QVector<ci::FeedbackEvent> batch = {
        makeEvent(QStringLiteral("tokenize"), 1.0),
        makeEvent(QStringLiteral("tokenize"), 0.8),
    };

    ci::QueryGroupedSignalExtractor extractor;
    const QHash<QString, ci::FeatureSignal> result = extractor.extract(batch, makeWeights());

    QCOMPARE(result.size(), 2);
    QVERIFY(std::abs(result.value(QStringLiteral("semantic")).observed - 0.315) < 1e-9);
    QVERIFY(std::abs(result.value(QStringLiteral("recency")).observed - 0.105) < 1e-9);
    QVERIFY(std::abs(result.value(QStringLiteral("semantic")).confidence - 1.0) < 1e-9);
    QCOMPARE(result.value(QStringLiteral("semantic")).samples, 2);
}

void TestSignalExtractor::testMixedQueries()
{
    // "good" reinforces, "bad" penalizes, "meh" is neutral.
    const QVector<ci::FeedbackEvent> batch = {
        makeEvent(QStringLiteral("good"), 0.9),
        makeEvent(QStringLiteral("bad"), 0.1),
        makeEvent(QStringLiteral("bad"), 0.2),
        makeEvent(QStringLiteral("meh"), 0.5),
    };

    ci::QueryGroupedSignalExtractor extractor;
    const auto result = extractor.extract(batch, makeWeights());
    QCOMPARE(result.size(), 2);

    const ci::FeatureSignal semantic = result.value(QStringLiteral("semantic"));
    QVERIFY(std::abs(semantic.observed - 0.3 * 1.05 * 0.9) < 1e-9);
    QVERIFY(std::abs(semantic.confidence - 2.0 / 3.0) < 1e-9);
    QCOMPARE(semantic.samples, 3);
}

void TestSignalExtractor::testKeepsFeatureRatios()
{
    const QVector<ci::FeedbackEvent> batch = {
        makeEvent(QStringLiteral("a"), 0.95),
        makeEvent(QStringLiteral("b"), 0.75),
        makeEvent(QStringLiteral("c"), 0.0),
    };

    ci::QueryGroupedSignalExtractor extractor;
    const auto result = extractor.extract(batch, makeWeights());
    const double ratio = result.value(QStringLiteral("semantic")).observed
        / result.value(QStringLiteral("recency")).observed;
    QVERIFY(std::abs(ratio - 3.0) < 1e-9);
}

void TestSignalExtractor::testTargetClampedAtOne()
{
    ci::AdaptiveWeights weights = makeWeights();
    weights[QStringLiteral("semantic")].value = 0.99;

    ci::QueryGroupedSignalExtractor extractor;
    const auto result = extractor.extract({makeEvent(QStringLiteral("q"), 1.0)}, weights);
    QCOMPARE(result.value(QStringLiteral("semantic")).observed, 1.0);
}

void TestSignalExtractor::testEmptyInputs()
{
    ci::QueryGroupedSignalExtractor extractor;
    QVERIFY(extractor.extract({}, makeWeights()).isEmpty());
    QVERIFY(extractor.extract({makeEvent(QStringLiteral("q"), 1.0)}, ci::AdaptiveWeights()).isEmpty());
}

QTEST_MAIN(TestSignalExtractor)
#include "test_signal_extractor.moc"
