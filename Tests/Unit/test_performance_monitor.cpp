#include <QtTest/QtTest>
#include "core/learning/performance_monitor.h"

#include <QJsonArray>

#include <cmath>

class TestPerformanceMonitor : public QObject {
    Q_OBJECT

private slots:
    void testCountsAndAccuracy();
    void testEmptyBatchIgnored();
    void testHistoryCap();
    void testUnboundedHistory();
    void testPersistFailures();
    void testJsonShape();

private:
    static QVector<ci::FeedbackEvent> makeBatch(const QVector<double>& relevances);
};

QVector<ci::FeedbackEvent> TestPerformanceMonitor::makeBatch(const QVector<double>& relevances)
{
    QVector<ci::FeedbackEvent> batch;
    for (double relevance : relevances) {
        ci::FeedbackEvent event;
        event.query = QStringLiteral("find main");
        event.resultId = QStringLiteral("src/main.cpp");
        event.relevanceScore = relevance;
        event.timestamp = QDateTime::currentDateTimeUtc();
        batch.push_back(event);
    }
    return batch;
}

void TestPerformanceMonitor::testCountsAndAccuracy()
{
    ci::PerformanceMonitor monitor(0.5, 100);
    monitor.record(makeBatch({0.9, 0.5, 0.2, 0.1}));

    ci::PerformanceSnapshot snapshot = monitor.snapshot();
    QCOMPARE(snapshot.totalFeedback, int64_t(4));
    QCOMPARE(snapshot.positiveFeedback, int64_t(2));
    QCOMPARE(snapshot.negativeFeedback, int64_t(2));
    QCOMPARE(snapshot.modelAccuracy, 0.5);
    QCOMPARE(snapshot.batchesProcessed, int64_t(1));
    QCOMPARE(snapshot.lastBatchSize, 4);
    QCOMPARE(snapshot.performanceHistory.size(), 1);
    QCOMPARE(snapshot.performanceHistory.at(0).feedbackCount, int64_t(4));

    monitor.record(makeBatch({1.0, 0.8}));
    snapshot = monitor.snapshot();
    QCOMPARE(snapshot.totalFeedback, int64_t(6));
    QCOMPARE(snapshot.positiveFeedback + snapshot.negativeFeedback, snapshot.totalFeedback);
    QVERIFY(std::abs(snapshot.modelAccuracy - 4.0 / 6.0) < 1e-9);
    QCOMPARE(snapshot.performanceHistory.size(), 2);
    QVERIFY(snapshot.performanceHistory.at(0).timestamp <= snapshot.performanceHistory.at(1).timestamp);
}

void TestPerformanceMonitor::testEmptyBatchIgnored()
{
    ci::PerformanceMonitor monitor(0.5, 100);
    monitor.record({});
    const ci::PerformanceSnapshot snapshot = monitor.snapshot();
    QCOMPARE(snapshot.totalFeedback, int64_t(0));
    QCOMPARE(snapshot.batchesProcessed, int64_t(0));
    QVERIFY(snapshot.performanceHistory.isEmpty());
}

void TestPerformanceMonitor::testHistoryCap()
{
    ci::PerformanceMonitor monitor(0.5, 3);
    for (int i = 0; i < 5; ++i) {
        monitor.record(makeBatch({0.9}));
    }
    const ci::PerformanceSnapshot snapshot = monitor.snapshot();
    QCOMPARE(snapshot.performanceHistory.size(), 3);
    // The oldest samples are dropped first.
    QCOMPARE(snapshot.performanceHistory.first().feedbackCount, int64_t(3));
    QCOMPARE(snapshot.performanceHistory.last().feedbackCount, int64_t(5));
    QCOMPARE(snapshot.totalFeedback, int64_t(5));
}

void TestPerformanceMonitor::testUnboundedHistory()
{
    ci::PerformanceMonitor monitor(0.5, 0);
    for (int i = 0; i < 150; ++i) {
        monitor.record(makeBatch({0.1}));
    }
    QCOMPARE(monitor.snapshot().performanceHistory.size(), 150);
}

void TestPerformanceMonitor::testPersistFailures()
{
    ci::PerformanceMonitor monitor(0.5, 10);
    monitor.recordPersistFailure(QStringLiteral("database is locked"));
    monitor.recordPersistFailure(QStringLiteral("disk I/O error"));
    const ci::PerformanceSnapshot snapshot = monitor.snapshot();
    QCOMPARE(snapshot.persistFailures, int64_t(2));
    QCOMPARE(snapshot.lastPersistError, QStringLiteral("disk I/O error"));
    QCOMPARE(snapshot.totalFeedback, int64_t(0));
}

void TestPerformanceMonitor::testJsonShape()
{
    ci::PerformanceMonitor monitor(0.7, 10);
    monitor.record(makeBatch({0.75, 0.6}));
    const QJsonObject json = monitor.toJson();
    QCOMPARE(json.value(QStringLiteral("totalFeedback")).toInt(), 2);
    QCOMPARE(json.value(QStringLiteral("positiveFeedback")).toInt(), 1);
    QCOMPARE(json.value(QStringLiteral("modelAccuracy")).toDouble(), 0.5);
    QCOMPARE(json.value(QStringLiteral("performanceHistory")).toArray().size(), 1);
    QCOMPARE(json.value(QStringLiteral("maxHistoryLength")).toInt(), 10);
}

QTEST_MAIN(TestPerformanceMonitor)
#include "test_performance_monitor.moc"
