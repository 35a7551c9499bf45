#include <QtTest/QtTest>
#include "core/feedback/feedback_buffer.h"

#include <mutex>
#include <thread>
#include <vector>

class TestFeedbackBuffer : public QObject {
    Q_OBJECT

private slots:
    void testBelowThresholdKeepsEvents();
    void testThresholdDetachesBatch();
    void testFlushReturnsPartialBatch();
    void testFlushOnEmptyBuffer();
    void testThresholdClampedToOne();
    void testConcurrentProducersLoseNothing();

private:
    static ci::FeedbackEvent makeEvent(const QString& query, double relevance);
};

ci::FeedbackEvent TestFeedbackBuffer::makeEvent(const QString& query, double relevance)
{
    ci::FeedbackEvent event;
    event.query = query;
    event.resultId = QStringLiteral("src/%1.cpp").arg(query);
    event.relevanceScore = relevance;
    event.timestamp = QDateTime::currentDateTimeUtc();
    return event;
}

void TestFeedbackBuffer::testBelowThresholdKeepsEvents()
{
    ci::FeedbackBuffer buffer(3);
    QVERIFY(!buffer.collect(makeEvent(QStringLiteral("a"), 0.9)).has_value());
    QVERIFY(!buffer.collect(makeEvent(QStringLiteral("b"), 0.1)).has_value());
    QCOMPARE(buffer.size(), 2);
}

void TestFeedbackBuffer::testThresholdDetachesBatch()
{
    ci::FeedbackBuffer buffer(3);
    buffer.collect(makeEvent(QStringLiteral("a"), 0.9));
    buffer.collect(makeEvent(QStringLiteral("b"), 0.5));
    const auto batch = buffer.collect(makeEvent(QStringLiteral("c"), 0.1));

    QVERIFY(batch.has_value());
    QCOMPARE(batch->size(), 3);
    QCOMPARE(batch->at(0).query, QStringLiteral("a"));
    QCOMPARE(batch->at(2).query, QStringLiteral("c"));
    QCOMPARE(buffer.size(), 0);

    // The next event starts a fresh batch.
    QVERIFY(!buffer.collect(makeEvent(QStringLiteral("d"), 0.4)).has_value());
    QCOMPARE(buffer.size(), 1);
}

void TestFeedbackBuffer::testFlushReturnsPartialBatch()
{
    ci::FeedbackBuffer buffer(10);
    buffer.collect(makeEvent(QStringLiteral("a"), 0.9));
    buffer.collect(makeEvent(QStringLiteral("b"), 0.2));

    const QVector<ci::FeedbackEvent> flushed = buffer.flush();
    QCOMPARE(flushed.size(), 2);
    QCOMPARE(buffer.size(), 0);
}

void TestFeedbackBuffer::testFlushOnEmptyBuffer()
{
    ci::FeedbackBuffer buffer;
    QCOMPARE(buffer.batchThreshold(), ci::FeedbackBuffer::DEFAULT_BATCH_THRESHOLD);
    QVERIFY(buffer.flush().isEmpty());
    QCOMPARE(buffer.size(), 0);
}

void TestFeedbackBuffer::testThresholdClampedToOne()
{
    ci::FeedbackBuffer buffer(0);
    QCOMPARE(buffer.batchThreshold(), 1);
    const auto batch = buffer.collect(makeEvent(QStringLiteral("a"), 0.7));
    QVERIFY(batch.has_value());
    QCOMPARE(batch->size(), 1);
}

void TestFeedbackBuffer::testConcurrentProducersLoseNothing()
{
    constexpr int kThreads = 8;
    constexpr int kEventsPerThread = 250;
    constexpr int kThreshold = 7;

    ci::FeedbackBuffer buffer(kThreshold);
    std::mutex batchesMutex;
    QVector<int> batchSizes;

    std::vector<std::thread> producers;
    for (int t = 0; t < kThreads; ++t) {
        producers.emplace_back([&, t]() {
            for (int i = 0; i < kEventsPerThread; ++i) {
                auto batch = buffer.collect(
                    makeEvent(QStringLiteral("q%1").arg(t), (i % 10) / 10.0));
                if (batch.has_value()) {
                    std::lock_guard<std::mutex> lock(batchesMutex);
                    batchSizes.push_back(static_cast<int>(batch->size()));
                }
            }
        });
    }
    for (std::thread& producer : producers) {
        producer.join();
    }

    int total = buffer.flush().size();
    for (int size : batchSizes) {
        QCOMPARE(size, kThreshold);
        total += size;
    }
    QCOMPARE(total, kThreads * kEventsPerThread);
}

QTEST_MAIN(TestFeedbackBuffer)
#include "test_feedback_buffer.moc"
