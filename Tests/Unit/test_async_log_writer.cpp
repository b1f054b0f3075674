#include <QtTest/QtTest>

#include "core/store/async_log_writer.h"

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace {

// Holds every append until open() is called.
class GatedPredictionLog : public vd::PredictionLog {
public:
    bool appendPrediction(const vd::PredictionRecord& record, QString* errorOut) override
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        ++m_entered;
        m_cv.wait(lock, [this] { return m_open; });
        if (m_fail) {
            if (errorOut) {
                *errorOut = QStringLiteral("disk full");
            }
            return false;
        }
        m_ids.append(record.response.requestId);
        return true;
    }
    std::optional<vd::PredictionRecord> findPrediction(const QString&) override { return std::nullopt; }
    bool featureWindow(const QString&, const QDateTime&, const QDateTime&, int,
                       std::vector<vd::FeatureArray>*, QString*) override
    {
        return false;
    }

    void open()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_open = true;
        }
        m_cv.notify_all();
    }
    void setFailing(bool fail)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fail = fail;
    }
    int entered()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entered;
    }
    QStringList ids()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_ids;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open = false;
    bool m_fail = false;
    int m_entered = 0;
    QStringList m_ids;
};

vd::PredictionRecord record(const QString& requestId)
{
    vd::PredictionRecord out;
    out.response.requestId = requestId;
    out.response.modelVersion = QStringLiteral("rf-1");
    out.createdAt = QDateTime::currentDateTimeUtc();
    out.expiresAt = out.createdAt.addDays(90);
    return out;
}

} // namespace

class TestAsyncLogWriter : public QObject {
    Q_OBJECT

private slots:
    void testWritesInOrder();
    void testPendingVisibleBeforeWrite();
    void testFullQueueRefusesAndCounts();
    void testStoreFailureIsCounted();
    void testShutdownDrainsQueue();
};

void TestAsyncLogWriter::testWritesInOrder()
{
    GatedPredictionLog log;
    log.open();
    vd::EngineMetrics metrics;
    vd::AsyncLogWriter writer(&log, &metrics, 16);

    for (int i = 0; i < 5; ++i) {
        QVERIFY(writer.enqueue(record(QStringLiteral("req-%1").arg(i))));
    }
    writer.flush();

    QCOMPARE(writer.written(), qint64(5));
    QCOMPARE(writer.queueDepth(), size_t(0));
    QCOMPARE(log.ids(), QStringList({QStringLiteral("req-0"), QStringLiteral("req-1"),
                                     QStringLiteral("req-2"), QStringLiteral("req-3"),
                                     QStringLiteral("req-4")}));
    QCOMPARE(metrics.predictionLogFailures.load(), qint64(0));
}

void TestAsyncLogWriter::testPendingVisibleBeforeWrite()
{
    GatedPredictionLog log;
    vd::AsyncLogWriter writer(&log, nullptr, 16);

    QVERIFY(writer.enqueue(record(QStringLiteral("in-flight"))));
    QTRY_COMPARE(log.entered(), 1);
    QVERIFY(writer.enqueue(record(QStringLiteral("queued"))));

    QVERIFY(writer.pending(QStringLiteral("in-flight")));
    QVERIFY(writer.pending(QStringLiteral("queued")));
    QVERIFY(!writer.pending(QStringLiteral("unknown")));

    log.open();
    writer.flush();
    QVERIFY(!writer.pending(QStringLiteral("in-flight")));
    QVERIFY(!writer.pending(QStringLiteral("queued")));
}

void TestAsyncLogWriter::testFullQueueRefusesAndCounts()
{
    GatedPredictionLog log;
    vd::EngineMetrics metrics;
    vd::AsyncLogWriter writer(&log, &metrics, 2);

    QVERIFY(writer.enqueue(record(QStringLiteral("a"))));
    QTRY_COMPARE(log.entered(), 1);
    QVERIFY(writer.enqueue(record(QStringLiteral("b"))));
    QVERIFY(writer.enqueue(record(QStringLiteral("c"))));
    QVERIFY(!writer.enqueue(record(QStringLiteral("d"))));
    QCOMPARE(writer.queueDepth(), size_t(2));
    QCOMPARE(metrics.predictionLogFailures.load(), qint64(1));

    log.open();
    writer.flush();
    QCOMPARE(writer.written(), qint64(3));
}

void TestAsyncLogWriter::testStoreFailureIsCounted()
{
    GatedPredictionLog log;
    log.setFailing(true);
    log.open();
    vd::EngineMetrics metrics;
    vd::AsyncLogWriter writer(&log, &metrics, 4);

    QVERIFY(writer.enqueue(record(QStringLiteral("req-1"))));
    writer.flush();
    QCOMPARE(writer.written(), qint64(0));
    QCOMPARE(metrics.predictionLogFailures.load(), qint64(1));
}

void TestAsyncLogWriter::testShutdownDrainsQueue()
{
    GatedPredictionLog log;
    vd::EngineMetrics metrics;
    vd::AsyncLogWriter writer(&log, &metrics, 8);

    for (int i = 0; i < 3; ++i) {
        QVERIFY(writer.enqueue(record(QStringLiteral("req-%1").arg(i))));
    }
    log.open();
    writer.shutdown();

    QCOMPARE(log.ids().size(), 3);
    QVERIFY(!writer.enqueue(record(QStringLiteral("late"))));
    QCOMPARE(metrics.predictionLogFailures.load(), qint64(1));
}

QTEST_MAIN(TestAsyncLogWriter)
#include "test_async_log_writer.moc"
