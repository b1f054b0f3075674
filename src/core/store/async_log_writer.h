#pragma once

#include "core/shared/engine_metrics.h"
#include "core/store/record_store.h"

#include <QString>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace vd {

// AsyncLogWriter -- moves prediction logging off the response path.
//
// enqueue() never blocks on the store. A full queue refuses the record and
// counts it as a log failure, as does any store error on the writer thread.
// Records still waiting in the queue are visible through pending() so that
// feedback arriving right after a prediction can find it.
class AsyncLogWriter {
public:
    AsyncLogWriter(PredictionLog* log, EngineMetrics* metrics, int queueLimit);
    ~AsyncLogWriter();

    AsyncLogWriter(const AsyncLogWriter&) = delete;
    AsyncLogWriter& operator=(const AsyncLogWriter&) = delete;

    bool enqueue(PredictionRecord record);
    std::optional<PredictionRecord> pending(const QString& requestId) const;

    // Blocks until every record accepted so far has been written or failed.
    void flush();
    void shutdown();

    size_t queueDepth() const;
    qint64 written() const;

private:
    void writerLoop();

    PredictionLog* m_log = nullptr;
    EngineMetrics* m_metrics = nullptr;
    size_t m_queueLimit = 0;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<PredictionRecord> m_queue;
    // The record being written is kept here until the store call returns.
    std::optional<PredictionRecord> m_inFlight;
    qint64 m_written = 0;
    bool m_shutdown = false;
    std::thread m_thread;
};

} // namespace vd
