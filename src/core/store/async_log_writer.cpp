#include "core/store/async_log_writer.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace vd {

AsyncLogWriter::AsyncLogWriter(PredictionLog* log, EngineMetrics* metrics, int queueLimit)
    : m_log(log)
    , m_metrics(metrics)
    , m_queueLimit(static_cast<size_t>(std::max(1, queueLimit)))
{
    m_thread = std::thread(&AsyncLogWriter::writerLoop, this);
}

AsyncLogWriter::~AsyncLogWriter()
{
    shutdown();
}

// ── Enqueue ─────────────────────────────────────────────────

bool AsyncLogWriter::enqueue(PredictionRecord record)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            LOG_WARN(vdStore, "AsyncLogWriter: enqueue after shutdown, dropping %s",
                     qUtf8Printable(record.response.requestId));
            if (m_metrics) {
                EngineMetrics::bump(m_metrics->predictionLogFailures);
            }
            return false;
        }
        if (m_queue.size() >= m_queueLimit) {
            LOG_WARN(vdStore, "AsyncLogWriter: queue at capacity (%d), dropping %s",
                     static_cast<int>(m_queueLimit),
                     qUtf8Printable(record.response.requestId));
            if (m_metrics) {
                EngineMetrics::bump(m_metrics->predictionLogFailures);
            }
            return false;
        }
        m_queue.push_back(std::move(record));
    }
    m_cv.notify_one();
    return true;
}

std::optional<PredictionRecord> AsyncLogWriter::pending(const QString& requestId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_inFlight && m_inFlight->response.requestId == requestId) {
        return m_inFlight;
    }
    for (auto it = m_queue.rbegin(); it != m_queue.rend(); ++it) {
        if (it->response.requestId == requestId) {
            return *it;
        }
    }
    return std::nullopt;
}

// ── Flush / shutdown ────────────────────────────────────────

void AsyncLogWriter::flush()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_queue.empty() && !m_inFlight; });
}

void AsyncLogWriter::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_idleCv.notify_all();
}

size_t AsyncLogWriter::queueDepth() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

qint64 AsyncLogWriter::written() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_written;
}

// ── Writer thread ───────────────────────────────────────────

void AsyncLogWriter::writerLoop()
{
    for (;;) {
        PredictionRecord record;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_shutdown || !m_queue.empty(); });
            // Drain what was accepted before shutdown.
            if (m_queue.empty()) {
                return;
            }
            record = std::move(m_queue.front());
            m_queue.pop_front();
            m_inFlight = record;
        }

        QString error;
        const bool ok = m_log && m_log->appendPrediction(record, &error);
        if (!ok) {
            LOG_WARN(vdStore, "AsyncLogWriter: failed to log %s: %s",
                     qUtf8Printable(record.response.requestId),
                     qUtf8Printable(m_log ? error : QStringLiteral("no prediction log")));
            if (m_metrics) {
                EngineMetrics::bump(m_metrics->predictionLogFailures);
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_inFlight.reset();
            if (ok) {
                ++m_written;
            }
        }
        m_idleCv.notify_all();
    }
}

} // namespace vd
