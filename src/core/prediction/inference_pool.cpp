#include "core/prediction/inference_pool.h"

#include <QDateTime>

#include <algorithm>
#include <chrono>
#include <exception>

namespace vd {

InferencePool::InferencePool(int workers, int queueLimit)
    : m_queueLimit(std::max(1, queueLimit))
{
    const int count = std::max(1, workers);
    m_threads.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        m_threads.emplace_back([this]() {
            workerLoop();
        });
    }
}

InferencePool::~InferencePool()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();
    for (std::thread& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

InferencePool::Result InferencePool::invoke(const Classifier& model, const FeatureArray& features)
{
    Result result;
    try {
        result.probabilities = model.predictProba(features);
        result.status = Result::Status::Ok;
    } catch (const std::exception& ex) {
        result.status = Result::Status::Error;
        result.error = QString::fromUtf8(ex.what());
    } catch (...) {
        result.status = Result::Status::Error;
        result.error = QStringLiteral("unknown_exception");
    }
    return result;
}

void InferencePool::workerLoop()
{
    for (;;) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&]() {
                return m_stop || !m_queue.empty();
            });
            if (m_stop && m_queue.empty()) {
                return;
            }
            task = m_queue.front();
            m_queue.pop_front();
        }

        if (task->deadlineMs > 0 && QDateTime::currentMSecsSinceEpoch() > task->deadlineMs) {
            Result expired;
            expired.status = Result::Status::Timeout;
            expired.error = QStringLiteral("deadline_exceeded");
            task->promise.set_value(std::move(expired));
            continue;
        }

        task->promise.set_value(invoke(*task->model, task->features));
    }
}

InferencePool::Result InferencePool::run(std::shared_ptr<const Classifier> model,
                                         const FeatureArray& features,
                                         int timeoutMs)
{
    if (!model) {
        Result missing;
        missing.error = QStringLiteral("model_missing");
        return missing;
    }
    if (timeoutMs <= 0) {
        return invoke(*model, features);
    }

    auto task = std::make_shared<Task>();
    task->model = std::move(model);
    task->features = features;
    task->deadlineMs = QDateTime::currentMSecsSinceEpoch() + timeoutMs;
    std::future<Result> future = task->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (static_cast<int>(m_queue.size()) >= m_queueLimit) {
            Result full;
            full.status = Result::Status::QueueFull;
            full.error = QStringLiteral("queue_full");
            return full;
        }
        m_queue.push_back(task);
    }
    m_cv.notify_one();

    if (future.wait_for(std::chrono::milliseconds(timeoutMs)) == std::future_status::ready) {
        return future.get();
    }

    Result timedOut;
    timedOut.status = Result::Status::Timeout;
    timedOut.error = QStringLiteral("inference_timeout");
    return timedOut;
}

} // namespace vd
