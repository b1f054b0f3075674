#pragma once

#include "core/models/classifier.h"

#include <QString>

#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace vd {

// Fixed set of worker threads that run classifier calls so the caller can
// bound how long it waits. A call that outlives its wait keeps running on
// the worker; its result is discarded.
class InferencePool {
public:
    struct Result {
        enum class Status {
            Ok,
            Error,
            Timeout,
            QueueFull,
        };

        Status status = Status::Error;
        std::vector<double> probabilities;
        QString error;
    };

    InferencePool(int workers, int queueLimit);
    ~InferencePool();

    InferencePool(const InferencePool&) = delete;
    InferencePool& operator=(const InferencePool&) = delete;

    // timeoutMs <= 0 runs the call inline on the calling thread.
    Result run(std::shared_ptr<const Classifier> model, const FeatureArray& features, int timeoutMs);

    static Result invoke(const Classifier& model, const FeatureArray& features);

private:
    struct Task {
        std::shared_ptr<const Classifier> model;
        FeatureArray features{};
        qint64 deadlineMs = 0;
        std::promise<Result> promise;
    };

    void workerLoop();

    int m_queueLimit = 0;
    std::vector<std::thread> m_threads;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::shared_ptr<Task>> m_queue;
    bool m_stop = false;
};

} // namespace vd
