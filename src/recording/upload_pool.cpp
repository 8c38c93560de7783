#include "callguard/recording/upload_pool.hpp"

#include <algorithm>

#include "callguard/logging.hpp"

namespace callguard::recording {

UploadPool::UploadPool(int workers, UploadFn upload_fn)
    : upload_fn_(std::move(upload_fn)) {
    const int count = std::max(1, workers);
    workers_.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        workers_.emplace_back(&UploadPool::run, this);
    }
}

UploadPool::~UploadPool() {
    shutdown();
}

bool UploadPool::submit(const UploadTask& task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            logging::warn("Upload pool stopped, dropping task",
                          {kv("recording_id", task.recording_id),
                           kv("sequence", task.sequence_number)});
            return false;
        }
        const auto running = inflight_.find(task.recording_id);
        if (running != inflight_.end() && running->second == task.sequence_number) {
            return false;
        }
        auto& queue = queues_[task.recording_id];
        const bool queued = std::any_of(queue.begin(), queue.end(), [&](const UploadTask& t) {
            return t.sequence_number == task.sequence_number;
        });
        if (queued) {
            return false;
        }
        const bool was_idle = queue.empty() && running == inflight_.end();
        queue.push_back(task);
        if (was_idle) {
            ready_.push_back(task.recording_id);
        }
    }
    work_cv_.notify_one();
    return true;
}

void UploadPool::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [&]() { return shutdown_ || (queues_.empty() && inflight_.empty()); });
}

void UploadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void UploadPool::run() {
    while (true) {
        UploadTask task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [&]() { return shutdown_ || !ready_.empty(); });
            if (shutdown_) {
                return;
            }
            const auto recording_id = ready_.front();
            ready_.pop_front();
            auto& queue = queues_[recording_id];
            task = queue.front();
            queue.pop_front();
            inflight_[recording_id] = task.sequence_number;
        }

        try {
            upload_fn_(task);
        } catch (const std::exception& ex) {
            logging::error("Segment upload task failed",
                           {kv("recording_id", task.recording_id),
                            kv("sequence", task.sequence_number),
                            kv("error", ex.what())});
        }

        bool notify_work = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inflight_.erase(task.recording_id);
            auto it = queues_.find(task.recording_id);
            if (it != queues_.end()) {
                if (it->second.empty()) {
                    queues_.erase(it);
                } else {
                    ready_.push_back(task.recording_id);
                    notify_work = true;
                }
            }
        }
        if (notify_work) {
            work_cv_.notify_one();
        }
        idle_cv_.notify_all();
    }
}

}
