#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace callguard::recording {

struct UploadTask {
    std::string recording_id;
    int sequence_number = 0;
};

// Bounded worker pool for segment uploads. Tasks of one recording run strictly
// in submission order, one at a time; different recordings run in parallel.
class UploadPool {
public:
    using UploadFn = std::function<void(const UploadTask& task)>;

    UploadPool(int workers, UploadFn upload_fn);
    ~UploadPool();

    UploadPool(const UploadPool&) = delete;
    UploadPool& operator=(const UploadPool&) = delete;

    // Returns false when the pool is stopped or the same segment is already
    // queued or in flight.
    bool submit(const UploadTask& task);
    // Blocks until nothing is queued or in flight.
    void drain();
    void shutdown();

private:
    void run();

    UploadFn upload_fn_;
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, std::deque<UploadTask>> queues_;
    // Recordings with queued work and nothing in flight.
    std::deque<std::string> ready_;
    // Recording id -> sequence number being uploaded.
    std::unordered_map<std::string, int> inflight_;
    bool shutdown_ = false;
    std::vector<std::thread> workers_;
};

}
