#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace pixrecolor {

// Fixed-size pool of std::threads. Jobs are split into contiguous index
// ranges; parallel_for returns once every range of its job has run.
class WorkerPool {
public:
    using RangeFn = std::function<void(size_t begin, size_t end)>;

    // worker_count 0: one thread per hardware thread
    explicit WorkerPool(size_t worker_count = 0, bool verbose = false);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Runs fn over [0, count) in ranges of at most chunk items and joins.
    // Rethrows the first exception raised by fn after all ranges finished.
    void parallel_for(size_t count, size_t chunk, const RangeFn& fn);

    size_t size() const { return threads_.size(); }

private:
    struct Job {
        const RangeFn* fn = nullptr;
        std::mutex mtx;
        std::condition_variable done_cv;
        size_t pending = 0;
        std::exception_ptr error;
    };

    struct Task {
        std::shared_ptr<Job> job;
        size_t begin = 0;
        size_t end = 0;
    };

    void loop();
    void shutdown();
    static void run_task(const Task& task);

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Task> taskq_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    bool verbose_;
};

} // namespace pixrecolor
