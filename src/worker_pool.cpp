#include "worker_pool.hpp"
#include <algorithm>
#include <iostream>

namespace pixrecolor {

WorkerPool::WorkerPool(size_t worker_count, bool verbose) : verbose_(verbose) {
    if (worker_count == 0) worker_count = std::max(1u, std::thread::hardware_concurrency());
    running_.store(true);
    try {
        threads_.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            threads_.emplace_back(&WorkerPool::loop, this);
        }
    } catch (...) {
        // threads already started must be joined before threads_ goes away
        shutdown();
        std::cerr << "[WorkerPool] POOL_START_FAILED requested=" << worker_count
                  << " started=" << threads_.size() << "\n";
        throw;
    }
    if (verbose_) std::cout << "[WorkerPool] POOL_STARTED workers=" << worker_count << "\n";
}

WorkerPool::~WorkerPool() {
    shutdown();
    if (verbose_) std::cout << "[WorkerPool] POOL_STOPPED workers=" << threads_.size() << "\n";
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_.store(false);
    }
    cv_.notify_all();
    for (auto& th : threads_) {
        if (th.joinable()) th.join();
    }
}

void WorkerPool::parallel_for(size_t count, size_t chunk, const RangeFn& fn) {
    if (count == 0) return;
    if (chunk == 0 || chunk > count) chunk = count;

    auto job = std::make_shared<Job>();
    job->fn = &fn;
    job->pending = (count + chunk - 1) / chunk;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (size_t begin = 0; begin < count; begin += chunk) {
            Task t;
            t.job = job;
            t.begin = begin;
            t.end = std::min(count, begin + chunk);
            taskq_.push_back(std::move(t));
        }
    }
    cv_.notify_all();

    // barrier: every range of this job has finished
    std::unique_lock<std::mutex> lk(job->mtx);
    job->done_cv.wait(lk, [&]{ return job->pending == 0; });
    if (job->error) std::rethrow_exception(job->error);
}

void WorkerPool::run_task(const Task& task) {
    Job& job = *task.job;
    std::exception_ptr err;
    try {
        (*job.fn)(task.begin, task.end);
    } catch (...) {
        err = std::current_exception();
    }

    std::lock_guard<std::mutex> lk(job.mtx);
    if (err && !job.error) job.error = err;
    if (--job.pending == 0) job.done_cv.notify_all();
}

void WorkerPool::loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&]{ return !taskq_.empty() || !running_.load(); });
            if (taskq_.empty()) return; // stopped and drained
            task = std::move(taskq_.front());
            taskq_.pop_front();
        }
        run_task(task);
    }
}

} // namespace pixrecolor
