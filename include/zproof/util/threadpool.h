// ZPROOF - Thread Pool
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// Fixed set of named workers draining a bounded FIFO queue. The HTTP server
// runs one task per accepted connection on it and answers 503 when the
// queue is full.

#ifndef ZPROOF_UTIL_THREADPOOL_H
#define ZPROOF_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace zproof {
namespace util {

class ThreadPool {
public:
    using Task = std::function<void()>;

    struct Config {
        size_t numThreads{0};       // 0 = hardware concurrency
        size_t maxQueueSize{1024};  // Tasks waiting for a worker
        std::string name{"pool"};   // Thread name prefix, also used in logs
    };

    /// What happens to queued tasks on Shutdown()
    enum class StopMode {
        Drain,      // Run everything already queued
        Discard     // Drop queued tasks; running ones still finish
    };

    struct Stats {
        size_t threads{0};
        size_t pending{0};
        size_t active{0};
        uint64_t completed{0};
        uint64_t rejected{0};
    };

    ThreadPool();
    explicit ThreadPool(const Config& config);

    /// Shutdown(StopMode::Discard)
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a task. False when stopped or the queue is full.
    bool TrySubmit(Task task);

    /**
     * Queue a callable and get a future for its result. Exceptions thrown by
     * the callable are delivered through the future.
     *
     * @throws std::runtime_error if the pool is stopped or the queue is full
     */
    template<typename F>
    auto Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> result = task->get_future();
        if (!TrySubmit([task]() { (*task)(); })) {
            throw std::runtime_error("ThreadPool '" + config_.name + "' rejected the task");
        }
        return result;
    }

    /// Block until nothing is queued or running
    void Wait();

    /// Stop accepting work and join the workers. Safe to call twice.
    void Shutdown(StopMode mode = StopMode::Discard);

    bool IsRunning() const { return accepting_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    Stats GetStats() const;

private:
    void WorkerLoop(size_t index);

    Config config_;
    std::vector<std::thread> workers_;
    std::deque<Task> queue_;

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;

    std::atomic<bool> accepting_{true};
    bool stopping_{false};          // Guarded by mutex_
    size_t active_{0};              // Guarded by mutex_
    uint64_t completed_{0};         // Guarded by mutex_
    std::atomic<uint64_t> rejected_{0};
};

} // namespace util
} // namespace zproof

#endif // ZPROOF_UTIL_THREADPOOL_H
