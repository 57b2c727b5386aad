// ZPROOF - Thread Pool Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include "zproof/util/threadpool.h"

#include "zproof/util/logging.h"

#ifdef __linux__
#include <pthread.h>
#endif

namespace zproof {
namespace util {

namespace {

size_t ResolveThreadCount(size_t requested) {
    if (requested != 0) {
        return requested;
    }
    unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 2 : hw;
}

void NameCurrentThread(const std::string& name) {
#ifdef __linux__
    // Linux limits thread names to 15 characters
    std::string shortName = name.substr(0, 15);
    if (pthread_setname_np(pthread_self(), shortName.c_str()) != 0) {
        LOG_DEBUG(LogCategory::DEFAULT) << "Cannot name thread " << shortName;
    }
#else
    (void)name;
#endif
}

} // namespace

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    size_t count = ResolveThreadCount(config_.numThreads);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this, i]() { WorkerLoop(i); });
    }
    LOG_DEBUG(LogCategory::DEFAULT) << "Thread pool '" << config_.name << "' started "
                                    << count << " workers, queue limit " << config_.maxQueueSize;
}

ThreadPool::~ThreadPool() {
    Shutdown(StopMode::Discard);
}

bool ThreadPool::TrySubmit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || queue_.size() >= config_.maxQueueSize) {
            ++rejected_;
            return false;
        }
        queue_.push_back(std::move(task));
    }
    workAvailable_.notify_one();
    return true;
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void ThreadPool::Shutdown(StopMode mode) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        accepting_.store(false);
        if (mode == StopMode::Discard && !queue_.empty()) {
            LOG_DEBUG(LogCategory::DEFAULT) << "Thread pool '" << config_.name << "' dropping "
                                            << queue_.size() << " queued tasks";
            queue_.clear();
        }
    }
    workAvailable_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    idle_.notify_all();
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

ThreadPool::Stats ThreadPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.threads = workers_.size();
    stats.pending = queue_.size();
    stats.active = active_;
    stats.completed = completed_;
    stats.rejected = rejected_.load();
    return stats;
}

void ThreadPool::WorkerLoop(size_t index) {
    NameCurrentThread(config_.name + "-" + std::to_string(index));

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        workAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            return;  // Stopping with nothing left to drain
        }

        Task task = std::move(queue_.front());
        queue_.pop_front();
        ++active_;
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::DEFAULT) << "Task on " << config_.name
                                            << " threw: " << e.what();
        }
        task = nullptr;

        lock.lock();
        --active_;
        ++completed_;
        if (queue_.empty() && active_ == 0) {
            idle_.notify_all();
        }
    }
}

} // namespace util
} // namespace zproof
