#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace aax::concurrency {

// Fixed set of workers draining a FIFO of blocking tasks: transfers, ffmpeg
// runs, backend calls. Tasks report their own results; an exception escaping
// a task is logged and dropped.
class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks and joins the workers once their current task returns.
    void stop();

    // Throws std::runtime_error after stop().
    void submit(std::shared_ptr<Task> task);

private:
    void workerLoop();

    std::vector<std::thread> threads_;

    std::condition_variable cv_;
    std::mutex mutex_;
    std::queue<std::shared_ptr<Task>> queue_;

    std::atomic<bool> stopFlag_{false};
};

}
