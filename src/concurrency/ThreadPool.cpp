#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace aax::concurrency;
using namespace aax::log;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    const auto n = nThreads == 0 ? std::max(2u, std::thread::hardware_concurrency()) : nThreads;
    threads_.reserve(n);
    for (unsigned int i = 0; i < n; ++i) threads_.emplace_back([this] { workerLoop(); });

    if (Registry::isInitialized()) Registry::aaxpipe()->debug("[ThreadPool] Started {} workers", n);
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (stopFlag_.exchange(true) && threads_.empty()) return;
        std::queue<std::shared_ptr<Task>> dropped;
        std::swap(queue_, dropped);
    }
    cv_.notify_all();

    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) t.detach();
        else t.join();
    }
    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex_);
        if (stopFlag_.load()) throw std::runtime_error("ThreadPool is stopped, cannot submit " + task->name());
        queue_.push(std::move(task));
    }
    cv_.notify_one();
}

void ThreadPool::workerLoop() {
    while (true) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopFlag_.load() || !queue_.empty(); });
            if (stopFlag_.load() && queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop();
        }

        try {
            (*task)();
        } catch (const std::exception& e) {
            if (Registry::isInitialized())
                Registry::aaxpipe()->error("[ThreadPool] Task '{}' threw: {}", task->name(), e.what());
        }
    }
}
