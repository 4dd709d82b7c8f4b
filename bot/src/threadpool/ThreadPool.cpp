#include "threadpool/ThreadPool.hpp"

#include <stdexcept>

#include "monitor/Logger.hpp"

ThreadPool::ThreadPool(int threads) {
    if (threads <= 0) {
        throw std::invalid_argument("ThreadPool requires at least one worker");
    }

    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            workerLoop();
        });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stop.store(true, std::memory_order_relaxed);
    }
    cv.notify_all();

    for (auto& w : workers) {
        if (w.joinable()) {
            w.join();
        }
    }

    if (!queue.empty()) {
        LOGW("POOL", "Dropping " << queue.size() << " queued task(s) at shutdown");
    }
}

std::size_t ThreadPool::submit(Task task) {
    std::size_t before = pendingTasks.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        queue.enqueue(std::move(task));
    }
    cv.notify_one();
    return before;
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(queueMutex);
    idleCv.wait(lock, [this]() {
        return pendingTasks.load(std::memory_order_relaxed) == 0;
    });
}

void ThreadPool::workerLoop() {
    while (true) {
        Task t;

        {
            std::unique_lock<std::mutex> lock(queueMutex);
            cv.wait(lock, [this]() {
                return stop.load(std::memory_order_relaxed) || !queue.empty();
            });
            if (stop.load(std::memory_order_relaxed)) {
                return;
            }
            t = queue.dequeue();
        }

        if (t.fn) {
            LOGD("POOL", "Running task #" << t.id << " (" << t.kind << ") chat=" << t.chatId);
            try {
                t.fn();
            } catch (const std::exception& e) {
                LOGE("POOL", "Task #" << t.id << " threw: " << e.what());
            }
        } else {
            LOGW("POOL", "Got empty task (fn=null)");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex);
            pendingTasks.fetch_sub(1, std::memory_order_relaxed);
        }
        idleCv.notify_all();
    }
}
