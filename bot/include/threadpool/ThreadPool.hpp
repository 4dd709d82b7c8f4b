// ThreadPool.hpp
#pragma once

#include <vector>
#include <thread>
#include <atomic>
#include <functional>
#include <mutex>
#include <condition_variable>

#include "threadpool/Task.hpp"
#include "threadpool/TaskQueue.hpp"

class ThreadPool {
public:
    explicit ThreadPool(int threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t getWorkerCount() const { return workers.size(); }

    // Trả về số task đang trong hệ thống trước khi thêm task này
    std::size_t submit(Task task);

    // Đếm task đang "trong hệ thống" (đang chờ + đang chạy)
    std::size_t getPendingTaskCount() const {
        return pendingTasks.load(std::memory_order_relaxed);
    }

    // Block tới khi không còn task chờ/chạy
    void waitIdle();

private:
    void workerLoop();

    TaskQueue queue;
    std::vector<std::thread> workers;
    std::atomic<bool> stop{false};
    std::atomic<std::size_t> pendingTasks{0};

    std::condition_variable cv;
    std::condition_variable idleCv;
    std::mutex queueMutex;
};
