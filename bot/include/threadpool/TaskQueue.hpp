#pragma once

#include "Task.hpp"
#include <queue>
#include <mutex>

// FIFO queue, ThreadPool kéo task ra theo thứ tự vào
class TaskQueue {
public:
    TaskQueue() = default;

    void enqueue(Task task) {
        std::lock_guard<std::mutex> lock(mtx_);
        queue_.push(std::move(task));
    }

    // Chỉ gọi khi !empty()
    Task dequeue() {
        std::lock_guard<std::mutex> lock(mtx_);
        Task t = std::move(queue_.front());
        queue_.pop();
        return t;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

private:
    mutable std::mutex mtx_;
    std::queue<Task> queue_;
};
