#include "loop.hpp"

#include <iostream>

namespace shareflow {

void Loop::Run() {
    while (true)
    {
        Task task;

        {
            std::unique_lock<std::mutex> lock(Mutex_);
            Cv_.wait(lock, [this]{
                return Stopped_ || !TaskQueue_.empty();
            });
            if (Stopped_) {
                return;
            }
            task = std::move(TaskQueue_.front());
            TaskQueue_.pop();
        }
        Execute(task);
    }
}

void Loop::Stop() {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Stopped_ = true;
    }

    Cv_.notify_all();
}

size_t Loop::RunPending() {
    size_t executed = 0;
    while (true)
    {
        Task task;

        {
            std::lock_guard<std::mutex> lock(Mutex_);
            if (TaskQueue_.empty()) {
                return executed;
            }
            task = std::move(TaskQueue_.front());
            TaskQueue_.pop();
        }
        Execute(task);
        ++executed;
    }
}

void Loop::EnqueueTask(Task&& task) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        if (Stopped_) {
            return;
        }
        TaskQueue_.push(std::move(task));
    }

    Cv_.notify_one();
}

void Loop::Execute(Task& task) {
    // Failures stay local to the task.
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[Loop] Task failed: " << e.what() << std::endl;
    }
}

} //namespace shareflow
