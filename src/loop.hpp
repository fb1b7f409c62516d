#pragma once

#include <condition_variable>
#include <mutex>
#include <functional>
#include <queue>

namespace shareflow {

using Task = std::function<void()>;

// Single consumer task queue. Every mutation of relay or peer state is posted
// here so that transitions never run concurrently.
class Loop {
public:
    void EnqueueTask(Task&& task);

    // Blocks until Stop() is called.
    void Run();
    void Stop();

    // Runs queued tasks on the calling thread until the queue is empty,
    // including tasks enqueued while draining. Returns the number executed.
    size_t RunPending();

private:
    void Execute(Task& task);

private:
    std::mutex Mutex_;
    std::condition_variable Cv_;
    std::queue<Task> TaskQueue_;
    bool Stopped_ = false;
};

} // namespace shareflow
