#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace tether {

/// A single worker thread draining a FIFO of tasks.  Tasks never overlap:
/// each runs to completion before the next one is dequeued.
class SerialExecutor {
public:
    explicit SerialExecutor(std::string name = "serial");
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /// Queue a callable and return a future for its result.  After stop()
    /// the task is not run and the future holds a broken_promise error.
    template <typename Fn>
    auto post(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = task->get_future();
        enqueue([task]() { (*task)(); });
        return future;
    }

    /// Finish the task in progress, drop the rest, join the worker.
    /// Idempotent.
    void stop();

    /// True when called from the worker thread itself.
    bool isWorkerThread() const;

    size_t pending() const;
    const std::string& name() const { return m_name; }

private:
    void enqueue(std::function<void()> task);
    void run();

    std::string m_name;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::function<void()>> m_queue;
    bool m_stopping = false;
    std::thread m_worker;
};

} // namespace tether
