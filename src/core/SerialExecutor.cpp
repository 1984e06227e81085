#include "core/SerialExecutor.hpp"
#include "core/Log.hpp"

namespace tether {

SerialExecutor::SerialExecutor(std::string name)
    : m_name(std::move(name)) {
    m_worker = std::thread([this] { run(); });
}

SerialExecutor::~SerialExecutor() {
    stop();
}

void SerialExecutor::stop() {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping && !m_worker.joinable()) return;
        m_stopping = true;
        dropped.swap(m_queue);
    }
    m_cv.notify_all();

    if (!dropped.empty()) {
        LOG_WARN("Executor '{}': dropping {} queued task(s) on stop", m_name, dropped.size());
    }
    // Destroying the packaged_task wrappers breaks their promises, which
    // wakes anyone still waiting on the futures.
    dropped.clear();

    if (m_worker.joinable() && std::this_thread::get_id() != m_worker.get_id()) {
        m_worker.join();
    } else if (m_worker.joinable()) {
        m_worker.detach();
    }
}

bool SerialExecutor::isWorkerThread() const {
    return std::this_thread::get_id() == m_worker.get_id();
}

size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void SerialExecutor::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            LOG_WARN("Executor '{}': task posted after stop, discarding", m_name);
            return;
        }
        m_queue.push_back(std::move(task));
    }
    m_cv.notify_one();
}

void SerialExecutor::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_stopping) return;
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }
        // packaged_task stores exceptions in its future; nothing escapes here.
        task();
    }
}

} // namespace tether
