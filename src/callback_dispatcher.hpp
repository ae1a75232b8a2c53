#pragma once

#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace replicator {

// Runs fire-and-forget callbacks on a small pool of worker threads.
// Every task is independent: an exception thrown by one task is logged and
// counted, and never reaches the code that posted it or other tasks.
class callback_dispatcher {
public:
    using task = std::function<void()>;

    struct stats {
        uint64_t executed = 0;
        uint64_t faults = 0;
        std::size_t queue_depth = 0;
    };

    // thread_count == 0 means hardware_concurrency
    callback_dispatcher(unsigned int thread_count, std::shared_ptr<spdlog::logger> log);
    ~callback_dispatcher();

    // Spawn the worker threads. Calling start() twice is a no-op.
    void start();

    // Signal workers to stop, run what is already queued, and join threads.
    void stop();

    // Enqueue a task. Tasks posted before start() run once workers exist.
    void post(task t);

    // Block until every task posted so far has finished.
    void wait_idle();

    std::size_t queue_depth() const;

    stats get_stats() const;

private:
    void worker_loop(unsigned int worker_id);
    void run_task(task& t);
    void finish_one();

    std::shared_ptr<spdlog::logger> m_log;

    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    moodycamel::BlockingConcurrentQueue<task> m_queue;
    std::vector<std::thread> m_threads;

    // Posted but not yet finished; wait_idle() sleeps on m_idle_cv
    std::mutex m_idle_mutex;
    std::condition_variable m_idle_cv;
    std::size_t m_outstanding = 0;

    std::atomic<uint64_t> m_executed{0};
    std::atomic<uint64_t> m_faults{0};
};

} // namespace replicator
