// =============================================================================
// recdock - Task Scheduler
// =============================================================================
// Delayed-task execution for per-session timers: operation timeouts, the
// receive quiet-period debounce and health polling.
//
// ThreadScheduler runs every callback on a single worker thread, outside the
// scheduler lock, so a callback may schedule or cancel other tasks.
// =============================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace recdock {

using TaskId = uint64_t;
static constexpr TaskId INVALID_TASK = 0;

class TaskScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    virtual ~TaskScheduler() = default;

    // Runs `task` once after `delay`. Returns an id usable with cancel().
    virtual TaskId schedule_after(std::chrono::milliseconds delay, Task task) = 0;

    // Returns true if the task was still pending and will not run.
    virtual bool cancel(TaskId id) = 0;

    virtual Clock::time_point now() const { return Clock::now(); }

    // Drops pending tasks; later schedule_after() calls return INVALID_TASK.
    virtual void stop() = 0;
};

class ThreadScheduler : public TaskScheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TaskId schedule_after(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TaskId id) override;

    // Also joins the worker. Idempotent; when called from a task running on
    // the worker itself the worker is detached instead, and that task may
    // go on to destroy the scheduler.
    void stop() override;

    size_t pending() const;

private:
    void worker_loop();

    struct Key {
        Clock::time_point due;
        TaskId id;
        bool operator<(const Key& o) const {
            return due < o.due || (due == o.due && id < o.id);
        }
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Key, Task> tasks_;
    std::map<TaskId, Clock::time_point> due_by_id_;
    TaskId next_id_ = 1;
    std::atomic<bool> running_{true};
    std::thread worker_;
};

/**
 * Re-armable delayed task. Each trigger() cancels the armed task (if any)
 * and arms a new one, so the action runs only after `quiet` has elapsed with
 * no further triggers.
 */
class Debouncer {
public:
    Debouncer(TaskScheduler& scheduler, std::function<void()> action)
        : scheduler_(scheduler), action_(std::move(action)) {}
    ~Debouncer() { cancel(); }

    void trigger(std::chrono::milliseconds quiet);
    void cancel();
    bool armed() const;

private:
    TaskScheduler& scheduler_;
    std::function<void()> action_;
    mutable std::mutex mutex_;
    TaskId task_ = INVALID_TASK;
    uint64_t generation_ = 0;
};

} // namespace recdock
