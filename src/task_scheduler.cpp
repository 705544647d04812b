#include "task_scheduler.hpp"
#include <system_error>
#include "recdock_log.hpp"

namespace recdock {

namespace {
// Set on a worker thread that detached itself from inside one of its tasks.
thread_local bool t_worker_detached = false;
} // anonymous namespace

ThreadScheduler::ThreadScheduler() {
    worker_ = std::thread(&ThreadScheduler::worker_loop, this);
}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

TaskId ThreadScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load()) return INVALID_TASK;
    TaskId id = next_id_++;
    auto due = Clock::now() + delay;
    tasks_.emplace(Key{due, id}, std::move(task));
    due_by_id_[id] = due;
    cv_.notify_one();
    return id;
}

bool ThreadScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = due_by_id_.find(id);
    if (it == due_by_id_.end()) return false;
    tasks_.erase(Key{it->second, id});
    due_by_id_.erase(it);
    return true;
}

size_t ThreadScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
        tasks_.clear();
        due_by_id_.clear();
    }
    cv_.notify_all();

    if (!worker_.joinable()) return;
    if (worker_.get_id() == std::this_thread::get_id()) {
        t_worker_detached = true;
        worker_.detach();
        return;
    }
    try {
        worker_.join();
    } catch (const std::system_error& e) {
        RLOG_ERROR("sched", "Worker join failed: %s", e.what());
    }
}

void ThreadScheduler::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (tasks_.empty()) {
            cv_.wait(lock, [this] { return !running_.load() || !tasks_.empty(); });
            continue;
        }

        auto first = tasks_.begin();
        auto due = first->first.due;
        if (Clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;  // re-evaluate: a task may have been added or cancelled
        }

        Task task = std::move(first->second);
        due_by_id_.erase(first->first.id);
        tasks_.erase(first);

        lock.unlock();
        task();
        // the scheduler may have been destroyed by the task
        if (t_worker_detached) return;
        lock.lock();
    }
}

// =============================================================================
// Debouncer
// =============================================================================

void Debouncer::trigger(std::chrono::milliseconds quiet) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (task_ != INVALID_TASK) {
        scheduler_.cancel(task_);
    }
    uint64_t gen = ++generation_;
    task_ = scheduler_.schedule_after(quiet, [this, gen] {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            // A newer trigger() raced with this firing; let the newer one run.
            if (gen != generation_) return;
            task_ = INVALID_TASK;
        }
        action_();
    });
}

void Debouncer::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (task_ != INVALID_TASK) {
        scheduler_.cancel(task_);
        task_ = INVALID_TASK;
    }
    ++generation_;
}

bool Debouncer::armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_ != INVALID_TASK;
}

} // namespace recdock
