#include "leaseguard/scheduler.hpp"
#include "leaseguard/exceptions.hpp"

namespace leaseguard {

// ========== ThreadScheduler ==========

ThreadScheduler::ThreadScheduler() = default;

ThreadScheduler::~ThreadScheduler() {
    std::map<TimerId, std::unique_ptr<Worker>> workers;
    std::vector<std::unique_ptr<Worker>> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
        retired.swap(retired_);
    }

    for (auto& [id, worker] : workers) {
        stop_worker(*worker);
    }
    for (auto& worker : retired) {
        stop_worker(*worker);
    }
}

Timestamp ThreadScheduler::now() const {
    return Clock::now();
}

TimerId ThreadScheduler::schedule_every(Duration interval, TimerTask task) {
    if (interval <= Duration::zero()) {
        throw ValidationException("Timer interval must be positive");
    }
    if (!task) {
        throw ValidationException("Timer task must be callable");
    }

    auto worker = std::make_unique<Worker>();
    worker->interval = interval;
    worker->task = std::move(task);
    worker->thread = std::thread(&ThreadScheduler::run_loop, worker.get());

    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    workers_.emplace(id, std::move(worker));
    return id;
}

void ThreadScheduler::cancel(TimerId id) {
    std::unique_ptr<Worker> worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workers_.find(id);
        if (it == workers_.end()) {
            return;
        }
        worker = std::move(it->second);
        workers_.erase(it);
    }

    if (worker->thread.get_id() == std::this_thread::get_id()) {
        // Cancelled from inside its own task: stop the loop but it cannot
        // join itself.
        worker->running.store(false);
        std::lock_guard<std::mutex> lock(mutex_);
        retired_.push_back(std::move(worker));
        return;
    }

    stop_worker(*worker);
}

std::size_t ThreadScheduler::active_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void ThreadScheduler::run_loop(Worker* worker) {
    while (worker->running.load()) {
        {
            std::unique_lock<std::mutex> lock(worker->cv_mutex);
            worker->cv.wait_for(lock, worker->interval, [worker] {
                return !worker->running.load();
            });
        }
        if (!worker->running.load()) {
            break;
        }
        worker->task();
    }
}

void ThreadScheduler::stop_worker(Worker& worker) {
    worker.running.store(false);
    {
        std::lock_guard<std::mutex> lock(worker.cv_mutex);
        worker.cv.notify_all();
    }
    if (worker.thread.joinable()) {
        worker.thread.join();
    }
}

// ========== ManualScheduler ==========

ManualScheduler::ManualScheduler(Timestamp start) : now_(start) {}

Timestamp ManualScheduler::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

TimerId ManualScheduler::schedule_every(Duration interval, TimerTask task) {
    if (interval <= Duration::zero()) {
        throw ValidationException("Timer interval must be positive");
    }
    if (!task) {
        throw ValidationException("Timer task must be callable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    timers_.emplace(id, Timer{interval, now_ + interval,
                              std::make_shared<TimerTask>(std::move(task))});
    return id;
}

void ManualScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

std::size_t ManualScheduler::active_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void ManualScheduler::advance(Duration d) {
    if (d < Duration::zero()) {
        throw ValidationException("Cannot move a manual clock backwards");
    }

    Timestamp target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = now_ + d;
    }

    while (true) {
        std::shared_ptr<TimerTask> task;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            // Earliest due timer; ties resolve in scheduling order
            auto due = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.next_fire > target) continue;
                if (due == timers_.end() || it->second.next_fire < due->second.next_fire) {
                    due = it;
                }
            }
            if (due == timers_.end()) {
                now_ = target;
                return;
            }

            now_ = due->second.next_fire;
            due->second.next_fire += due->second.interval;
            task = due->second.task;
            fired_++;
        }

        // Outside the lock: the task may read now() or cancel timers
        (*task)();
    }
}

std::size_t ManualScheduler::fired_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

} // namespace leaseguard
