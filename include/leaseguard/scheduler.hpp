#pragma once

#include "leaseguard/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace leaseguard {

using TimerId = std::uint64_t;
using TimerTask = std::function<void()>;

// Source of time and periodic callbacks, owned per pool instance.
// A cancelled timer never fires again once cancel() has returned.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual Timestamp now() const = 0;

    // First run happens one interval after scheduling
    virtual TimerId schedule_every(Duration interval, TimerTask task) = 0;

    // Unknown or already-cancelled ids are ignored
    virtual void cancel(TimerId id) = 0;

    virtual std::size_t active_timers() const = 0;
};

// Wall-clock scheduler running one worker thread per timer
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    Timestamp now() const override;
    TimerId schedule_every(Duration interval, TimerTask task) override;
    void cancel(TimerId id) override;
    std::size_t active_timers() const override;

private:
    struct Worker {
        Duration interval;
        TimerTask task;
        std::atomic<bool> running{true};
        std::mutex cv_mutex;
        std::condition_variable cv;
        std::thread thread;
    };

    static void run_loop(Worker* worker);
    static void stop_worker(Worker& worker);

    mutable std::mutex mutex_;
    TimerId next_id_{1};
    std::map<TimerId, std::unique_ptr<Worker>> workers_;

    // Workers cancelled from their own thread, joined later
    std::vector<std::unique_ptr<Worker>> retired_;
};

// Virtual-clock scheduler. Time only moves through advance(); due tasks run
// on the calling thread in firing order.
class ManualScheduler : public Scheduler {
public:
    explicit ManualScheduler(Timestamp start = Timestamp{});

    Timestamp now() const override;
    TimerId schedule_every(Duration interval, TimerTask task) override;
    void cancel(TimerId id) override;
    std::size_t active_timers() const override;

    // Move the clock forward, firing every tick that falls inside the span
    void advance(Duration d);

    // Total number of task invocations so far
    std::size_t fired_count() const;

private:
    struct Timer {
        Duration interval;
        Timestamp next_fire;
        std::shared_ptr<TimerTask> task;
    };

    mutable std::mutex mutex_;
    Timestamp now_;
    TimerId next_id_{1};
    std::map<TimerId, Timer> timers_;
    std::size_t fired_{0};
};

} // namespace leaseguard
