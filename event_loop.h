#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

// Single threaded task scheduler with a logical millisecond clock.
//
// Tasks run in due-time order, ties in submission order. run() follows the
// wall clock and sleeps until the next deadline; advance() moves the clock
// directly, which keeps timing deterministic in tests.
class EventLoop {
public:
    typedef std::uint64_t TaskId;
    typedef std::function<void()> Task;

    EventLoop();

    TaskId post(Task task);
    TaskId schedule(std::chrono::milliseconds delay, Task task);
    // false if the task already ran or was cancelled
    bool cancel(TaskId id);
    bool isPending(TaskId id) const;

    std::chrono::milliseconds now() const;
    std::size_t pendingCount() const;

    // Runs every task that is due at the current time, including ones they post.
    std::size_t runPending();
    // Moves the clock forward, running tasks at their due times on the way.
    std::size_t advance(std::chrono::milliseconds delta);
    // Until stop() is called or no task is left.
    void run();
    void stop();

private:
    typedef std::pair<std::int64_t, TaskId> QueueKey;

    bool runNextDueBy(std::int64_t deadline);

    std::map<QueueKey, Task> queue;
    std::map<TaskId, std::int64_t> due_by_id;
    std::int64_t current_ms;
    TaskId next_id;
    bool stopped;
};

// Owns one scheduled task and cancels it when reset, reassigned or destroyed.
class TimerHandle {
public:
    TimerHandle();
    TimerHandle(EventLoop* loop, EventLoop::TaskId id);
    ~TimerHandle();

    TimerHandle(TimerHandle&& other);
    TimerHandle& operator=(TimerHandle&& other);
    TimerHandle(const TimerHandle&) = delete;
    TimerHandle& operator=(const TimerHandle&) = delete;

    // true if a pending task was cancelled
    bool reset();
    bool isActive() const;

private:
    EventLoop* loop;
    EventLoop::TaskId id;
};

#endif // EVENT_LOOP_H
