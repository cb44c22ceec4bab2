#include "event_loop.h"

#include <thread>

EventLoop::EventLoop() : current_ms(0), next_id(1), stopped(false) {
}

EventLoop::TaskId EventLoop::post(Task task) {
    return schedule(std::chrono::milliseconds(0), task);
}

EventLoop::TaskId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TaskId id = next_id++;
    std::int64_t due = current_ms + (delay.count() > 0 ? delay.count() : 0);
    queue[QueueKey(due, id)] = task;
    due_by_id[id] = due;
    return id;
}

bool EventLoop::cancel(TaskId id) {
    auto it = due_by_id.find(id);
    if (it == due_by_id.end()) return false;

    queue.erase(QueueKey(it->second, id));
    due_by_id.erase(it);
    return true;
}

bool EventLoop::isPending(TaskId id) const {
    return due_by_id.count(id) > 0;
}

std::chrono::milliseconds EventLoop::now() const {
    return std::chrono::milliseconds(current_ms);
}

std::size_t EventLoop::pendingCount() const {
    return queue.size();
}

bool EventLoop::runNextDueBy(std::int64_t deadline) {
    if (queue.empty()) return false;

    auto first = queue.begin();
    if (first->first.first > deadline) return false;

    // Detach before running so the task may post or cancel freely
    std::int64_t due = first->first.first;
    Task task = first->second;
    due_by_id.erase(first->first.second);
    queue.erase(first);

    if (due > current_ms) current_ms = due;
    task();
    return true;
}

std::size_t EventLoop::runPending() {
    std::size_t executed = 0;
    while (runNextDueBy(current_ms)) {
        ++executed;
    }
    return executed;
}

std::size_t EventLoop::advance(std::chrono::milliseconds delta) {
    std::int64_t target = current_ms + delta.count();
    std::size_t executed = 0;
    while (runNextDueBy(target)) {
        ++executed;
    }
    current_ms = target;
    return executed;
}

void EventLoop::run() {
    stopped = false;
    auto origin = std::chrono::steady_clock::now() - std::chrono::milliseconds(current_ms);

    while (!stopped && !queue.empty()) {
        std::int64_t due = queue.begin()->first.first;
        std::int64_t wall_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - origin).count();

        if (due > wall_ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(due - wall_ms));
            wall_ms = due;
        }
        advance(std::chrono::milliseconds(wall_ms - current_ms));
    }
}

void EventLoop::stop() {
    stopped = true;
}

// Implementations for TimerHandle class
TimerHandle::TimerHandle() : loop(nullptr), id(0) {
}

TimerHandle::TimerHandle(EventLoop* event_loop, EventLoop::TaskId task_id) : loop(event_loop), id(task_id) {
}

TimerHandle::~TimerHandle() {
    reset();
}

TimerHandle::TimerHandle(TimerHandle&& other) : loop(other.loop), id(other.id) {
    other.loop = nullptr;
    other.id = 0;
}

TimerHandle& TimerHandle::operator=(TimerHandle&& other) {
    if (this != &other) {
        reset();
        loop = other.loop;
        id = other.id;
        other.loop = nullptr;
        other.id = 0;
    }
    return *this;
}

bool TimerHandle::reset() {
    bool cancelled = false;
    if (loop) {
        cancelled = loop->cancel(id);
    }
    loop = nullptr;
    id = 0;
    return cancelled;
}

bool TimerHandle::isActive() const {
    return loop != nullptr && loop->isPending(id);
}
