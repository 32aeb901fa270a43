#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

/* closures posted from any thread, run by the main loop */
class task_queue {
public:
    void post(std::function<void()> task);
    /* runs what was queued when called, returns how many ran */
    std::size_t run_pending();
    std::size_t size() const;

private:
    mutable std::mutex _mutex;
    std::deque<std::function<void()>> _tasks;
};
