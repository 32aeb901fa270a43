#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

/* level-triggered flag: set on every registry change, cleared by the observer */
class change_signal {
public:
    void set();
    void clear();
    bool is_set() const;
    /* returns true if the signal is set, without clearing it */
    bool wait_for(std::chrono::milliseconds timeout);

private:
    mutable std::mutex _mutex;
    std::condition_variable _changed;
    bool _set = false;
};
