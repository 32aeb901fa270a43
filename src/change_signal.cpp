#include "change_signal.hpp"

void change_signal::set() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _set = true;
    }
    _changed.notify_all();
}

void change_signal::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _set = false;
}

bool change_signal::is_set() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _set;
}

bool change_signal::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(_mutex);
    return _changed.wait_for(lock, timeout, [this] { return _set; });
}
