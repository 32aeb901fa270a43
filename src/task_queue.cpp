#include "task_queue.hpp"

void task_queue::post(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(_mutex);
    _tasks.push_back(std::move(task));
}

std::size_t task_queue::run_pending() {
    std::deque<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        tasks.swap(_tasks);
    }
    for (auto& task: tasks) {
        task();
    }
    return tasks.size();
}

std::size_t task_queue::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
}
