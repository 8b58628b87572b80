#include "queue/class_queue.hpp"
#include <utility>

namespace taskprio::queue {

void ClassQueue::push(Task task) {
    queue_.push_back(std::move(task));  // Добавляем в хвост
}

std::optional<Task> ClassQueue::try_pop() {
    if (queue_.empty()) {
        return std::nullopt;
    }

    auto task = std::move(queue_.front());  // Извлекаем голову за O(1)
    queue_.pop_front();
    return task;
}

std::optional<Task> ClassQueue::peek() const {
    if (queue_.empty()) {
        return std::nullopt;
    }
    return queue_.front();
}

bool ClassQueue::empty() const { return queue_.empty(); }

size_t ClassQueue::size() const { return queue_.size(); }

void ClassQueue::for_each(const std::function<void(const Task &)> &visitor) const {
    for (const auto &task : queue_) {
        visitor(task);
    }
}

}  // namespace taskprio::queue
