#pragma once
#include "queue/queue.hpp"
#include <deque>

namespace taskprio::queue {

// FIFO без собственной блокировки: доступ сериализует PriorityManager
class ClassQueue : public IQueue {
private:
    std::deque<Task> queue_;

public:
    ClassQueue() = default;

    void push(Task task) override;

    std::optional<Task> try_pop() override;

    std::optional<Task> peek() const override;

    bool empty() const override;

    size_t size() const override;

    void for_each(const std::function<void(const Task &)> &visitor) const override;

    ~ClassQueue() override = default;
};

}  // namespace taskprio::queue
