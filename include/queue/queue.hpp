#pragma once

#include "task.hpp"
#include <cstddef>
#include <functional>
#include <optional>

namespace taskprio::queue {

// Очередь задач одного класса приоритета
class IQueue {
public:
    virtual void push(Task task) = 0;

    // Пустая очередь -> nullopt, это не ошибка
    virtual std::optional<Task> try_pop() = 0;
    virtual std::optional<Task> peek() const = 0;

    virtual bool empty() const = 0;
    virtual size_t size() const = 0;

    // Обход в порядке FIFO без изменения очереди
    virtual void for_each(const std::function<void(const Task &)> &visitor) const = 0;

    virtual ~IQueue() = default;
};

}  // namespace taskprio::queue
