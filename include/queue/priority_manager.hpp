#pragma once

#include "queue/queue.hpp"
#include "task.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace taskprio::queue {

// Задача с нераспознанным классом приоритета. Состояние менеджера не меняется.
class InvalidPriorityClass : public std::invalid_argument {
private:
    PriorityClass priority_;

public:
    explicit InvalidPriorityClass(PriorityClass priority);

    PriorityClass priority() const noexcept { return priority_; }
};

// Строгий приоритет: класс обслуживается только когда все классы с меньшим номером пусты,
// внутри класса порядок FIFO. Каждая операция выполняется целиком под mutex_.
class PriorityManager {
private:
    std::map<PriorityClass, std::unique_ptr<IQueue>> queues_by_priority_;
    ClassConfig config_;
    mutable std::mutex mutex_;
    size_t num_total_tasks_ = 0;  // Всегда равен сумме размеров очередей

    // Вызывается под mutex_
    IQueue *FirstNonEmpty() const;

public:
    explicit PriorityManager(const ClassConfig &config);

    // Бросает InvalidPriorityClass, если класс задачи не распознан
    void submit(Task task);

    std::optional<Task> next();

    std::optional<Task> peek_next() const;

    Statistics statistics() const;

    Listing list_all() const;

    bool recognizes(PriorityClass priority) const;

    size_t size() const;

    const ClassConfig &config() const { return config_; }

    PriorityManager(const PriorityManager &) = delete;
    PriorityManager &operator=(const PriorityManager &) = delete;

    ~PriorityManager() = default;
};

}  // namespace taskprio::queue
