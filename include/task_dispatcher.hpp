#pragma once

#include "queue/priority_manager.hpp"
#include "task.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace taskprio {

// Конфигурация по умолчанию: 1 = High, 2 = Medium, 3 = Low
ClassConfig GetDefaultClassConfig();

class TaskDispatcher {
private:
    std::unique_ptr<queue::PriorityManager> manager_;  // Очереди по классам приоритета
    EventSink event_sink_;                             // Может быть пустым

    void Emit(const std::string &message) const;

public:
    // Если конфигурация не указана, используется конфигурация по умолчанию
    explicit TaskDispatcher(const ClassConfig &class_config = {}, EventSink event_sink = nullptr);

    // Отказ (неизвестный класс, пустое имя) возвращается в SubmitResult, исключений нет
    SubmitResult submit(std::string name, std::string description, PriorityClass priority);

    std::optional<Task> next();

    std::optional<Task> peek_next() const;

    Statistics statistics() const;

    Listing list_all() const;

    const ClassConfig &config() const;

    ~TaskDispatcher();
};

}  // namespace taskprio
