#pragma once

#include "types.hpp"
#include <cstddef>
#include <string>

namespace taskprio {

// Имя класса по номеру: 1 -> High, 2 -> Medium, 3 -> Low, иначе Unknown
std::string PriorityLabel(PriorityClass priority);

// Имя из конфигурации, а при пустом или отсутствующем - PriorityLabel
std::string ClassLabel(const ClassConfig &config, PriorityClass priority);

inline constexpr size_t kPreviewLength = 50;

// Первые limit символов (кодовых точек UTF-8) описания, "..." если описание длиннее.
// Многобайтовый символ никогда не разрезается.
std::string MakePreview(const std::string &description, size_t limit = kPreviewLength);

// Неизменяемая задача. Приоритет здесь не проверяется, это делает PriorityManager.
class Task {
private:
    std::string name_;
    std::string description_;
    PriorityClass priority_;

public:
    Task(std::string name, std::string description, PriorityClass priority);

    const std::string &name() const { return name_; }
    const std::string &description() const { return description_; }
    PriorityClass priority() const { return priority_; }

    std::string ToString() const;
};

}  // namespace taskprio
