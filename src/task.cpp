#include "task.hpp"
#include <utility>

namespace taskprio {

std::string PriorityLabel(PriorityClass priority) {
    switch (priority) {
    case 1:
        return "High";
    case 2:
        return "Medium";
    case 3:
        return "Low";
    default:
        return "Unknown";
    }
}

std::string ClassLabel(const ClassConfig &config, PriorityClass priority) {
    auto it = config.find(priority);
    if (it == config.end() || it->second.label.empty()) {
        return PriorityLabel(priority);
    }
    return it->second.label;
}

namespace {

// Байт продолжения UTF-8 (10xxxxxx) не начинает новый символ
bool IsContinuationByte(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

}  // namespace

std::string MakePreview(const std::string &description, size_t limit) {
    size_t chars = 0;
    for (size_t i = 0; i < description.size(); ++i) {
        if (IsContinuationByte(description[i])) {
            continue;
        }
        // Начало символа с номером limit + 1: режем перед ним
        if (chars == limit) {
            return description.substr(0, i) + "...";
        }
        ++chars;
    }
    return description;
}

Task::Task(std::string name, std::string description, PriorityClass priority)
    : name_(std::move(name)), description_(std::move(description)), priority_(priority) {}

std::string Task::ToString() const {
    return "Task: " + name_ + " (Priority: " + PriorityLabel(priority_) + ")\nDescription: " + description_;
}

}  // namespace taskprio
