#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace taskprio {

// Класс приоритета: чем меньше число, тем раньше обслуживается
using PriorityClass = int;

struct ClassOptions {
    std::string label;  // Отображаемое имя класса, пустое -> имя по номеру
};

// std::map задаёт порядок обслуживания классов (по возрастанию номера)
using ClassConfig = std::map<PriorityClass, ClassOptions>;

// Приёмник текстовых событий (добавление, отказ, пустая очередь)
using EventSink = std::function<void(const std::string &)>;

struct SubmitResult {
    bool accepted = false;
    std::string message;
};

struct Statistics {
    size_t total = 0;
    std::map<PriorityClass, size_t> per_class;
};

struct ListingEntry {
    size_t index = 0;  // Нумерация с 1
    std::string name;
    std::string preview;
};

struct ClassListing {
    PriorityClass priority = 0;
    std::string label;
    size_t count = 0;
    std::vector<ListingEntry> entries;
};

struct Listing {
    std::vector<ClassListing> classes;
    size_t total = 0;
};

}  // namespace taskprio
