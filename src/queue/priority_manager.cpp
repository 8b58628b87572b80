#include "queue/priority_manager.hpp"
#include "queue/class_queue.hpp"
#include <utility>

namespace taskprio::queue {

InvalidPriorityClass::InvalidPriorityClass(PriorityClass priority)
    : std::invalid_argument("Invalid priority class: " + std::to_string(priority)), priority_(priority) {}

PriorityManager::PriorityManager(const ClassConfig &config) : config_(config) {
    if (config_.empty()) {
        throw std::invalid_argument("At least one priority class is required.");
    }

    for (const auto &[priority, options] : config_) {
        queues_by_priority_[priority] = std::make_unique<ClassQueue>();
    }
}

void PriorityManager::submit(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = queues_by_priority_.find(task.priority());
    if (it == queues_by_priority_.end()) {
        throw InvalidPriorityClass(task.priority());
    }

    it->second->push(std::move(task));
    ++num_total_tasks_;
}

IQueue *PriorityManager::FirstNonEmpty() const {
    // std::map обходится по возрастанию номера класса
    for (const auto &[priority, queue] : queues_by_priority_) {
        if (!queue->empty()) {
            return queue.get();
        }
    }
    return nullptr;
}

std::optional<Task> PriorityManager::next() {
    std::lock_guard<std::mutex> lock(mutex_);

    IQueue *queue = FirstNonEmpty();
    if (queue == nullptr) {
        return std::nullopt;
    }

    auto task_opt = queue->try_pop();
    if (task_opt.has_value()) {
        --num_total_tasks_;
    }
    return task_opt;
}

std::optional<Task> PriorityManager::peek_next() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const IQueue *queue = FirstNonEmpty();
    if (queue == nullptr) {
        return std::nullopt;
    }
    return queue->peek();
}

Statistics PriorityManager::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Statistics stats;
    for (const auto &[priority, queue] : queues_by_priority_) {
        const size_t count = queue->size();
        stats.per_class[priority] = count;
        stats.total += count;
    }
    return stats;
}

Listing PriorityManager::list_all() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Listing listing;
    listing.classes.reserve(queues_by_priority_.size());

    for (const auto &[priority, queue] : queues_by_priority_) {
        ClassListing class_listing;
        class_listing.priority = priority;
        class_listing.label = ClassLabel(config_, priority);
        class_listing.count = queue->size();
        class_listing.entries.reserve(class_listing.count);

        size_t index = 0;
        queue->for_each([&class_listing, &index](const Task &task) {
            class_listing.entries.push_back({++index, task.name(), MakePreview(task.description())});
        });

        listing.total += class_listing.count;
        listing.classes.push_back(std::move(class_listing));
    }
    return listing;
}

bool PriorityManager::recognizes(PriorityClass priority) const {
    // Набор ключей неизменен после конструктора
    return queues_by_priority_.count(priority) != 0;
}

size_t PriorityManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return num_total_tasks_;
}

}  // namespace taskprio::queue
