#include "task_dispatcher.hpp"
#include <utility>

namespace taskprio {

ClassConfig GetDefaultClassConfig() {
    return {
        {1, {"High"}},
        {2, {"Medium"}},
        {3, {"Low"}},
    };
}

TaskDispatcher::TaskDispatcher(const ClassConfig &class_config, EventSink event_sink)
    : manager_(std::make_unique<queue::PriorityManager>(class_config.empty() ? GetDefaultClassConfig()
                                                                             : class_config)),
      event_sink_(std::move(event_sink)) {}

void TaskDispatcher::Emit(const std::string &message) const {
    if (event_sink_) {
        event_sink_(message);
    }
}

SubmitResult TaskDispatcher::submit(std::string name, std::string description, PriorityClass priority) {
    SubmitResult result;

    if (name.empty()) {
        result.message = "Error: task name must not be empty";
        Emit(result.message);
        return result;
    }

    const std::string task_name = name;
    try {
        manager_->submit(Task(std::move(name), std::move(description), priority));
    } catch (const queue::InvalidPriorityClass &e) {
        result.message = "Error: invalid priority (" + std::to_string(e.priority()) + ")";
        Emit(result.message);
        return result;
    }

    result.accepted = true;
    result.message = "Task '" + task_name + "' added with priority " + std::to_string(priority);
    Emit(result.message);
    return result;
}

std::optional<Task> TaskDispatcher::next() {
    auto task = manager_->next();
    if (!task.has_value()) {
        Emit("No pending tasks");
    }
    return task;
}

std::optional<Task> TaskDispatcher::peek_next() const {
    auto task = manager_->peek_next();
    if (!task.has_value()) {
        Emit("No pending tasks");
    }
    return task;
}

Statistics TaskDispatcher::statistics() const { return manager_->statistics(); }

Listing TaskDispatcher::list_all() const { return manager_->list_all(); }

const ClassConfig &TaskDispatcher::config() const { return manager_->config(); }

TaskDispatcher::~TaskDispatcher() {}

}  // namespace taskprio
