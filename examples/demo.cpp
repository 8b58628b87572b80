#include "report/format.hpp"
#include "task_dispatcher.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct SampleTask {
    std::string name;
    std::string description;
    taskprio::PriorityClass priority;
};

}  // namespace

int main() {
    taskprio::TaskDispatcher dispatcher({}, [](const std::string &event) { std::cout << event << '\n'; });

    const std::vector<SampleTask> samples = {
        {"Fix critical bug", "The login system is failing for some users", 1},
        {"Update documentation", "Update the API documentation with the new endpoints", 2},
        {"Optimize SQL query", "The reporting query is far too slow", 1},
        {"Add new icons", "Add the icons for the new theme", 3},
        {"Review pull requests", "Review the team's pending PRs", 2},
        {"Fix typos", "Fix typos in the user interface", 3},
        {"Investigate security issue", "Check the reported potential vulnerability", 1},
        {"Implement dark mode", "Add support for a dark theme", 2},
    };

    std::cout << "Adding tasks to the dispatcher...\n\n";
    for (const auto &sample : samples) {
        dispatcher.submit(sample.name, sample.description, sample.priority);
    }

    std::cout << "\nStatistics:\n" << taskprio::report::FormatStatistics(dispatcher.statistics(), dispatcher.config());
    std::cout << '\n' << taskprio::report::FormatListing(dispatcher.list_all());

    std::cout << "\nProcessing tasks in priority order:\n";
    for (int i = 0; i < 5; ++i) {
        auto task = dispatcher.next();
        if (task.has_value()) {
            std::cout << "\nRunning: " << task->ToString() << '\n' << std::string(40, '-') << '\n';
        }
    }

    std::cout << "\nUpdated statistics:\n"
              << taskprio::report::FormatStatistics(dispatcher.statistics(), dispatcher.config());
    std::cout << '\n' << taskprio::report::FormatListing(dispatcher.list_all());

    return 0;
}
