#include "report/format.hpp"
#include "task.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace taskprio::report {

namespace {

std::string ToUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

}  // namespace

std::string FormatStatistics(const Statistics &stats, const ClassConfig &config) {
    std::ostringstream out;
    out << "Total tasks: " << stats.total << '\n';
    for (const auto &[priority, count] : stats.per_class) {
        out << "Priority " << ClassLabel(config, priority) << ": " << count << " tasks\n";
    }
    return out.str();
}

std::string FormatListing(const Listing &listing) {
    std::ostringstream out;
    out << "===== TASK LIST =====\n";

    for (const auto &class_listing : listing.classes) {
        out << "\n--- Priority " << ToUpper(class_listing.label) << " (" << class_listing.count << " tasks) ---\n";

        if (class_listing.entries.empty()) {
            out << "No tasks in this category\n";
            continue;
        }

        for (const auto &entry : class_listing.entries) {
            out << entry.index << ". " << entry.name << " - " << entry.preview << '\n';
        }
    }

    out << "\nTotal: " << listing.total << " tasks\n";
    out << "=====================\n";
    return out.str();
}

}  // namespace taskprio::report
