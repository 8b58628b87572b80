#pragma once

#include "types.hpp"
#include <string>

namespace taskprio::report {

std::string FormatStatistics(const Statistics &stats, const ClassConfig &config);

std::string FormatListing(const Listing &listing);

}  // namespace taskprio::report
