#pragma once

#include <string>
#include <vector>

namespace ffpfact {
namespace descriptors {

enum class Statistic {
    Mean,
    StdDev,  // population standard deviation
    Minimum,
    Maximum,
    Range,
    AvgDev   // mean absolute deviation from the mean
};

// mean, std_dev, minimum, maximum
const std::vector<Statistic>& defaultStatistics();

std::string statisticName(Statistic statistic);
Statistic parseStatistic(const std::string& name);
std::vector<Statistic> parseStatistics(const std::vector<std::string>& names);
std::vector<std::string> availableStatistics();

// Throws DescriptorException(CALCULATION_ERROR) on an empty sample
double computeStatistic(Statistic statistic, const std::vector<double>& values);

} // namespace descriptors
} // namespace ffpfact
