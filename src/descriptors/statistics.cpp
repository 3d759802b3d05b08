#include "ffpfact/descriptors/statistics.hpp"
#include "ffpfact/utils.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <utility>

namespace ffpfact {
namespace descriptors {

namespace {

    const std::vector<std::pair<Statistic, const char*>>& statisticNames() {
        static const std::vector<std::pair<Statistic, const char*>> names = {
            {Statistic::Mean, "mean"},
            {Statistic::StdDev, "std_dev"},
            {Statistic::Minimum, "minimum"},
            {Statistic::Maximum, "maximum"},
            {Statistic::Range, "range"},
            {Statistic::AvgDev, "avg_dev"}
        };
        return names;
    }

} // anonymous namespace

const std::vector<Statistic>& defaultStatistics() {
    static const std::vector<Statistic> defaults = {
        Statistic::Mean, Statistic::StdDev, Statistic::Minimum, Statistic::Maximum
    };
    return defaults;
}

std::string statisticName(Statistic statistic) {
    for (const auto& entry : statisticNames()) {
        if (entry.first == statistic) return entry.second;
    }
    throw DescriptorException("Unhandled statistic", ErrorCode::INVALID_ARGUMENT);
}

Statistic parseStatistic(const std::string& name) {
    for (const auto& entry : statisticNames()) {
        if (name == entry.second) return entry.first;
    }
    throw DescriptorException("Unknown statistic '" + name + "'", ErrorCode::INVALID_ARGUMENT);
}

std::vector<Statistic> parseStatistics(const std::vector<std::string>& names) {
    std::vector<Statistic> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(parseStatistic(name));
    }
    return result;
}

std::vector<std::string> availableStatistics() {
    std::vector<std::string> names;
    for (const auto& entry : statisticNames()) {
        names.emplace_back(entry.second);
    }
    return names;
}

double computeStatistic(Statistic statistic, const std::vector<double>& values) {
    if (values.empty()) {
        throw DescriptorException("Cannot compute " + statisticName(statistic) + " of an empty sample",
                                  ErrorCode::CALCULATION_ERROR);
    }
    Eigen::Map<const Eigen::ArrayXd> data(values.data(), static_cast<Eigen::Index>(values.size()));

    switch (statistic) {
        case Statistic::Mean:
            return data.mean();
        case Statistic::StdDev: {
            const double mean = data.mean();
            return std::sqrt((data - mean).square().mean());
        }
        case Statistic::Minimum:
            return data.minCoeff();
        case Statistic::Maximum:
            return data.maxCoeff();
        case Statistic::Range:
            return data.maxCoeff() - data.minCoeff();
        case Statistic::AvgDev: {
            const double mean = data.mean();
            return (data - mean).abs().mean();
        }
    }
    throw DescriptorException("Unhandled statistic", ErrorCode::INVALID_ARGUMENT);
}

} // namespace descriptors
} // namespace ffpfact
