#include <catch2/catch.hpp>

#include "ffpfact/descriptors/statistics.hpp"
#include "ffpfact/utils.hpp"

using namespace ffpfact;
using namespace ffpfact::descriptors;

TEST_CASE("statistics") {
    auto values = std::vector<double>{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

    CHECK(computeStatistic(Statistic::Mean, values) == Approx(5.0));
    // population standard deviation
    CHECK(computeStatistic(Statistic::StdDev, values) == Approx(2.0));
    CHECK(computeStatistic(Statistic::Minimum, values) == 2.0);
    CHECK(computeStatistic(Statistic::Maximum, values) == 9.0);
    CHECK(computeStatistic(Statistic::Range, values) == 7.0);
    CHECK(computeStatistic(Statistic::AvgDev, values) == Approx(1.5));

    SECTION("single value") {
        auto one = std::vector<double>{3.5};
        CHECK(computeStatistic(Statistic::StdDev, one) == 0.0);
        CHECK(computeStatistic(Statistic::Range, one) == 0.0);
        CHECK(computeStatistic(Statistic::Mean, one) == 3.5);
    }

    SECTION("empty input") {
        CHECK_THROWS_AS(computeStatistic(Statistic::Mean, {}), DescriptorException);
    }
}

TEST_CASE("statistic names") {
    for (const auto& name: availableStatistics()) {
        CHECK(statisticName(parseStatistic(name)) == name);
    }
    CHECK(availableStatistics().size() == 6);

    auto defaults = defaultStatistics();
    REQUIRE(defaults.size() == 4);
    CHECK(statisticName(defaults[0]) == "mean");
    CHECK(statisticName(defaults[1]) == "std_dev");
    CHECK(statisticName(defaults[2]) == "minimum");
    CHECK(statisticName(defaults[3]) == "maximum");

    auto parsed = parseStatistics({"maximum", "mean"});
    CHECK(parsed == std::vector<Statistic>{Statistic::Maximum, Statistic::Mean});

    try {
        parseStatistic("median");
        FAIL("expected an error");
    } catch (const DescriptorException& e) {
        CHECK(e.getCode() == ErrorCode::INVALID_ARGUMENT);
        CHECK(std::string(e.what()) == "Unknown statistic 'median'");
    }
}
