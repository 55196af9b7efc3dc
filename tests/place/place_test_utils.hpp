/*
 * place_test_utils.hpp - Dataset row helpers shared by place tests
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef GEOPLACE_TESTS_PLACE_PLACE_TEST_UTILS_HPP
#define GEOPLACE_TESTS_PLACE_PLACE_TEST_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace geoplace::test {

/**
 * @brief Build one tab-separated dataset row with 19 columns
 */
inline auto makeRow(int64_t id, const std::string& name,
                    const std::string& alternateNames, double latitude,
                    double longitude, int64_t population,
                    const std::string& timezone = "Europe/Moscow",
                    const std::string& featureClass = "P") -> std::string {
    return fmt::format(
        "{}\t{}\t{}\t{}\t{}\t{}\t{}\tPPL\tRU\t\t48\t\t\t\t{}\t\t144\t{}\t"
        "2023-01-01",
        id, name, name, alternateNames, latitude, longitude, featureClass,
        population, timezone);
}

inline auto moscowRow() -> std::string {
    return makeRow(524901, "Moscow", "Moscow,Moskva", 55.75, 37.62, 10000000,
                   "Europe/Moscow");
}

inline auto saintPetersburgRow() -> std::string {
    return makeRow(498817, "Saint Petersburg", "Saint Petersburg,SPB", 59.93,
                   30.31, 5000000, "Europe/Moscow");
}

inline auto vladivostokRow() -> std::string {
    return makeRow(2013348, "Vladivostok", "Vladivostok,Vlad", 43.11, 131.87,
                   600000, "Asia/Vladivostok");
}

inline auto sampleRows() -> std::vector<std::string> {
    return {moscowRow(), saintPetersburgRow(), vladivostokRow(),
            makeRow(1, "Volga", "Volga", 45.0, 47.0, 0, "Europe/Moscow",
                    "H")};
}

}  // namespace geoplace::test

#endif  // GEOPLACE_TESTS_PLACE_PLACE_TEST_UTILS_HPP
