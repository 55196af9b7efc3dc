/*
 * test_query_service.cpp - Tests for QueryService
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <date/date.h>
#include <nlohmann/json.hpp>

#include "exception/exception.hpp"
#include "place/index/place_index.hpp"
#include "place/service/query_service.hpp"
#include "tests/place/place_test_utils.hpp"

using namespace geoplace::service;
using namespace geoplace::test;
using geoplace::index::Indexer;
using geoplace::index::PlaceIndex;

namespace {

auto makeService(const std::vector<std::string>& rows) -> QueryService {
    return QueryService(std::make_shared<const PlaceIndex>(Indexer::build(rows)));
}

const auto kWinter = date::sys_days{date::year{2024} / 1 / 15};
const auto kSummer = date::sys_days{date::year{2024} / 7 / 15};

}  // namespace

class QueryServiceTest : public ::testing::Test {
protected:
    QueryService service = makeService(sampleRows());
};

// ============================================================================
// Construction Tests
// ============================================================================

TEST(QueryServiceConstructionTest, NullIndexRejected) {
    EXPECT_THROW(QueryService(nullptr), atom::error::InvalidArgument);
}

// ============================================================================
// Lookup by Id Tests
// ============================================================================

TEST_F(QueryServiceTest, GetByIdFound) {
    auto place = service.getById(524901);
    ASSERT_TRUE(place.has_value());
    EXPECT_EQ((*place)->name, "Moscow");
    EXPECT_EQ((*place)->population, 10000000);
}

TEST_F(QueryServiceTest, GetByIdUnknown) {
    EXPECT_FALSE(service.getById(42).has_value());
}

TEST_F(QueryServiceTest, GetByIdFilteredRecord) {
    EXPECT_FALSE(service.getById(1).has_value());
}

TEST_F(QueryServiceTest, GetByIdNegative) {
    EXPECT_THROW((void)service.getById(-1), geoplace::InvalidQueryError);
}

TEST_F(QueryServiceTest, GetByIdZeroIsValid) {
    EXPECT_NO_THROW((void)service.getById(0));
}

// ============================================================================
// Pagination Tests
// ============================================================================

TEST_F(QueryServiceTest, FirstPage) {
    auto page = service.getPage(0, 2);
    ASSERT_EQ(page.size(), 2);
    EXPECT_EQ(page[0]->id, 524901);
    EXPECT_EQ(page[1]->id, 498817);
}

TEST_F(QueryServiceTest, PagesConcatenateToFullListing) {
    auto all = service.getPage(0, kMaxLimit);
    std::vector<int64_t> stitched;
    for (int64_t skip = 0; skip < 4; skip += 1) {
        for (const auto& place : service.getPage(skip, 1)) {
            stitched.push_back(place->id);
        }
    }
    ASSERT_EQ(stitched.size(), all.size());
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(stitched[i], all[i]->id);
    }
}

TEST_F(QueryServiceTest, PagePastEnd) {
    EXPECT_TRUE(service.getPage(3, 10).empty());
}

TEST_F(QueryServiceTest, PageValidation) {
    EXPECT_THROW((void)service.getPage(-1, 10), geoplace::InvalidQueryError);
    EXPECT_THROW((void)service.getPage(0, 0), geoplace::InvalidQueryError);
    EXPECT_THROW((void)service.getPage(0, -5), geoplace::InvalidQueryError);
    EXPECT_THROW((void)service.getPage(0, kMaxLimit + 1),
                 geoplace::InvalidQueryError);
    EXPECT_NO_THROW((void)service.getPage(0, kMaxLimit));
}

// ============================================================================
// Name Resolution Tests
// ============================================================================

TEST_F(QueryServiceTest, GetByAlternateName) {
    auto place = service.getByName("Moskva");
    ASSERT_TRUE(place.has_value());
    EXPECT_EQ((*place)->id, 524901);
}

TEST_F(QueryServiceTest, GetByNameUnknown) {
    EXPECT_FALSE(service.getByName("Atlantis").has_value());
    EXPECT_FALSE(service.getByName("").has_value());
}

TEST(QueryServiceNameTest, MostPopulousWins) {
    auto service = makeService(
        {makeRow(1, "Troitsk", "Troitsk", 55.48, 37.30, 60000),
         makeRow(2, "Troitsk", "Troitsk", 54.08, 61.57, 75000),
         makeRow(3, "Troitsk", "Troitsk", 52.97, 84.67, 9000)});

    auto place = service.getByName("Troitsk");
    ASSERT_TRUE(place.has_value());
    EXPECT_EQ((*place)->id, 2);
    EXPECT_EQ(service.candidates("Troitsk").size(), 3);
}

// ============================================================================
// Prefix Search Tests
// ============================================================================

TEST_F(QueryServiceTest, PrefixSearch) {
    auto names = service.prefixSearch("Mo", 10);
    EXPECT_EQ(names, (std::vector<std::string>{"Moscow", "Moskva"}));
}

TEST_F(QueryServiceTest, PrefixSearchRespectsLimit) {
    EXPECT_EQ(service.prefixSearch("V", 1).size(), 1);
}

TEST_F(QueryServiceTest, PrefixSearchNoMatch) {
    EXPECT_TRUE(service.prefixSearch("Zz", 10).empty());
}

TEST_F(QueryServiceTest, PrefixSearchValidation) {
    EXPECT_THROW((void)service.prefixSearch("", 10),
                 geoplace::InvalidQueryError);
    EXPECT_THROW((void)service.prefixSearch("Mo", 0),
                 geoplace::InvalidQueryError);
    EXPECT_THROW((void)service.prefixSearch("Mo", kMaxLimit + 1),
                 geoplace::InvalidQueryError);
}

// ============================================================================
// Comparison Tests
// ============================================================================

TEST_F(QueryServiceTest, MoscowVersusSaintPetersburg) {
    auto result = service.compare("Moscow", "Saint Petersburg", kWinter);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->north, "Saint Petersburg");
    EXPECT_TRUE(result->isSameTime);
    EXPECT_EQ(result->timezoneDiff, "+00:00");
    EXPECT_EQ(result->first->id, 524901);
    EXPECT_EQ(result->second->id, 498817);
}

TEST_F(QueryServiceTest, NorthUsesInputName) {
    auto result = service.compare("Moskva", "Vlad", kWinter);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->north, "Moskva");
}

TEST_F(QueryServiceTest, DifferentTimezones) {
    auto result = service.compare("Moscow", "Vladivostok", kWinter);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->isSameTime);
    EXPECT_EQ(result->diffMinutes, -420);
    EXPECT_EQ(result->timezoneDiff, "-07:00");
}

TEST_F(QueryServiceTest, ComparisonIsAntisymmetric) {
    auto forward = service.compare("Moscow", "Vladivostok", kSummer);
    auto backward = service.compare("Vladivostok", "Moscow", kSummer);
    ASSERT_TRUE(forward.has_value());
    ASSERT_TRUE(backward.has_value());
    EXPECT_EQ(forward->diffMinutes, -backward->diffMinutes);
    EXPECT_EQ(forward->north, backward->north);
    EXPECT_EQ(forward->isSameTime, backward->isSameTime);
}

TEST_F(QueryServiceTest, CompareWithItself) {
    auto result = service.compare("SPB", "SPB", kWinter);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->north, "SPB");
    EXPECT_TRUE(result->isSameTime);
    EXPECT_EQ(result->timezoneDiff, "+00:00");
}

TEST(QueryServiceCompareTest, EqualLatitudeFavorsFirstName) {
    auto service = makeService(
        {makeRow(1, "East", "East", 50.0, 60.0, 10, "Asia/Yekaterinburg"),
         makeRow(2, "West", "West", 50.0, 30.0, 10, "Europe/Moscow")});
    auto result = service.compare("West", "East", kWinter);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->north, "West");
    EXPECT_EQ(result->timezoneDiff, "-02:00");
}

TEST_F(QueryServiceTest, CompareUnknownName) {
    EXPECT_FALSE(service.compare("Moscow", "Atlantis", kWinter).has_value());
    EXPECT_FALSE(service.compare("Atlantis", "Moscow", kWinter).has_value());
}

TEST(QueryServiceCompareTest, EmptyNameNeverResolves) {
    // The most populous place has no aliases at all
    auto service = makeService(
        {moscowRow(), makeRow(5, "Megapolis", "", 10.0, 10.0, 90000000)});

    EXPECT_FALSE(service.getByName("").has_value());
    EXPECT_FALSE(service.compare("", "Moscow", kWinter).has_value());
}

TEST_F(QueryServiceTest, CompareUsesCurrentInstant) {
    auto result = service.compare("Moscow", "Saint Petersburg");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->isSameTime);
}

TEST(QueryServiceTimezoneTest, UnknownTimezoneThrows) {
    auto service = makeService(
        {moscowRow(), makeRow(9, "Nowhere", "Nowhere", 1.0, 1.0, 5,
                              "Invalid/Zone")});
    EXPECT_THROW((void)service.compare("Moscow", "Nowhere", kWinter),
                 geoplace::TimezoneLookupError);
}

TEST_F(QueryServiceTest, ComparisonJson) {
    auto result = service.compare("Moscow", "Saint Petersburg", kWinter);
    ASSERT_TRUE(result.has_value());
    auto j = result->toJson();
    EXPECT_EQ(j["north"], "Saint Petersburg");
    EXPECT_EQ(j["is_same_time"], true);
    EXPECT_EQ(j["timezone_diff"], "+00:00");
    EXPECT_EQ(j["name_1"]["geonameid"], 524901);
    EXPECT_EQ(j["name_2"]["alternatenames"], "Saint Petersburg,SPB");
}

TEST_F(QueryServiceTest, Size) { EXPECT_EQ(service.size(), 3); }
