#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "place/index/name_index.hpp"

using namespace geoplace::index;

namespace {

auto makePlace(int64_t id, int64_t population,
               std::vector<std::string> alternateNames) -> PlaceRef {
    auto record = std::make_shared<PlaceRecord>();
    record->id = id;
    record->featureClass = "P";
    record->population = population;
    record->alternateNames = std::move(alternateNames);
    return record;
}

}  // namespace

class NameIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        primary.upsert(makePlace(1, 500, {"Troitsk", "Troick"}));
        primary.upsert(makePlace(2, 40000, {"Troitsk"}));
        primary.upsert(makePlace(3, 100, {"Troitsk"}));
        primary.upsert(makePlace(4, 0, {"Ozyorsk"}));
        names = NameIndex::build(primary);
    }

    PrimaryIndex primary;
    NameIndex names;
};

TEST_F(NameIndexTest, BestIsMostPopulous) {
    auto best = names.best("Troitsk");
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ((*best)->id, 2);
}

TEST_F(NameIndexTest, CandidatesAscendingByPopulation) {
    auto matches = names.candidates("Troitsk");
    ASSERT_EQ(matches.size(), 3);
    EXPECT_EQ(matches[0]->id, 3);
    EXPECT_EQ(matches[1]->id, 1);
    EXPECT_EQ(matches[2]->id, 2);
}

TEST_F(NameIndexTest, UnknownName) {
    EXPECT_FALSE(names.best("Atlantis").has_value());
    EXPECT_TRUE(names.candidates("Atlantis").empty());
}

TEST_F(NameIndexTest, ExactMatchOnly) {
    EXPECT_FALSE(names.best("troitsk").has_value());
    EXPECT_FALSE(names.best("Troits").has_value());
}

TEST_F(NameIndexTest, ZeroPopulationStillIndexed) {
    auto best = names.best("Ozyorsk");
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ((*best)->id, 4);
}

TEST_F(NameIndexTest, Counts) {
    EXPECT_EQ(names.size(), 3);
    EXPECT_EQ(names.entryCount(), 5);
}

TEST_F(NameIndexTest, PrefixSearch) {
    auto results = names.withPrefix("Tro", 10);
    EXPECT_EQ(results, (std::vector<std::string>{"Troick", "Troitsk"}));
}

TEST(NameIndexTieTest, EqualPopulationKeepsInsertionOrder) {
    PrimaryIndex primary;
    primary.upsert(makePlace(11, 1000, {"Kirovsk"}));
    primary.upsert(makePlace(12, 1000, {"Kirovsk"}));
    auto names = NameIndex::build(primary);

    auto matches = names.candidates("Kirovsk");
    ASSERT_EQ(matches.size(), 2);
    EXPECT_EQ(matches[0]->id, 11);
    EXPECT_EQ(matches[1]->id, 12);
    EXPECT_EQ((*names.best("Kirovsk"))->id, 12);
}

TEST(NameIndexTieTest, RepeatedNameOnOneRecord) {
    PrimaryIndex primary;
    primary.upsert(makePlace(21, 10, {"Mirny", "Mirny"}));
    auto names = NameIndex::build(primary);

    EXPECT_EQ(names.size(), 1);
    EXPECT_EQ(names.candidates("Mirny").size(), 2);
}
