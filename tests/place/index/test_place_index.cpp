/*
 * test_place_index.cpp - Tests for building the place index
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "exception/exception.hpp"
#include "place/index/place_index.hpp"
#include "tests/place/place_test_utils.hpp"

using namespace geoplace::index;
using namespace geoplace::test;

// ============================================================================
// In-memory Build Tests
// ============================================================================

class IndexerBuildTest : public ::testing::Test {
protected:
    std::vector<std::string> rows = sampleRows();
};

TEST_F(IndexerBuildTest, FiltersNonPopulatedPlaces) {
    auto index = Indexer::build(rows);

    EXPECT_EQ(index.primary().size(), 3);
    EXPECT_FALSE(index.primary().find(1).has_value());
    EXPECT_FALSE(index.names().best("Volga").has_value());
    EXPECT_EQ(index.stats().skippedByClass, 1);
    EXPECT_EQ(index.stats().linesRead, 4);
    EXPECT_EQ(index.stats().retained, 3);
}

TEST_F(IndexerBuildTest, BothIndicesShareRecords) {
    auto index = Indexer::build(rows);

    auto byId = index.primary().find(524901);
    auto byName = index.names().best("Moskva");
    ASSERT_TRUE(byId.has_value());
    ASSERT_TRUE(byName.has_value());
    EXPECT_EQ(byId->get(), byName->get());
}

TEST_F(IndexerBuildTest, PrimaryNameIsNotIndexed) {
    rows.push_back(makeRow(77, "Gorodok", "Town", 50.0, 40.0, 10));
    auto index = Indexer::build(rows);

    EXPECT_FALSE(index.names().best("Gorodok").has_value());
    EXPECT_TRUE(index.names().best("Town").has_value());
}

TEST_F(IndexerBuildTest, DuplicateIdLastWins) {
    rows.push_back(makeRow(524901, "Moscow", "Moscow,Moskva", 55.76, 37.61,
                           12000000));
    auto index = Indexer::build(rows);

    EXPECT_EQ(index.primary().size(), 3);
    EXPECT_EQ(index.stats().duplicateIds, 1);
    EXPECT_EQ((*index.primary().find(524901))->population, 12000000);
    // Overwritten record keeps its original position
    EXPECT_EQ(index.primary().page(0, 1).front()->population, 12000000);
    EXPECT_EQ(index.names().candidates("Moskva").size(), 1);
}

TEST_F(IndexerBuildTest, SkipsBlankRows) {
    rows.insert(rows.begin() + 1, "");
    auto index = Indexer::build(rows);
    EXPECT_EQ(index.stats().linesRead, 4);
}

TEST_F(IndexerBuildTest, MalformedRowAbortsBuild) {
    rows.push_back("524901\tMoscow");
    EXPECT_THROW((void)Indexer::build(rows), geoplace::MalformedRecordError);
}

TEST_F(IndexerBuildTest, MalformedNonPopulatedRowAbortsBuild) {
    rows.push_back(
        "5\tRiver\tRiver\t\tnot-a-number\t1\tH\tSTM\tRU\t\t\t\t\t\t0\t\t0\t"
        "UTC\t2020-01-01");
    EXPECT_THROW((void)Indexer::build(rows), geoplace::MalformedRecordError);
}

TEST_F(IndexerBuildTest, EmptyDataset) {
    auto index = Indexer::build(std::vector<std::string>{});
    EXPECT_TRUE(index.primary().empty());
    EXPECT_EQ(index.names().size(), 0);
}

TEST_F(IndexerBuildTest, StatsJson) {
    auto index = Indexer::build(rows);
    auto j = index.stats().toJson();
    EXPECT_EQ(j["retained"], 3);
    EXPECT_EQ(j["skippedByClass"], 1);
    EXPECT_EQ(j["distinctNames"], 6);
    EXPECT_EQ(j["nameEntries"], 6);
    // Shared prefixes "Mos" and "S" plus the root
    EXPECT_EQ(j["trieNodes"], 39);
}

TEST_F(IndexerBuildTest, StatsCountRepeatedNames) {
    rows.push_back(makeRow(7, "Troitsk", "Troitsk,Troitsk", 55.48, 37.30,
                           40000));
    auto index = Indexer::build(rows);
    EXPECT_EQ(index.stats().distinctNames, 7);
    EXPECT_EQ(index.stats().nameEntries, 8);
}

// ============================================================================
// Stream and File Build Tests
// ============================================================================

TEST(IndexerStreamTest, BuildFromStream) {
    std::istringstream input(moscowRow() + "\r\n" + saintPetersburgRow() +
                             "\r\n");
    auto index = Indexer::build(input);
    EXPECT_EQ(index.primary().size(), 2);
    EXPECT_TRUE(index.names().best("SPB").has_value());
}

class IndexerFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               "geoplace_test_dataset.txt";
        std::ofstream out(path);
        for (const auto& row : sampleRows()) {
            out << row << '\n';
        }
    }

    void TearDown() override { std::filesystem::remove(path); }

    std::filesystem::path path;
};

TEST_F(IndexerFileTest, LoadFile) {
    auto index = Indexer::loadFile(path.string());
    ASSERT_NE(index, nullptr);
    EXPECT_EQ(index->primary().size(), 3);
}

TEST_F(IndexerFileTest, MissingFile) {
    EXPECT_THROW((void)Indexer::loadFile(path.string() + ".missing"),
                 geoplace::DatasetUnavailableError);
}
