/*
 * test_sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for SinkFactory

**************************************************/

#include <gtest/gtest.h>

#include "logging/sinks/sink_factory.hpp"

#include <filesystem>
#include <string>

using namespace geoplace::logging;

class SinkFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ =
            std::filesystem::temp_directory_path() / "geoplace_sink_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }

    std::filesystem::path test_dir_;
};

// ============================================================================
// Console Sink Tests
// ============================================================================

TEST_F(SinkFactoryTest, CreateConsoleSink) {
    SinkConfig config;
    config.name = "console";
    config.type = "console";
    config.level = spdlog::level::warn;

    auto sink = SinkFactory::createSink(config);

    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::warn);
}

TEST_F(SinkFactoryTest, StdoutAlias) {
    SinkConfig config;
    config.type = "stdout";
    EXPECT_NE(SinkFactory::createSink(config), nullptr);
}

TEST_F(SinkFactoryTest, UnknownTypeReturnsNull) {
    SinkConfig config;
    config.name = "mystery";
    config.type = "carrier_pigeon";
    EXPECT_EQ(SinkFactory::createSink(config), nullptr);
}

// ============================================================================
// File Sink Tests
// ============================================================================

TEST_F(SinkFactoryTest, CreateFileSinkInNestedDirectory) {
    auto file_path = test_dir_ / "nested" / "out.log";

    SinkConfig config;
    config.name = "file";
    config.type = "file";
    config.file_path = file_path.string();

    auto sink = SinkFactory::createSink(config);

    EXPECT_NE(sink, nullptr);
    EXPECT_TRUE(std::filesystem::exists(file_path));
}

TEST_F(SinkFactoryTest, CreateRotatingFileSink) {
    auto file_path = test_dir_ / "rotating.log";

    SinkConfig config;
    config.name = "rotating";
    config.type = "rotating_file";
    config.level = spdlog::level::debug;
    config.file_path = file_path.string();
    config.max_file_size = 1024;
    config.max_files = 2;

    auto sink = SinkFactory::createSink(config);

    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::debug);
    EXPECT_TRUE(std::filesystem::exists(file_path));
}
