/**
 * @file test_json_sink.cpp
 * @brief Unit tests for the logger front-end and the rotating NDJSON sink.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace tco_scheduler;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    return lines;
}

}  // namespace

TEST(LoggerTest, FormatsJsonLine) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));

    logger.info("registry", "node \"n1\" registered");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("component":"registry")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("msg":"node \"n1\" registered")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("service", "hidden");
    logger.info("service", "hidden");
    logger.warn("service", "shown");
    logger.error("service", "shown");
    EXPECT_EQ(lines.size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("service", "now shown");
    EXPECT_EQ(lines.size(), 3u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, ParseLevelAndEscape) {
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("WARN").has_value());
    EXPECT_EQ(json_escape("a\"b\\c\nd"), "a\\\"b\\\\c\\nd");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
}

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "tco_test_json_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(JsonFileSinkTest, WritesOneLinePerRecord) {
    {
        JsonFileSink sink(dir_, "events");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), dir_ / "events.ndjson");
    }
    auto lines = read_lines(dir_ / "events.ndjson");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], R"({"a":2})");
}

TEST_F(JsonFileSinkTest, AppendsAcrossReopen) {
    {
        JsonFileSink sink(dir_, "events");
        sink.write("first");
    }
    {
        JsonFileSink sink(dir_, "events");
        sink.write("second");
    }
    EXPECT_EQ(read_lines(dir_ / "events.ndjson").size(), 2u);
}

TEST_F(JsonFileSinkTest, RotatesAndKeepsBoundedGenerations) {
    {
        JsonFileSink sink(dir_, "events", 1, 2);
        sink.set_max_file_size_bytes(10);

        // Each record is 10 bytes with its newline: every write after the first rotates.
        for (int i = 0; i < 5; ++i) {
            sink.write("record-" + std::to_string(i) + "!");
        }
        sink.flush();
    }

    EXPECT_EQ(read_lines(dir_ / "events.ndjson"), std::vector<std::string>{"record-4!"});
    EXPECT_EQ(read_lines(dir_ / "events.1.ndjson"), std::vector<std::string>{"record-3!"});
    EXPECT_EQ(read_lines(dir_ / "events.2.ndjson"), std::vector<std::string>{"record-2!"});
    EXPECT_FALSE(std::filesystem::exists(dir_ / "events.3.ndjson"));
}

TEST_F(JsonFileSinkTest, ZeroGenerationsTruncates) {
    {
        JsonFileSink sink(dir_, "events", 1, 0);
        sink.set_max_file_size_bytes(4);
        sink.write("aaaa");
        sink.write("bbbb");
    }
    EXPECT_EQ(read_lines(dir_ / "events.ndjson"), std::vector<std::string>{"bbbb"});
    EXPECT_FALSE(std::filesystem::exists(dir_ / "events.1.ndjson"));
}
