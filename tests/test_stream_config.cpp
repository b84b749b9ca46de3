#include "util/stream_config.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <string>

namespace {

using blockflow::ErrorKind;
using blockflow::StreamConfig;

class StreamConfigTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string WriteText(const std::string& name, const std::string& text) {
        const std::string p = tmp.File(name);
        std::ofstream os(p);
        os << text;
        return p;
    }
};

TEST_F(StreamConfigTests, EmptyObjectKeepsDefaults) {
    StreamConfig cfg;
    auto res = StreamConfig::LoadFromString("{}", cfg);
    ASSERT_TRUE(res.ok) << res.msg;

    EXPECT_EQ(cfg.save_buffer_size, 8192u);
    EXPECT_EQ(cfg.read_block_size, 8192u);
    EXPECT_EQ(cfg.settle_delay.count(), 0);
    EXPECT_EQ(cfg.io_threads, 1u);
    EXPECT_TRUE(cfg.truncate_on_write);
    EXPECT_TRUE(cfg.fsync_on_close);
    EXPECT_EQ(cfg.log_level, blockflow::LogLevel::Info);
}

TEST_F(StreamConfigTests, LoadsAllKeysFromFile) {
    const std::string p = WriteText("stream.json", R"({
        "SaveBufferSize": 4096,
        "ReadBlockSize": 65536,
        "SettleDelayMs": 10,
        "IoThreads": 4,
        "TruncateOnWrite": false,
        "FsyncOnClose": false,
        "LogLevel": "debug"
    })");

    StreamConfig cfg;
    auto res = StreamConfig::LoadFromFile(p, cfg);
    ASSERT_TRUE(res.ok) << res.msg;

    EXPECT_EQ(cfg.save_buffer_size, 4096u);
    EXPECT_EQ(cfg.read_block_size, 65536u);
    EXPECT_EQ(cfg.settle_delay, std::chrono::milliseconds(10));
    EXPECT_EQ(cfg.io_threads, 4u);
    EXPECT_FALSE(cfg.truncate_on_write);
    EXPECT_FALSE(cfg.fsync_on_close);
    EXPECT_EQ(cfg.log_level, blockflow::LogLevel::Debug);
}

TEST_F(StreamConfigTests, MissingFileFails) {
    StreamConfig cfg;
    auto res = StreamConfig::LoadFromFile(tmp.File("absent.json"), cfg);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Config);
}

TEST_F(StreamConfigTests, InvalidJsonFails) {
    StreamConfig cfg;
    auto res = StreamConfig::LoadFromFile(WriteText("bad.json", "{ not json"), cfg);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Config);
}

TEST_F(StreamConfigTests, RootMustBeObject) {
    StreamConfig cfg;
    auto res = StreamConfig::LoadFromString("[1, 2]", cfg);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Config);
}

TEST_F(StreamConfigTests, RejectsOutOfRangeValues) {
    const char* cases[] = {
        R"({"SaveBufferSize": 0})",
        R"({"ReadBlockSize": 0})",
        R"({"IoThreads": 0})",
        R"({"IoThreads": 1000})",
        R"({"SettleDelayMs": -1})",
        R"({"SettleDelayMs": 60001})",
        R"({"SaveBufferSize": 67108865})",
        R"({"ReadBlockSize": 67108865})",
        R"({"SaveBufferSize": 1125899906842624})",
    };
    for (const char* text : cases) {
        StreamConfig cfg;
        auto res = StreamConfig::LoadFromString(text, cfg);
        EXPECT_FALSE(res.ok) << text;
        EXPECT_EQ(res.kind, ErrorKind::Config) << text;
    }
}

TEST_F(StreamConfigTests, AcceptsBlockSizeAtUpperBound) {
    StreamConfig cfg;
    auto res = StreamConfig::LoadFromString(R"({"SaveBufferSize": 67108864, "ReadBlockSize": 67108864})", cfg);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(cfg.save_buffer_size, blockflow::kMaxBlockSize);
    EXPECT_EQ(cfg.read_block_size, blockflow::kMaxBlockSize);
}

TEST_F(StreamConfigTests, HugeUnsignedValueIsReportedAsOutOfRange) {
    StreamConfig cfg;
    auto res = StreamConfig::LoadFromString(R"({"SaveBufferSize": 18446744073709551615})", cfg);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Config);
    EXPECT_EQ(res.msg.find("negative"), std::string::npos) << res.msg;
    EXPECT_NE(res.msg.find("within"), std::string::npos) << res.msg;
}

TEST_F(StreamConfigTests, FailedLoadLeavesConfigUntouched) {
    StreamConfig cfg;
    cfg.save_buffer_size = 4096;
    cfg.io_threads = 2;

    auto res = StreamConfig::LoadFromString(R"({"ReadBlockSize": 1024, "IoThreads": 0})", cfg);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(cfg.save_buffer_size, 4096u);
    EXPECT_EQ(cfg.read_block_size, blockflow::kReadBlockSize);
    EXPECT_EQ(cfg.io_threads, 2u);

    const std::string p = WriteText("partial.json", R"({"SettleDelayMs": 5, "LogLevel": "loud"})");
    res = StreamConfig::LoadFromFile(p, cfg);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(cfg.settle_delay.count(), 0);
    EXPECT_EQ(cfg.save_buffer_size, 4096u);
}

TEST_F(StreamConfigTests, RejectsWrongTypes) {
    const char* cases[] = {
        R"({"SaveBufferSize": "big"})",
        R"({"TruncateOnWrite": 1})",
        R"({"LogLevel": 3})",
        R"({"LogLevel": "verbose"})",
    };
    for (const char* text : cases) {
        StreamConfig cfg;
        EXPECT_FALSE(StreamConfig::LoadFromString(text, cfg).ok) << text;
    }
}

TEST(LogLevelTests, ParsesKnownNames) {
    EXPECT_EQ(blockflow::ParseLogLevel("warn"), blockflow::LogLevel::Warn);
    EXPECT_EQ(blockflow::ParseLogLevel("none"), blockflow::LogLevel::None);
    EXPECT_FALSE(blockflow::ParseLogLevel("WARN").has_value());
}

} // namespace
