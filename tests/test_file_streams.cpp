#include "stream/file_streams.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace {

class FileStreamsTests : public ::testing::Test {
  protected:
    void SetUp() override { saved_ = blockflow::Logger::Instance().Level(); }
    void TearDown() override { blockflow::Logger::Instance().SetLevel(saved_); }

    testutil::TemporaryDirectory tmp;
    blockflow::LogLevel saved_ = blockflow::LogLevel::Info;
};

TEST_F(FileStreamsTests, SaveThenFlowReturnsSameBytes) {
    blockflow::FileStreams streams;
    const std::string p = tmp.File("t.bin");
    const std::vector<std::uint8_t> data{0x41, 0x42, 0x43};

    auto res = streams.Save(p, blockflow::BytesOf(data)).Wait();
    ASSERT_TRUE(res.ok) << res.msg;

    auto seq = streams.Flow(p);
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(blockflow::Collect(*seq, out).ok);
    EXPECT_EQ(out, data);
}

TEST_F(FileStreamsTests, AppliesConfig) {
    blockflow::StreamConfig cfg;
    cfg.save_buffer_size = 100;
    cfg.read_block_size = 7;
    cfg.settle_delay = std::chrono::milliseconds(10);
    cfg.io_threads = 3;
    cfg.log_level = blockflow::LogLevel::Error;

    blockflow::FileStreams streams(cfg);
    EXPECT_EQ(blockflow::Logger::Instance().Level(), blockflow::LogLevel::Error);
    EXPECT_EQ(streams.Writer(tmp.File("x")).BufferSize(), 100u);
    EXPECT_EQ(streams.Writer(tmp.File("x")).SettleDelay(), std::chrono::milliseconds(10));

    const std::string p = tmp.File("blocks.bin");
    testutil::WriteFileBytes(p, testutil::Pattern(20));
    auto opened = streams.Provider().OpenRead(p).get();
    ASSERT_TRUE(opened.has_value());
    auto first = (*opened)->ReadBlock().get();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->size(), 7u);
}

TEST_F(FileStreamsTests, OversizedBlocksAreClampedInsteadOfAllocated) {
    blockflow::StreamConfig cfg;
    cfg.save_buffer_size = size_t{1} << 50;
    cfg.read_block_size = size_t{1} << 50;
    blockflow::FileStreams streams(cfg);

    const std::string p = tmp.File("t.bin");
    const std::vector<std::uint8_t> data{0x41, 0x42, 0x43};
    auto res = streams.Save(p, blockflow::BytesOf(data)).Wait();
    ASSERT_TRUE(res.ok) << res.msg;

    auto seq = streams.Flow(p);
    std::vector<std::uint8_t> out;
    auto rr = blockflow::Collect(*seq, out);
    ASSERT_TRUE(rr.ok) << rr.msg;
    EXPECT_EQ(out, data);
}

TEST_F(FileStreamsTests, CancelClosesDescriptorBeforeSequenceIsDropped) {
    auto open_fds = [] {
        size_t n = 0;
        for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd")) {
            (void)entry;
            ++n;
        }
        return n;
    };

    blockflow::FileStreams streams;
    const std::string p = tmp.File("in.bin");
    testutil::WriteFileBytes(p, testutil::Pattern(50000));

    const size_t before = open_fds();
    auto seq = streams.Flow(p);
    ASSERT_TRUE(seq->Next().has_value());
    EXPECT_EQ(open_fds(), before + 1);

    seq->Cancel();
    EXPECT_EQ(open_fds(), before);
}

TEST_F(FileStreamsTests, FlowOfMissingFileFailsWithOpenError) {
    blockflow::FileStreams streams;
    auto seq = streams.Flow(tmp.File("missing.bin"));
    auto step = seq->Next();
    ASSERT_FALSE(step.has_value());
    EXPECT_EQ(step.error().kind, blockflow::ErrorKind::Open);
}

} // namespace
