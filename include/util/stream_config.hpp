#pragma once

#include "io/block.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace blockflow {

struct StreamConfig {
    static constexpr std::size_t kMaxIoThreads = 64;
    static constexpr std::uint64_t kMaxSettleDelayMs = 60 * 1000;

    std::size_t save_buffer_size = kSaveBufferSize;
    std::size_t read_block_size = kReadBlockSize;
    std::chrono::milliseconds settle_delay{0};
    std::size_t io_threads = 1;
    bool truncate_on_write = true;
    bool fsync_on_close = true;
    LogLevel log_level = LogLevel::Info;

    // Keys absent from the JSON object keep their defaults. `out` is only
    // replaced when the whole object is valid.
    static Result LoadFromFile(const std::string& path, StreamConfig& out);
    static Result LoadFromString(const std::string& text, StreamConfig& out);
};

} // namespace blockflow
