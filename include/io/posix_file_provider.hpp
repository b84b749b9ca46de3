#pragma once

#include "io/file_provider.hpp"
#include "io/io_executor.hpp"
#include "util/stream_config.hpp"

#include <cstddef>
#include <sys/types.h>

namespace blockflow {

struct PosixFileOptions {
    std::size_t read_block_size = kReadBlockSize;
    bool truncate_on_write = true;
    bool fsync_on_close = true;
    mode_t create_mode = 0644;
};

PosixFileOptions FileOptionsFrom(const StreamConfig& cfg);

// Runs open/read/write/fsync/close on the executor's workers.
// The executor must outlive the provider and every source/sink it hands out.
class PosixFileProvider final : public IFileProvider {
  public:
    explicit PosixFileProvider(IoExecutor& executor, PosixFileOptions options = {});

    std::future<OpenedSource> OpenRead(const std::string& path) override;
    std::future<OpenedSink> OpenWrite(const std::string& path) override;

    const PosixFileOptions& Options() const { return options_; }

  private:
    IoExecutor& executor_;
    PosixFileOptions options_;
};

} // namespace blockflow
