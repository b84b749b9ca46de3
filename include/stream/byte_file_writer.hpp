#pragma once

#include "io/block.hpp"
#include "io/file_provider.hpp"
#include "stream/sequence.hpp"
#include "util/result.hpp"
#include "util/stream_config.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace blockflow {

enum class SaveState : int {
    Idle = 0,
    Opening,
    Streaming,
    Draining,
    Completed,
    Failed,
};

const char* ToString(SaveState state);

namespace detail {
class SaveOperation;
}

// Terminal outcome of one save. The save itself runs on the first Wait().
class CompletionSignal {
  public:
    // Blocks until the save reaches Completed or Failed; later calls return the
    // same Result. Must not be called from an IoExecutor worker.
    Result Wait();

    SaveState State() const;

  private:
    friend class ByteFileWriter;
    explicit CompletionSignal(std::shared_ptr<detail::SaveOperation> op);

    std::shared_ptr<detail::SaveOperation> op_;
};

// Persists a byte sequence to a file in blocks of at most `buffer_size` bytes,
// one acknowledged write at a time.
class ByteFileWriter {
  public:
    ByteFileWriter(std::string path,
                   IFileProvider& provider,
                   std::size_t buffer_size = kSaveBufferSize,
                   std::chrono::milliseconds settle_delay = std::chrono::milliseconds{0});
    ByteFileWriter(std::string path, IFileProvider& provider, const StreamConfig& cfg);

    // Success is reported after the sink's close acknowledgment plus the
    // settle delay; failures skip the delay. Nothing is retried.
    CompletionSignal Save(std::unique_ptr<IByteSequence> bytes) const;

    const std::string& Path() const { return path_; }
    std::size_t BufferSize() const { return buffer_size_; }
    std::chrono::milliseconds SettleDelay() const { return settle_delay_; }

  private:
    std::string path_;
    IFileProvider& provider_;
    std::size_t buffer_size_;
    std::chrono::milliseconds settle_delay_;
};

} // namespace blockflow
