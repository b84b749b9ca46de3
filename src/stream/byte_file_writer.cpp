// byte_file_writer.cpp - buffered, strictly sequential save of a byte sequence.

#include "stream/byte_file_writer.hpp"

#include "stream/transforms.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cinttypes>
#include <mutex>
#include <optional>
#include <thread>

namespace blockflow {

const char* ToString(SaveState state) {
    switch (state) {
        case SaveState::Idle:      return "idle";
        case SaveState::Opening:   return "opening";
        case SaveState::Streaming: return "streaming";
        case SaveState::Draining:  return "draining";
        case SaveState::Completed: return "completed";
        case SaveState::Failed:    return "failed";
    }
    return "unknown";
}

namespace detail {

class SaveOperation {
  public:
    SaveOperation(std::string path,
                  IFileProvider& provider,
                  std::unique_ptr<IByteSequence> bytes,
                  std::size_t buffer_size,
                  std::chrono::milliseconds settle_delay)
        : path_(std::move(path)),
          provider_(provider),
          bytes_(std::move(bytes)),
          buffer_size_(buffer_size),
          settle_delay_(settle_delay) {}

    Result Wait() {
        std::lock_guard<std::mutex> lk(mu_);
        if (!outcome_) {
            outcome_ = Run();
        }
        return *outcome_;
    }

    SaveState State() const { return state_.load(std::memory_order_acquire); }

  private:
    Result Run() {
        if (!bytes_) {
            return Fail(Result::Fail(ErrorKind::Source, -1, "save: no input sequence for " + path_));
        }

        Enter(SaveState::Opening);
        auto opened = provider_.OpenWrite(path_).get();
        if (!opened) {
            return Fail(WithKind(opened.error(), ErrorKind::Open));
        }
        std::unique_ptr<IBlockSink> sink = std::move(*opened);

        Enter(SaveState::Streaming);
        auto blocks = Rechunk(std::move(bytes_), buffer_size_);
        std::uint64_t written = 0;
        std::size_t block_count = 0;
        while (true) {
            auto step = blocks->Next();
            if (!step) {
                return Fail(WithKind(step.error(), ErrorKind::Source));
            }
            if (!step->has_value()) {
                break;
            }
            const std::size_t n = (*step)->size();
            Result wr = sink->WriteBlock(std::move(**step)).get();
            if (!wr.ok) {
                return Fail(WithKind(std::move(wr), ErrorKind::Write));
            }
            written += n;
            ++block_count;
        }

        Result closed = sink->Close().get();
        if (!closed.ok) {
            return Fail(WithKind(std::move(closed), ErrorKind::Write));
        }

        Enter(SaveState::Draining);
        if (settle_delay_.count() > 0) {
            std::this_thread::sleep_for(settle_delay_);
        }
        Enter(SaveState::Completed);
        LogDebug("save: %s complete (%" PRIu64 " bytes, %zu blocks)", path_.c_str(), written, block_count);
        return Result::Ok();
    }

    void Enter(SaveState next) {
        state_.store(next, std::memory_order_release);
        LogDebug("save: %s -> %s", path_.c_str(), ToString(next));
    }

    Result Fail(Result r) {
        LogWarn("save: %s failed (%s): %s", path_.c_str(), ToString(r.kind), r.msg.c_str());
        Enter(SaveState::Failed);
        return r;
    }

    std::string path_;
    IFileProvider& provider_;
    std::unique_ptr<IByteSequence> bytes_;
    std::size_t buffer_size_;
    std::chrono::milliseconds settle_delay_;

    std::mutex mu_;
    std::optional<Result> outcome_;
    std::atomic<SaveState> state_{SaveState::Idle};
};

} // namespace detail

CompletionSignal::CompletionSignal(std::shared_ptr<detail::SaveOperation> op) : op_(std::move(op)) {}

Result CompletionSignal::Wait() { return op_->Wait(); }

SaveState CompletionSignal::State() const { return op_->State(); }

ByteFileWriter::ByteFileWriter(std::string path,
                               IFileProvider& provider,
                               std::size_t buffer_size,
                               std::chrono::milliseconds settle_delay)
    : path_(std::move(path)),
      provider_(provider),
      buffer_size_(buffer_size == 0 ? kSaveBufferSize : std::min(buffer_size, kMaxBlockSize)),
      settle_delay_(settle_delay) {}

ByteFileWriter::ByteFileWriter(std::string path, IFileProvider& provider, const StreamConfig& cfg)
    : ByteFileWriter(std::move(path), provider, cfg.save_buffer_size, cfg.settle_delay) {}

CompletionSignal ByteFileWriter::Save(std::unique_ptr<IByteSequence> bytes) const {
    return CompletionSignal(std::make_shared<detail::SaveOperation>(
        path_, provider_, std::move(bytes), buffer_size_, settle_delay_));
}

} // namespace blockflow
