// posix_file_provider.cpp - IFileProvider over plain POSIX descriptors.

#include "io/posix_file_provider.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <unistd.h>

namespace blockflow {

namespace {

Result IoFailure(ErrorKind kind, int e, const std::string& what, const std::string& path) {
    return Result::Fail(kind, e, what + ": " + path + " (" + std::strerror(e) + ")");
}

struct SourceState {
    Fd fd;
    std::string path;
    std::size_t block_size{kReadBlockSize};
    std::atomic<bool> cancelled{false};
    std::optional<Result> failed;
};

ReadOutcome ReadOnce(SourceState& st) {
    if (st.cancelled.load(std::memory_order_acquire)) {
        return std::unexpected(Result::Fail(ErrorKind::Cancelled, ECANCELED, "read cancelled: " + st.path));
    }
    if (st.failed) {
        return std::unexpected(*st.failed);
    }
    if (!st.fd.Valid()) {
        return Block{};
    }

    Block block(st.block_size);
    while (true) {
        ssize_t n = ::read(st.fd.Get(), block.data(), block.size());
        if (n >= 0) {
            block.resize(static_cast<size_t>(n));
            if (n == 0) {
                st.fd.Close();
            }
            return block;
        }
        if (errno == EINTR) {
            continue;
        }
        const int e = errno;
        st.failed = IoFailure(ErrorKind::Read, e, "Read failed", st.path);
        st.fd.Close();
        return std::unexpected(*st.failed);
    }
}

class PosixBlockSource final : public IBlockSource {
  public:
    PosixBlockSource(IoExecutor& executor, std::shared_ptr<SourceState> state)
        : executor_(executor), state_(std::move(state)) {}

    std::future<ReadOutcome> ReadBlock() override {
        if (state_->cancelled.load(std::memory_order_acquire)) {
            return ReadyFuture<ReadOutcome>(std::unexpected(
                Result::Fail(ErrorKind::Cancelled, ECANCELED, "read cancelled: " + state_->path)));
        }
        // The job holds the state only while reading, so dropping the source
        // after an acknowledged read closes the descriptor right away.
        return executor_.Submit([weak = std::weak_ptr<SourceState>(state_)]() -> ReadOutcome {
            auto st = weak.lock();
            if (!st) {
                return std::unexpected(Result::Fail(ErrorKind::Cancelled, ECANCELED, "read source released"));
            }
            return ReadOnce(*st);
        });
    }

    void Cancel() override { state_->cancelled.store(true, std::memory_order_release); }

  private:
    IoExecutor& executor_;
    std::shared_ptr<SourceState> state_;
};

struct SinkState {
    Fd fd;
    std::string path;
    bool fsync_on_close{true};
};

Result WriteAll(SinkState& st, const Block& block) {
    if (!st.fd.Valid()) {
        return Result::Fail(ErrorKind::Write, EBADF, "write after close: " + st.path);
    }

    size_t rem = block.size();
    const std::uint8_t* p = block.data();
    while (rem > 0) {
        ssize_t n = ::write(st.fd.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = errno;
        return IoFailure(ErrorKind::Write, e, "Write failed", st.path);
    }
    return Result::Ok();
}

Result CloseSink(SinkState& st) {
    if (!st.fd.Valid()) {
        return Result::Fail(ErrorKind::Write, EBADF, "sink already closed: " + st.path);
    }
    if (st.fsync_on_close && ::fsync(st.fd.Get()) == -1) {
        const int e = errno;
        Result r = IoFailure(ErrorKind::Write, e, "fsync failed", st.path);
        st.fd.Close();
        return r;
    }
    if (::close(st.fd.Release()) == -1) {
        const int e = errno;
        return IoFailure(ErrorKind::Write, e, "close failed", st.path);
    }
    return Result::Ok();
}

class PosixBlockSink final : public IBlockSink {
  public:
    PosixBlockSink(IoExecutor& executor, std::shared_ptr<SinkState> state)
        : executor_(executor), state_(std::move(state)) {}

    std::future<Result> WriteBlock(Block block) override {
        return executor_.Submit(
            [st = state_, block = std::move(block)]() { return WriteAll(*st, block); });
    }

    std::future<Result> Close() override {
        return executor_.Submit([st = state_]() { return CloseSink(*st); });
    }

  private:
    IoExecutor& executor_;
    std::shared_ptr<SinkState> state_;
};

} // namespace

PosixFileOptions FileOptionsFrom(const StreamConfig& cfg) {
    PosixFileOptions opts;
    opts.read_block_size = cfg.read_block_size;
    opts.truncate_on_write = cfg.truncate_on_write;
    opts.fsync_on_close = cfg.fsync_on_close;
    return opts;
}

PosixFileProvider::PosixFileProvider(IoExecutor& executor, PosixFileOptions options)
    : executor_(executor), options_(options) {
    if (options_.read_block_size == 0) {
        options_.read_block_size = kReadBlockSize;
    } else if (options_.read_block_size > kMaxBlockSize) {
        options_.read_block_size = kMaxBlockSize;
    }
}

std::future<OpenedSource> PosixFileProvider::OpenRead(const std::string& path) {
    return executor_.Submit([this, path]() -> OpenedSource {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            const int e = errno;
            return std::unexpected(IoFailure(ErrorKind::Open, e, "Failed to open input", path));
        }
        LogDebug("opened %s for read (fd=%d)", path.c_str(), fd);

        auto st = std::make_shared<SourceState>();
        st->fd.Reset(fd);
        st->path = path;
        st->block_size = options_.read_block_size;
        return std::make_unique<PosixBlockSource>(executor_, std::move(st));
    });
}

std::future<OpenedSink> PosixFileProvider::OpenWrite(const std::string& path) {
    return executor_.Submit([this, path]() -> OpenedSink {
        int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
        if (options_.truncate_on_write) {
            flags |= O_TRUNC;
        }
        int fd = ::open(path.c_str(), flags, options_.create_mode);
        if (fd < 0) {
            const int e = errno;
            return std::unexpected(IoFailure(ErrorKind::Open, e, "Failed to open output", path));
        }
        LogDebug("opened %s for write (fd=%d)", path.c_str(), fd);

        auto st = std::make_shared<SinkState>();
        st->fd.Reset(fd);
        st->path = path;
        st->fsync_on_close = options_.fsync_on_close;
        return std::make_unique<PosixBlockSink>(executor_, std::move(st));
    });
}

} // namespace blockflow
