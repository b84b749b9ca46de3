#include "stream/byte_file_reader.hpp"

#include "stream/cancellation.hpp"
#include "stream/transforms.hpp"
#include "util/logger.hpp"

#include <cerrno>

namespace blockflow {

namespace {

// Block stream of one open-for-read; the token is checked before every
// suspension point (open, each read). Cancel() releases the source at once.
class FileBlocks final : public IBlockSequence {
  public:
    FileBlocks(std::string path, IFileProvider& provider)
        : path_(std::move(path)), provider_(provider) {}

    ~FileBlocks() override {
        if (source_) {
            source_->Cancel();
        }
    }

    BlockStep Next() override {
        if (failed_) {
            return std::unexpected(*failed_);
        }
        if (done_) {
            return std::nullopt;
        }
        if (token_.IsCancelled()) {
            return Fail(Cancelled());
        }

        if (!source_) {
            LogDebug("flow: opening %s", path_.c_str());
            auto opened = provider_.OpenRead(path_).get();
            if (!opened) {
                return Fail(WithKind(opened.error(), ErrorKind::Open));
            }
            source_ = std::move(*opened);
            if (token_.IsCancelled()) {
                return Fail(Cancelled());
            }
        }

        auto block = source_->ReadBlock().get();
        if (!block) {
            return Fail(WithKind(block.error(), ErrorKind::Read));
        }
        if (token_.IsCancelled()) {
            return Fail(Cancelled());
        }
        if (block->empty()) {
            done_ = true;
            source_.reset();
            LogDebug("flow: %s fully read", path_.c_str());
            return std::nullopt;
        }
        return std::move(*block);
    }

    void Cancel() override {
        token_.Cancel();
        if (source_) {
            source_->Cancel();
            source_.reset();
        }
    }

  private:
    Result Cancelled() const {
        return Result::Fail(ErrorKind::Cancelled, ECANCELED, "flow cancelled: " + path_);
    }

    BlockStep Fail(Result r) {
        if (r.kind != ErrorKind::Cancelled) {
            LogWarn("flow: %s failed: %s", path_.c_str(), r.msg.c_str());
        }
        if (source_) {
            source_->Cancel();
            source_.reset();
        }
        failed_ = std::move(r);
        return std::unexpected(*failed_);
    }

    std::string path_;
    IFileProvider& provider_;
    CancellationToken token_;
    std::unique_ptr<IBlockSource> source_;
    bool done_ = false;
    std::optional<Result> failed_;
};

} // namespace

ByteFileReader::ByteFileReader(std::string path, IFileProvider& provider)
    : path_(std::move(path)), provider_(provider) {}

std::unique_ptr<IByteSequence> ByteFileReader::Flow() const {
    return Flatten(std::make_unique<FileBlocks>(path_, provider_));
}

} // namespace blockflow
