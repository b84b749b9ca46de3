// transforms.cpp - block <-> byte adapters used by the reader and the writer.

#include "stream/transforms.hpp"

#include <algorithm>
#include <cerrno>
#include <stdexcept>

namespace blockflow {

namespace {

Result CancelledSequence() {
    return Result::Fail(ErrorKind::Cancelled, ECANCELED, "sequence cancelled");
}

class FlattenedBytes final : public IByteSequence {
  public:
    explicit FlattenedBytes(std::unique_ptr<IBlockSequence> blocks) : blocks_(std::move(blocks)) {}

    ByteStep Next() override {
        if (failed_) {
            return std::unexpected(*failed_);
        }
        while (pos_ >= current_.size()) {
            if (done_) {
                return std::nullopt;
            }
            auto step = blocks_->Next();
            if (!step) {
                failed_ = step.error();
                current_.clear();
                return std::unexpected(*failed_);
            }
            if (!step->has_value()) {
                done_ = true;
                current_.clear();
                return std::nullopt;
            }
            current_ = std::move(**step);
            pos_ = 0;
        }
        return current_[pos_++];
    }

    void Cancel() override {
        blocks_->Cancel();
        if (!failed_ && !done_) {
            failed_ = CancelledSequence();
        }
        current_.clear();
        pos_ = 0;
    }

  private:
    std::unique_ptr<IBlockSequence> blocks_;
    Block current_;
    size_t pos_ = 0;
    bool done_ = false;
    std::optional<Result> failed_;
};

class RechunkedBlocks final : public IBlockSequence {
  public:
    RechunkedBlocks(std::unique_ptr<IByteSequence> bytes, std::size_t max_size)
        : bytes_(std::move(bytes)), max_size_(max_size) {}

    BlockStep Next() override {
        if (failed_) {
            return std::unexpected(*failed_);
        }
        if (done_) {
            return std::nullopt;
        }

        Block block;
        block.reserve(std::min(max_size_, kSaveBufferSize));
        while (block.size() < max_size_) {
            auto step = bytes_->Next();
            if (!step) {
                failed_ = step.error();
                return std::unexpected(*failed_);
            }
            if (!step->has_value()) {
                done_ = true;
                break;
            }
            block.push_back(**step);
        }

        if (block.empty()) {
            return std::nullopt;
        }
        return block;
    }

    void Cancel() override {
        bytes_->Cancel();
        if (!failed_ && !done_) {
            failed_ = CancelledSequence();
        }
    }

  private:
    std::unique_ptr<IByteSequence> bytes_;
    std::size_t max_size_;
    bool done_ = false;
    std::optional<Result> failed_;
};

} // namespace

std::unique_ptr<IByteSequence> Flatten(std::unique_ptr<IBlockSequence> blocks) {
    return std::make_unique<FlattenedBytes>(std::move(blocks));
}

std::unique_ptr<IBlockSequence> Rechunk(std::unique_ptr<IByteSequence> bytes, std::size_t max_size) {
    if (max_size == 0) {
        throw std::invalid_argument("Rechunk: max_size must be positive");
    }
    return std::make_unique<RechunkedBlocks>(std::move(bytes), max_size);
}

} // namespace blockflow
