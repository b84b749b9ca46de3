#include "stream/sequence.hpp"

#include <cerrno>

namespace blockflow {

namespace {

class MemoryByteSequence final : public IByteSequence {
  public:
    explicit MemoryByteSequence(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ByteStep Next() override {
        if (cancelled_) {
            return std::unexpected(Result::Fail(ErrorKind::Cancelled, ECANCELED, "byte sequence cancelled"));
        }
        if (pos_ >= data_.size()) {
            return std::nullopt;
        }
        return data_[pos_++];
    }

    void Cancel() override { cancelled_ = true; }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
    bool cancelled_ = false;
};

} // namespace

std::unique_ptr<IByteSequence> BytesOf(std::vector<std::uint8_t> data) {
    return std::make_unique<MemoryByteSequence>(std::move(data));
}

Result Collect(IByteSequence& seq, std::vector<std::uint8_t>& out) {
    while (true) {
        auto step = seq.Next();
        if (!step) {
            return step.error();
        }
        if (!step->has_value()) {
            return Result::Ok();
        }
        out.push_back(**step);
    }
}

} // namespace blockflow
