#pragma once

#include "io/block.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace blockflow {

// nullopt = exhausted, error = terminal failure.
using ByteStep = std::expected<std::optional<std::uint8_t>, Result>;
using BlockStep = std::expected<std::optional<Block>, Result>;

// Lazy, single-pass, pull-driven sequence of bytes. Once Next() has reported
// the end or a failure, it keeps reporting the same outcome.
class IByteSequence {
public:
    virtual ~IByteSequence() = default;
    virtual ByteStep Next() = 0;
    // Stops the sequence; later Next() calls fail with ErrorKind::Cancelled.
    // Call from the consuming thread, never concurrently with Next().
    virtual void Cancel() {}
};

// Same contract as IByteSequence, one block per step.
class IBlockSequence {
public:
    virtual ~IBlockSequence() = default;
    virtual BlockStep Next() = 0;
    virtual void Cancel() {}
};

std::unique_ptr<IByteSequence> BytesOf(std::vector<std::uint8_t> data);

// Drains `seq`. On failure the bytes produced so far are left in `out`.
Result Collect(IByteSequence& seq, std::vector<std::uint8_t>& out);

} // namespace blockflow
