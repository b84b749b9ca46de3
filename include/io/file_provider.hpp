#pragma once

#include "io/block.hpp"
#include "util/result.hpp"

#include <expected>
#include <future>
#include <memory>
#include <string>

namespace blockflow {

using ReadOutcome = std::expected<Block, Result>;

// Read side of an open file. One read may be in flight at a time.
class IBlockSource {
public:
    virtual ~IBlockSource() = default;

    // Resolves to the next block in file order; an empty block marks end of file.
    virtual std::future<ReadOutcome> ReadBlock() = 0;

    // Later reads resolve to ErrorKind::Cancelled without touching the file.
    virtual void Cancel() = 0;
};

// Write side of an open file. Blocks land in the order WriteBlock is called.
class IBlockSink {
public:
    virtual ~IBlockSink() = default;

    // Resolves once the whole block has been handed to storage.
    virtual std::future<Result> WriteBlock(Block block) = 0;

    // Flushes and closes the handle; resolves once storage acknowledged both.
    virtual std::future<Result> Close() = 0;
};

using OpenedSource = std::expected<std::unique_ptr<IBlockSource>, Result>;
using OpenedSink = std::expected<std::unique_ptr<IBlockSink>, Result>;

// Asynchronous, block-oriented access to files. Handles are released when the
// returned source/sink is destroyed or its stream ends.
class IFileProvider {
public:
    virtual ~IFileProvider() = default;

    virtual std::future<OpenedSource> OpenRead(const std::string& path) = 0;
    virtual std::future<OpenedSink> OpenWrite(const std::string& path) = 0;
};

} // namespace blockflow
