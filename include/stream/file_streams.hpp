#pragma once

#include "io/io_executor.hpp"
#include "io/posix_file_provider.hpp"
#include "stream/byte_file_reader.hpp"
#include "stream/byte_file_writer.hpp"
#include "util/stream_config.hpp"

#include <memory>
#include <string>

namespace blockflow {

// Owns an I/O executor and a POSIX provider set up from one StreamConfig, and
// hands out readers/writers bound to them. Must outlive every sequence and
// signal it produced.
class FileStreams {
  public:
    explicit FileStreams(const StreamConfig& cfg = {});

    FileStreams(const FileStreams&) = delete;
    FileStreams& operator=(const FileStreams&) = delete;

    std::unique_ptr<IByteSequence> Flow(const std::string& path);
    CompletionSignal Save(const std::string& path, std::unique_ptr<IByteSequence> bytes);

    ByteFileReader Reader(std::string path);
    ByteFileWriter Writer(std::string path);

    const StreamConfig& Config() const { return cfg_; }
    IFileProvider& Provider() { return provider_; }

  private:
    StreamConfig cfg_;
    IoExecutor executor_;
    PosixFileProvider provider_;
};

} // namespace blockflow
