#pragma once

#include "io/file_provider.hpp"
#include "stream/sequence.hpp"

#include <memory>
#include <string>

namespace blockflow {

// Reads a whole file as a lazy sequence of bytes.
class ByteFileReader {
  public:
    ByteFileReader(std::string path, IFileProvider& provider);

    // Nothing is opened until the first Next(); every call opens the file anew.
    // Open errors surface as ErrorKind::Open, read errors as ErrorKind::Read.
    // Cancelling or destroying the sequence stops all further reads and
    // releases the file handle.
    std::unique_ptr<IByteSequence> Flow() const;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    IFileProvider& provider_;
};

} // namespace blockflow
