#pragma once

#include "stream/sequence.hpp"

#include <cstddef>
#include <memory>

namespace blockflow {

// Expands every block into its bytes, in order. Empty blocks are skipped and a
// failure is reported only after the bytes of earlier blocks. Cancel() is
// forwarded to `blocks`.
std::unique_ptr<IByteSequence> Flatten(std::unique_ptr<IBlockSequence> blocks);

// Groups bytes into blocks of `max_size`; only the last block may be shorter
// and no block is empty. Bytes buffered when `bytes` fails are dropped.
// Throws std::invalid_argument if `max_size` is zero.
std::unique_ptr<IBlockSequence> Rechunk(std::unique_ptr<IByteSequence> bytes, std::size_t max_size);

} // namespace blockflow
