#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blockflow {

// One provider-level I/O unit.
using Block = std::vector<std::uint8_t>;

inline constexpr std::size_t kSaveBufferSize = 8 * 1024;
inline constexpr std::size_t kReadBlockSize = 8 * 1024;
// Upper bound for configured read and save block sizes.
inline constexpr std::size_t kMaxBlockSize = 64 * 1024 * 1024;

} // namespace blockflow
