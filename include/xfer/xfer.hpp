#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace xfer {
using Bytes = std::vector<std::uint8_t>;

// Body copy buffer, allocated once per session
static constexpr std::size_t kChunkSize = 1024 * 1024;
} // namespace xfer
