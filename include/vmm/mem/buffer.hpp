#pragma once

#include <cstddef>
#include <vector>

namespace vmm::mem {

/// @brief Owned, contiguous byte region a MemoryManager can be built over.
using ByteBuffer = std::vector<std::byte>;

/// @brief Return a new buffer of @p size zero bytes.
ByteBuffer create_buffer(std::size_t size);

} // namespace vmm::mem
