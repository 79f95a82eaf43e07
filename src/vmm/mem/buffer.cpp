#include "vmm/mem/buffer.hpp"

namespace vmm::mem {

ByteBuffer create_buffer(std::size_t size) {
  return ByteBuffer(size, std::byte{0});
}

} // namespace vmm::mem
