#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace ffi {

// One zero-filled, aligned heap block. The block is released when the last
// shared_ptr to its Storage goes away; every Value that addresses the block
// holds one of those references.
class Storage final : public std::enable_shared_from_this<Storage> {
 public:
  // Throws std::bad_alloc on allocation failure or when size cannot be
  // rounded up to alignment, and InternalError if alignment is not a power
  // of two.
  static auto Create(size_t size, size_t alignment)
      -> std::shared_ptr<Storage>;

  ~Storage();

  Storage(const Storage&) = delete;
  auto operator=(const Storage&) -> Storage& = delete;
  Storage(Storage&&) = delete;
  auto operator=(Storage&&) -> Storage& = delete;

  [[nodiscard]] auto Data() const -> std::byte* {
    return data_;
  }

  // Requested size; the block itself may be rounded up for alignment.
  [[nodiscard]] auto Size() const -> size_t {
    return size_;
  }

  // True if [ptr, ptr + size) lies inside the requested size.
  [[nodiscard]] auto Contains(const std::byte* ptr, size_t size) const
      -> bool;

  // Keep other alive for as long as this block lives.
  void Retain(std::shared_ptr<Storage> other);

  // This block or one it retains (transitively) whose range, one past the
  // end included, holds the address ptr; null if none does.
  [[nodiscard]] auto Owner(const std::byte* ptr) -> std::shared_ptr<Storage>;

 private:
  Storage(std::byte* data, size_t size);

  auto Find(const std::byte* ptr, size_t size) -> std::shared_ptr<Storage>;

  std::byte* data_;
  size_t size_;
  std::vector<std::shared_ptr<Storage>> retained_;
};

}  // namespace ffi
