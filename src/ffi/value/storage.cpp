#include "ffi/value/storage.hpp"

#include <bit>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <limits>
#include <memory>
#include <new>
#include <utility>

#include <fmt/core.h>

#include "ffi/common/internal_error.hpp"
#include "ffi/common/log.hpp"

namespace ffi {

auto Storage::Create(size_t size, size_t alignment)
    -> std::shared_ptr<Storage> {
  if (!std::has_single_bit(alignment)) {
    throw InternalError(
        "ffi::Storage::Create",
        fmt::format("alignment {} is not a power of two", alignment));
  }
  // aligned_alloc wants a non-zero multiple of the alignment, and the
  // rounding must not wrap.
  if (size > std::numeric_limits<size_t>::max() - alignment) {
    throw std::bad_alloc();
  }
  size_t block = size == 0 ? alignment : size;
  block = (block + alignment - 1) & ~(alignment - 1);

  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory,cppcoreguidelines-no-malloc)
  void* data = std::aligned_alloc(alignment, block);
  if (data == nullptr) {
    throw std::bad_alloc();
  }
  std::memset(data, 0, block);
  Logger().trace(
      "allocated {} bytes at {} (block {}, align {})", size, data, block,
      alignment);

  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
  return std::shared_ptr<Storage>(
      new Storage(static_cast<std::byte*>(data), size));
}

Storage::Storage(std::byte* data, size_t size) : data_(data), size_(size) {
}

Storage::~Storage() {
  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory,cppcoreguidelines-no-malloc)
  std::free(data_);
}

auto Storage::Contains(const std::byte* ptr, size_t size) const -> bool {
  std::less_equal<const std::byte*> le;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const std::byte* end = data_ + size_;
  if (!le(data_, ptr) || !le(ptr, end)) {
    return false;
  }
  // Compare lengths rather than forming ptr + size, which may leave the block.
  return size <= static_cast<size_t>(end - ptr);
}

void Storage::Retain(std::shared_ptr<Storage> other) {
  if (other != nullptr && other.get() != this) {
    retained_.push_back(std::move(other));
  }
}

auto Storage::Owner(const std::byte* ptr) -> std::shared_ptr<Storage> {
  // A byte inside a block wins over the one-past-the-end of a neighbour.
  if (auto owner = Find(ptr, 1)) {
    return owner;
  }
  return Find(ptr, 0);
}

auto Storage::Find(const std::byte* ptr, size_t size)
    -> std::shared_ptr<Storage> {
  if (Contains(ptr, size)) {
    return shared_from_this();
  }
  for (const auto& other : retained_) {
    if (auto owner = other->Find(ptr, size)) {
      return owner;
    }
  }
  return nullptr;
}

}  // namespace ffi
