#pragma once

#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <new>
#include <vector>

namespace zcjson {
namespace pmr {

// Monotonic bump allocator for value trees. Deallocation is a no-op; memory
// is returned with clear() (blocks kept) or release() (blocks freed).
class arena_resource final : public std::pmr::memory_resource {
public:
  explicit arena_resource(std::size_t initial_block_size = 64 * 1024)
      : initial_block_size_(initial_block_size ? initial_block_size : default_block_size) {}

  arena_resource(const arena_resource&) = delete;
  arena_resource& operator=(const arena_resource&) = delete;

  ~arena_resource() override { release(); }

  void clear() noexcept {
    for (auto& b : blocks_) b.used = 0;
    current_block_ = 0;
  }

  void reset() noexcept { release(); }

  // Commit at least `bytes` of free space ahead of a parse.
  void reserve_bytes(std::size_t bytes) {
    std::size_t free_bytes = 0;
    for (std::size_t idx = current_block_; idx < blocks_.size(); ++idx) {
      free_bytes += blocks_[idx].size - blocks_[idx].used;
    }
    if (free_bytes >= bytes) return;
    add_block(bytes - free_bytes);
  }

  std::size_t blocks() const noexcept { return blocks_.size(); }

  std::size_t bytes_committed() const noexcept {
    std::size_t sum = 0;
    for (const auto& b : blocks_) sum += b.size;
    return sum;
  }

  std::size_t bytes_used() const noexcept {
    std::size_t sum = 0;
    for (const auto& b : blocks_) sum += b.used;
    return sum;
  }

  void release() noexcept {
    for (auto& b : blocks_) ::operator delete(b.ptr);
    blocks_.clear();
    current_block_ = 0;
  }

private:
  static constexpr std::size_t default_block_size = 64 * 1024;

  struct block {
    std::byte* ptr{nullptr};
    std::size_t size{0};
    std::size_t used{0};
  };

  std::vector<block> blocks_;
  std::size_t initial_block_size_{default_block_size};
  std::size_t current_block_{0};

  static void* bump(block& b, std::size_t bytes, std::size_t alignment) noexcept {
    const std::uintptr_t base = reinterpret_cast<std::uintptr_t>(b.ptr) + b.used;
    const std::uintptr_t aligned = (base + (alignment - 1)) & ~(static_cast<std::uintptr_t>(alignment) - 1u);
    const std::size_t padding = static_cast<std::size_t>(aligned - base);
    if (b.used + padding + bytes > b.size) return nullptr;
    b.used += padding + bytes;
    return reinterpret_cast<void*>(aligned);
  }

  block& add_block(std::size_t min_bytes) {
    block nb;
    nb.size = (min_bytes <= initial_block_size_) ? initial_block_size_ : min_bytes;
    nb.ptr = static_cast<std::byte*>(::operator new(nb.size));
    blocks_.push_back(nb);
    return blocks_.back();
  }

  void* do_allocate(std::size_t bytes, std::size_t alignment) override {
    if (bytes == 0) bytes = 1;
    if (alignment == 0) alignment = alignof(std::max_align_t);
    if ((alignment & (alignment - 1)) != 0) throw std::bad_alloc();

    for (std::size_t idx = current_block_; idx < blocks_.size(); ++idx) {
      if (void* p = bump(blocks_[idx], bytes, alignment)) {
        current_block_ = idx;
        return p;
      }
    }

    block& nb = add_block(bytes + alignment);
    current_block_ = blocks_.size() - 1;
    void* p = bump(nb, bytes, alignment);
    if (p == nullptr) throw std::bad_alloc();
    return p;
  }

  void do_deallocate(void*, std::size_t, std::size_t) override {}

  bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override { return this == &other; }
};

} // namespace pmr
} // namespace zcjson
