#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory_resource>

namespace vnb {

// Temporaries for a single encode or decode call. The first kInlineBytes are
// served from storage inside the arena; larger tables spill to upstream.
class ScratchArena final {
public:
  static constexpr size_t kInlineBytes = 4096;

  explicit ScratchArena(
      std::pmr::memory_resource *upstream = std::pmr::get_default_resource())
      : arena_(inline_.data(), inline_.size(),
               upstream ? upstream : std::pmr::get_default_resource()) {}

  ScratchArena(const ScratchArena &) = delete;
  ScratchArena &operator=(const ScratchArena &) = delete;
  ScratchArena(ScratchArena &&) = delete;
  ScratchArena &operator=(ScratchArena &&) = delete;

  [[nodiscard]] std::pmr::memory_resource *resource() noexcept {
    return &arena_;
  }

  [[nodiscard]] uint32_t activeScopes() const noexcept { return scopes_; }

private:
  friend class ScopedScratch;

  alignas(std::max_align_t) std::array<std::byte, kInlineBytes> inline_{};
  std::pmr::monotonic_buffer_resource arena_;
  uint32_t scopes_ = 0;
};

// Marks a region whose scratch allocations die together. Scopes may nest; the
// arena is rewound when the outermost one closes.
class ScopedScratch final {
public:
  explicit ScopedScratch(ScratchArena &arena) noexcept : arena_(arena) {
    ++arena_.scopes_;
  }

  ~ScopedScratch() noexcept {
    if (--arena_.scopes_ == 0) {
      arena_.arena_.release();
    }
  }

  ScopedScratch(const ScopedScratch &) = delete;
  ScopedScratch &operator=(const ScopedScratch &) = delete;
  ScopedScratch(ScopedScratch &&) = delete;
  ScopedScratch &operator=(ScopedScratch &&) = delete;

  [[nodiscard]] std::pmr::memory_resource *resource() noexcept {
    return arena_.resource();
  }

private:
  ScratchArena &arena_;
};

} // namespace vnb
