#include "vnb/core/pmr_scratch.h"

#include <gtest/gtest.h>

#include <vector>

namespace vnb {
namespace {

// Counts upstream allocations so spills are observable.
class CountingResource final : public std::pmr::memory_resource {
public:
  size_t allocations = 0;

private:
  void *do_allocate(size_t bytes, size_t alignment) override {
    ++allocations;
    return std::pmr::new_delete_resource()->allocate(bytes, alignment);
  }
  void do_deallocate(void *p, size_t bytes, size_t alignment) override {
    std::pmr::new_delete_resource()->deallocate(p, bytes, alignment);
  }
  bool do_is_equal(const memory_resource &other) const noexcept override {
    return this == &other;
  }
};

TEST(PmrScratchTest, SmallTablesStayInline) {
  CountingResource upstream;
  ScratchArena arena(&upstream);
  {
    ScopedScratch scope(arena);
    std::pmr::vector<int32_t> counts(scope.resource());
    counts.reserve(64);
    counts.assign(64, 7);
  }
  EXPECT_EQ(upstream.allocations, 0u);
}

TEST(PmrScratchTest, LargeTablesSpillUpstream) {
  CountingResource upstream;
  ScratchArena arena(&upstream);
  {
    ScopedScratch scope(arena);
    std::pmr::vector<float> colors(scope.resource());
    colors.resize(ScratchArena::kInlineBytes);
  }
  EXPECT_GT(upstream.allocations, 0u);
}

TEST(PmrScratchTest, NestedScopesRewindOnce) {
  ScratchArena arena;
  {
    ScopedScratch outer(arena);
    {
      ScopedScratch inner(arena);
      EXPECT_EQ(arena.activeScopes(), 2u);
    }
    EXPECT_EQ(arena.activeScopes(), 1u);
  }
  EXPECT_EQ(arena.activeScopes(), 0u);
}

} // namespace
} // namespace vnb
