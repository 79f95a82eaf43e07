/**
 * @file test_observability.cpp
 * @brief Tests that MemoryManager reports alloc/free outcomes to its Observer.
 */
#include <gtest/gtest.h>
#include <vector>

#include "vmm/mem/buffer.hpp"
#include "vmm/mem/memory_manager.hpp"
#include "vmm/obs/observability.hpp"

using vmm::mem::FailCause;
using vmm::mem::MemError;
using vmm::mem::MemoryManager;
using vmm::mem::create_buffer;
using vmm::obs::AllocEvent;
using vmm::obs::Counters;
using vmm::obs::EventKind;
using vmm::obs::Observer;

namespace {

/// Records every event for inspection.
class RecordingObserver : public Observer {
public:
  void record(const AllocEvent& e) override { events.push_back(e); }
  Counters snapshot() const override { return {}; }
  std::vector<AllocEvent> events;
};

} // namespace

TEST(Observability, ManagerReportsEveryOutcome) {
  auto buf = create_buffer(255);
  RecordingObserver rec;
  MemoryManager mm(buf, &rec);

  auto a = mm.alloc(100);
  ASSERT_TRUE(a);
  auto big = mm.alloc(200);
  ASSERT_FALSE(big);
  ASSERT_TRUE(mm.free(*a));
  ASSERT_FALSE(mm.free(*a));

  ASSERT_EQ(rec.events.size(), 4u);

  EXPECT_EQ(rec.events[0].kind, EventKind::Alloc);
  EXPECT_EQ(rec.events[0].offset, 0u);
  EXPECT_EQ(rec.events[0].size, 100u);
  EXPECT_FALSE(rec.events[0].error.has_value());

  EXPECT_EQ(rec.events[1].kind, EventKind::AllocFailed);
  EXPECT_EQ(rec.events[1].size, 200u);
  ASSERT_TRUE(rec.events[1].error.has_value());
  EXPECT_EQ(*rec.events[1].error, MemError::OutOfMemory);
  EXPECT_EQ(rec.events[1].cause, FailCause::NoContiguousBlock);

  EXPECT_EQ(rec.events[2].kind, EventKind::Free);
  EXPECT_EQ(rec.events[2].size, 100u);

  EXPECT_EQ(rec.events[3].kind, EventKind::FreeFailed);
  ASSERT_TRUE(rec.events[3].error.has_value());
  EXPECT_EQ(*rec.events[3].error, MemError::NotOwned);
  EXPECT_EQ(rec.events[3].cause, FailCause::UnknownHandle);
}

/**
 * @test OutOfMemoryCausesAreDistinguished
 * @brief Both failures are OutOfMemory, but the event says whether the
 *        request exceeded the buffer or free space was too fragmented.
 */
TEST(Observability, OutOfMemoryCausesAreDistinguished) {
  auto buf = create_buffer(255);
  RecordingObserver rec;
  MemoryManager mm(buf, &rec);

  auto too_big = mm.alloc(256);
  ASSERT_FALSE(too_big);
  EXPECT_EQ(too_big.error(), MemError::OutOfMemory);

  auto a = mm.alloc(100);
  auto b = mm.alloc(100);
  ASSERT_TRUE(a && b);
  auto no_room = mm.alloc(100);   // 55 left
  ASSERT_FALSE(no_room);
  EXPECT_EQ(no_room.error(), MemError::OutOfMemory);

  ASSERT_EQ(rec.events.size(), 4u);
  EXPECT_EQ(rec.events[0].kind, EventKind::AllocFailed);
  EXPECT_EQ(rec.events[0].cause, FailCause::ExceedsCapacity);
  EXPECT_EQ(rec.events[3].kind, EventKind::AllocFailed);
  EXPECT_EQ(rec.events[3].cause, FailCause::NoContiguousBlock);
  EXPECT_EQ(rec.events[1].cause, FailCause::None);

  EXPECT_STREQ(vmm::mem::to_string(FailCause::ExceedsCapacity),
               "size is greater than the buffer size");
  EXPECT_STREQ(vmm::mem::to_string(FailCause::NoContiguousBlock),
               "not enough contiguous memory");
}

TEST(Observability, CountingObserverTallies) {
  auto buf = create_buffer(64);
  auto obs = vmm::obs::make_counting_observer();
  MemoryManager mm(buf, obs.get());

  auto a = mm.alloc(16);
  auto b = mm.alloc(32);
  ASSERT_TRUE(a && b);
  (void)mm.alloc(32);   // only 16 left
  ASSERT_TRUE(mm.free(*a));
  (void)mm.free(*a);

  const Counters c = obs->snapshot();
  EXPECT_EQ(c.allocs, 2u);
  EXPECT_EQ(c.bytes_allocated_total, 48u);
  EXPECT_EQ(c.alloc_failures, 1u);
  EXPECT_EQ(c.frees, 1u);
  EXPECT_EQ(c.free_failures, 1u);
}

TEST(Observability, SimpleObserverIsProcessWide) {
  Observer* first  = vmm::obs::make_simple_observer();
  Observer* second = vmm::obs::make_simple_observer();
  EXPECT_EQ(first, second);

  const auto before = first->snapshot().allocs;
  first->record(AllocEvent{EventKind::Alloc, 0, 8, std::nullopt});
  EXPECT_EQ(first->snapshot().allocs, before + 1);
}

TEST(Observability, EventKindLabels) {
  EXPECT_STREQ(vmm::obs::to_string(EventKind::Alloc), "alloc");
  EXPECT_STREQ(vmm::obs::to_string(EventKind::FreeFailed), "free_failed");
}
