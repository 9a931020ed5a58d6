/**
 * @file test_heap.cpp
 * @brief Tests for gc::Heap, gc::ManagedArray and gc::ManagedList.
 *
 * Validates:
 *  - Root counting and collect() reclamation
 *  - compact() moves unpinned payloads and leaves pinned ones in place
 *  - A pinned, unrooted object survives collect() until unpinned
 *  - ManagedList growth replaces its backing array
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <stdexcept>
#include <type_traits>

#include "pinview/error.hpp"
#include "pinview/gc/heap.hpp"
#include "pinview/gc/managed_array.hpp"
#include "pinview/gc/managed_list.hpp"

using pinview::Error;
using pinview::gc::Heap;
using pinview::gc::Root;
using pinview::gc::ManagedArray;
using pinview::gc::ManagedList;
using pinview::gc::make_array;

// ------------------------------ Allocation ---------------------------------

/**
 * @test Allocate_ZeroFilled_Aligned
 * @brief Fresh arrays are zeroed and cache-line aligned.
 */
TEST(Heap, Allocate_ZeroFilled_Aligned) {
  Heap heap;
  auto a = make_array<std::uint32_t>(heap, 16);
  ASSERT_FALSE(a.is_null());
  EXPECT_EQ(a.length(), 16u);
  EXPECT_EQ(reinterpret_cast<std::uintptr_t>(a.data()) % 64, 0u);
  for (std::size_t i = 0; i < a.length(); ++i) EXPECT_EQ(a[i], 0u);
  EXPECT_EQ(heap.live_objects(), 1u);
  EXPECT_EQ(heap.length_of(a.id()), 16u);
}

TEST(Heap, ZeroLength_IsDistinctObject) {
  Heap heap;
  auto a = make_array<int>(heap, 0);
  auto b = make_array<int>(heap, 0);
  EXPECT_FALSE(a.is_null());
  EXPECT_NE(a.data(), b.data());
  EXPECT_FALSE(a == b);
}

/**
 * @test ArrayLength_ComesFromAllocation
 * @brief A ManagedArray cannot be given a length of its own; the element count
 *        it reports always matches the heap object it refers to.
 */
TEST(Heap, ArrayLength_ComesFromAllocation) {
  static_assert(!std::is_constructible_v<ManagedArray<int>, Root, std::size_t>);
  static_assert(std::is_default_constructible_v<ManagedArray<int>>);

  Heap heap;
  auto a = make_array<int>(heap, 3);
  ManagedArray<int> alias = a;
  EXPECT_EQ(alias.length(), heap.length_of(alias.id()));
  EXPECT_EQ(ManagedArray<int>{}.length(), 0u);
}

// ------------------------------ Roots / collect ----------------------------

/**
 * @test Collect_ReclaimsOnlyUnrooted
 * @brief Copies add roots; the object dies only after the last one goes.
 */
TEST(Heap, Collect_ReclaimsOnlyUnrooted) {
  Heap heap;
  auto a = make_array<int>(heap, 4);
  {
    ManagedArray<int> alias = a;
    EXPECT_TRUE(alias == a);
    a = ManagedArray<int>{};
    EXPECT_EQ(heap.collect(), 0u);
    EXPECT_EQ(heap.live_objects(), 1u);
  }
  EXPECT_EQ(heap.collect(), 1u);
  EXPECT_EQ(heap.live_objects(), 0u);
  EXPECT_EQ(heap.stats().reclaimed, 1u);
}

// ------------------------------ Pins ---------------------------------------

/**
 * @test Compact_MovesUnpinned_KeepsPinned
 * @brief Relocation changes unpinned addresses only; contents survive the move.
 */
TEST(Heap, Compact_MovesUnpinned_KeepsPinned) {
  Heap heap;
  auto moving = make_array<int>(heap, 8);
  auto fixed  = make_array<int>(heap, 8);
  for (int i = 0; i < 8; ++i) { moving[i] = i; fixed[i] = 10 * i; }

  auto pin = heap.pin(fixed.id());
  ASSERT_TRUE(pin);
  EXPECT_EQ(pin->address, fixed.data());

  const int* before = moving.data();
  EXPECT_EQ(heap.compact(), 1u);
  EXPECT_NE(moving.data(), before);
  EXPECT_EQ(fixed.data(), pin->address);
  for (int i = 0; i < 8; ++i) {
    EXPECT_EQ(moving[i], i);
    EXPECT_EQ(fixed[i], 10 * i);
  }

  ASSERT_TRUE(heap.unpin(pin->ticket));
  EXPECT_EQ(heap.compact(), 2u);
}

/**
 * @test PinnedUnrooted_SurvivesCollect
 * @brief A pin keeps an object alive with no roots; unpinning lets it go.
 */
TEST(Heap, PinnedUnrooted_SurvivesCollect) {
  Heap heap;
  auto a = make_array<std::uint8_t>(heap, 32);
  const auto id = a.id();
  auto pin = heap.pin(id);
  ASSERT_TRUE(pin);
  a = ManagedArray<std::uint8_t>{};

  EXPECT_EQ(heap.collect(), 0u);
  EXPECT_EQ(heap.address_of(id), pin->address);
  EXPECT_EQ(heap.pins_on(id), 1u);

  ASSERT_TRUE(heap.unpin(pin->ticket));
  EXPECT_EQ(heap.collect(), 1u);
  EXPECT_EQ(heap.address_of(id), nullptr);
}

TEST(Heap, MultiplePins_CountedSeparately) {
  Heap heap;
  auto a = make_array<int>(heap, 2);
  auto p1 = heap.pin(a.id());
  auto p2 = heap.pin(a.id());
  ASSERT_TRUE(p1 && p2);
  EXPECT_NE(p1->ticket, p2->ticket);
  EXPECT_EQ(heap.pinned_count(), 2u);
  EXPECT_EQ(heap.pins_on(a.id()), 2u);
  ASSERT_TRUE(heap.unpin(p1->ticket));
  ASSERT_TRUE(heap.unpin(p2->ticket));
  EXPECT_EQ(heap.pinned_count(), 0u);
}

TEST(Heap, Pin_NullOrUnknown_Rejected) {
  Heap heap;
  auto r0 = heap.pin(pinview::gc::kNullObject);
  ASSERT_FALSE(r0);
  EXPECT_EQ(r0.error(), Error::NullObject);

  auto r1 = heap.pin(12345);
  ASSERT_FALSE(r1);
  EXPECT_EQ(r1.error(), Error::NullObject);
  EXPECT_STREQ(pinview::to_string(r1.error()), "null_object");
}

TEST(Heap, Unpin_UnknownTicket_Rejected) {
  Heap heap;
  auto a = make_array<int>(heap, 1);
  auto pin = heap.pin(a.id());
  ASSERT_TRUE(pin);
  ASSERT_TRUE(heap.unpin(pin->ticket));

  auto again = heap.unpin(pin->ticket);
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), Error::UnknownTicket);
}

// ------------------------------ ManagedList --------------------------------

/**
 * @test List_Growth_ReplacesBackingArray
 * @brief push_back past capacity moves elements to a new array and keeps size.
 */
TEST(ManagedList, Growth_ReplacesBackingArray) {
  Heap heap;
  auto list = ManagedList<int>::create(heap);
  EXPECT_EQ(list.capacity(), 0u);

  list.push_back(1);
  EXPECT_EQ(list.capacity(), 4u);
  EXPECT_EQ(heap.collect(), 1u); // the zero-capacity array it started with
  auto first = list.backing_storage();

  for (int i = 2; i <= 5; ++i) list.push_back(i);
  EXPECT_EQ(list.size(), 5u);
  EXPECT_EQ(list.capacity(), 8u);
  EXPECT_FALSE(list.backing_storage() == first);
  for (std::size_t i = 0; i < 5; ++i) EXPECT_EQ(list.at(i), static_cast<int>(i + 1));

  // The old array is now unrooted except for `first`.
  first = ManagedArray<int>{};
  EXPECT_EQ(heap.collect(), 1u);
}

TEST(ManagedList, ResizeShrinkClear) {
  Heap heap;
  auto list = ManagedList<std::uint16_t>::create(heap, 2);
  list.resize(6);
  EXPECT_EQ(list.size(), 6u);
  EXPECT_EQ(list.at(5), 0u);
  list.set(5, 7);
  list.pop_back();
  EXPECT_EQ(list.size(), 5u);
  list.shrink_to_fit();
  EXPECT_EQ(list.capacity(), 5u);
  list.clear();
  EXPECT_EQ(list.size(), 0u);
  EXPECT_THROW(list.pop_back(), std::out_of_range);
  EXPECT_THROW((void)list.at(0), std::out_of_range);
}

TEST(ManagedList, CopiesShareState) {
  Heap heap;
  auto a = ManagedList<int>::create(heap);
  auto b = a;
  b.push_back(42);
  EXPECT_EQ(a.size(), 1u);
  EXPECT_EQ(a.at(0), 42);
  EXPECT_TRUE(ManagedList<int>{}.is_null());
}
