/**
 * @file test_block.cpp
 * @brief Tests for Block value semantics and formatting.
 */
#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "vmm/mem/block.hpp"
#include "vmm/mem/mem_error.hpp"

using vmm::mem::Block;
using vmm::mem::MemError;

TEST(Block, SizeIsEndMinusOffset) {
  constexpr Block b{16, 48};
  static_assert(b.size() == 32);
  EXPECT_EQ(b.offset(), 16u);
  EXPECT_EQ(b.end(), 48u);
  EXPECT_EQ(b.size(), 32u);
}

TEST(Block, ZeroSizeIsRepresentable) {
  Block b{7, 7};
  EXPECT_EQ(b.size(), 0u);
}

TEST(Block, Repr) {
  EXPECT_EQ(vmm::mem::to_string(Block{0, 100}), "<Block(offset=0, end=100, size=100)>");

  std::ostringstream os;
  os << Block{200, 255};
  EXPECT_EQ(os.str(), "<Block(offset=200, end=255, size=55)>");
}

TEST(Block, AdjacencyIsDirectional) {
  Block lo{0, 16}, hi{16, 32};
  EXPECT_TRUE(lo.adjacent_to(hi));
  EXPECT_FALSE(hi.adjacent_to(lo));
  EXPECT_FALSE(lo.overlaps(hi));   // touching is not overlapping
}

TEST(Block, Overlap) {
  EXPECT_TRUE(Block(0, 10).overlaps(Block(5, 15)));
  EXPECT_TRUE(Block(5, 15).overlaps(Block(0, 10)));
  EXPECT_TRUE(Block(0, 100).overlaps(Block(40, 60)));
  EXPECT_FALSE(Block(0, 10).overlaps(Block(20, 30)));
}

TEST(Block, Equality) {
  EXPECT_EQ(Block(3, 9), Block(3, 9));
  EXPECT_NE(Block(3, 9), Block(3, 10));
}

TEST(MemError, Labels) {
  EXPECT_STREQ(vmm::mem::to_string(MemError::OutOfMemory), "out of memory");
  EXPECT_STREQ(vmm::mem::to_string(MemError::NotOwned),
               "allocation not owned by this memory manager");
}
