#include "ksuid/id/ordering.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <cstring>
#include <random>
#include <string>
#include <vector>

namespace ksuid {
namespace {

auto random_ids(std::size_t n, std::uint64_t seed) -> std::vector<Ksuid> {
  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<int> byte_dist(0, 255);
  std::vector<Ksuid> ids;
  ids.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    Ksuid::Bytes b{};
    for (auto &v : b) {
      v = static_cast<std::uint8_t>(byte_dist(rng));
    }
    ids.emplace_back(b);
  }
  return ids;
}

auto sign(int v) -> int { return (v > 0) - (v < 0); }

TEST(OrderingTest, CompareSentinels) {
  EXPECT_EQ(compare(Ksuid::nil(), Ksuid::nil()), 0);
  EXPECT_EQ(compare(Ksuid::nil(), Ksuid::max()), -1);
  EXPECT_EQ(compare(Ksuid::max(), Ksuid::nil()), 1);
}

TEST(OrderingTest, CompareMatchesTextOrder) {
  const auto ids = random_ids(200, 7);
  for (std::size_t i = 0; i + 1 < ids.size(); ++i) {
    const auto a = ids[i].str();
    const auto b = ids[i + 1].str();
    EXPECT_EQ(compare(ids[i], ids[i + 1]), sign(std::strcmp(a.c_str(), b.c_str())))
        << a << " vs " << b;
  }
}

TEST(OrderingTest, TimestampDominatesPayload) {
  Ksuid::Payload high{};
  high.fill(0xFF);
  const Ksuid earlier{100, high};
  const Ksuid later{101, Ksuid::Payload{}};
  EXPECT_EQ(compare(earlier, later), -1);
}

TEST(OrderingTest, SortProducesOrderedPermutation) {
  auto ids = random_ids(1000, 11);
  ids.push_back(ids.front());
  ids.push_back(Ksuid::nil());
  ids.push_back(Ksuid::max());
  auto original = ids;

  ksuid::sort(ids);
  EXPECT_TRUE(ksuid::is_sorted(ids));
  EXPECT_EQ(ids.front(), Ksuid::nil());
  EXPECT_EQ(ids.back(), Ksuid::max());
  EXPECT_TRUE(std::ranges::is_permutation(ids, original));

  for (std::size_t i = 0; i + 1 < ids.size(); ++i) {
    EXPECT_LE(ids[i].str(), ids[i + 1].str());
  }
}

TEST(OrderingTest, IsSortedEdgeCases) {
  std::vector<Ksuid> empty;
  EXPECT_TRUE(ksuid::is_sorted(empty));

  std::vector<Ksuid> single{Ksuid::max()};
  EXPECT_TRUE(ksuid::is_sorted(single));

  std::vector<Ksuid> dupes{Ksuid::nil(), Ksuid::nil()};
  EXPECT_TRUE(ksuid::is_sorted(dupes));

  std::vector<Ksuid> reversed{Ksuid::max(), Ksuid::nil()};
  EXPECT_FALSE(ksuid::is_sorted(reversed));
}

TEST(OrderingTest, SequentialNextIsSorted) {
  std::vector<Ksuid> ids;
  auto id = Ksuid{5, Ksuid::Payload{}}.prev().prev();
  for (int i = 0; i < 10; ++i) {
    ids.push_back(id);
    id = id.next();
  }
  EXPECT_TRUE(ksuid::is_sorted(ids));
}

} // namespace
} // namespace ksuid
