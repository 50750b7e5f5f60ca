#include "ksuid/util/uint128.hpp"

#include "gtest/gtest.h"

#include <array>
#include <cstdint>
#include <limits>

using namespace ksuid::util;

namespace {
constexpr auto kMax64 = std::numeric_limits<std::uint64_t>::max();
} // namespace

TEST(Uint128Test, AddCarriesIntoHighLimb) {
  const auto v = add128(make_uint128(0, kMax64), make_uint128(0, 1));
  EXPECT_EQ(v, make_uint128(1, 0));
}

TEST(Uint128Test, AddWrapsAtTop) {
  EXPECT_EQ(add128(make_uint128(kMax64, kMax64), make_uint128(0, 1)),
            make_uint128(0, 0));
  EXPECT_EQ(add128(make_uint128(kMax64, kMax64), make_uint128(0, 2)),
            make_uint128(0, 1));
}

TEST(Uint128Test, AddWithoutCarry) {
  EXPECT_EQ(add128(make_uint128(3, 5), make_uint128(4, 6)),
            make_uint128(7, 11));
}

TEST(Uint128Test, SubBorrowsFromHighLimb) {
  EXPECT_EQ(sub128(make_uint128(1, 0), make_uint128(0, 1)),
            make_uint128(0, kMax64));
}

TEST(Uint128Test, SubWrapsAtZero) {
  EXPECT_EQ(sub128(make_uint128(0, 0), make_uint128(0, 1)),
            make_uint128(kMax64, kMax64));
}

TEST(Uint128Test, SubHighLimbs) {
  EXPECT_EQ(sub128(make_uint128(10, 7), make_uint128(3, 9)),
            make_uint128(6, kMax64 - 1));
}

TEST(Uint128Test, EqualityComparesBothLimbs) {
  EXPECT_EQ(make_uint128(1, 2), make_uint128(1, 2));
  EXPECT_NE(make_uint128(1, 2), make_uint128(2, 1));
  EXPECT_NE(make_uint128(0, 2), make_uint128(1, 2));
}

TEST(Uint128Test, BytesAreBigEndian) {
  const std::array<std::uint8_t, 16> bytes{0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                                           0x07, 0x08, 0x09, 0x0A, 0x0B, 0x0C,
                                           0x0D, 0x0E, 0x0F, 0x10};
  const auto v = uint128_from_bytes(bytes);
  EXPECT_EQ(v.hi, 0x0102030405060708ULL);
  EXPECT_EQ(v.lo, 0x090A0B0C0D0E0F10ULL);
  EXPECT_EQ(uint128_to_bytes(v), bytes);
}

TEST(Uint128Test, ConstexprArithmetic) {
  static_assert(add128(make_uint128(0, kMax64), make_uint128(0, 1)) ==
                make_uint128(1, 0));
  static_assert(sub128(make_uint128(0, 0), make_uint128(0, 1)) ==
                make_uint128(kMax64, kMax64));
  SUCCEED();
}
