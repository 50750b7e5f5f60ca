#include "ksuid/id/generator.hpp"

#include <ankerl/unordered_dense.h>

#include "gtest/gtest.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ksuid {
namespace {

// Emits 0, 1, 2, ... at most `chunk` bytes per read.
class SequenceSource final : public RandomSource {
public:
  explicit SequenceSource(std::size_t chunk = 1024) : chunk_(chunk) {}

  auto read(std::span<std::uint8_t> out) -> Result<std::size_t> override {
    const auto n = std::min(out.size(), chunk_);
    for (std::size_t i = 0; i < n; ++i) {
      out[i] = next_++;
    }
    ++reads_;
    return ok(n);
  }

  [[nodiscard]] auto reads() const -> int { return reads_; }

private:
  std::size_t chunk_;
  std::uint8_t next_{0};
  int reads_{0};
};

// Hands out `budget` bytes in total, then reports end of data.
class ExhaustibleSource final : public RandomSource {
public:
  explicit ExhaustibleSource(std::size_t budget) : budget_(budget) {}

  auto read(std::span<std::uint8_t> out) -> Result<std::size_t> override {
    const auto n = std::min(out.size(), budget_);
    std::fill_n(out.begin(), n, std::uint8_t{0xAA});
    budget_ -= n;
    return ok(n);
  }

private:
  std::size_t budget_;
};

class FailingSource final : public RandomSource {
public:
  auto read(std::span<std::uint8_t>) -> Result<std::size_t> override {
    return fail(std::make_error_code(std::errc::io_error));
  }
};

auto at_unix(std::int64_t seconds) -> TimePoint {
  return TimePoint{std::chrono::seconds{seconds}};
}

auto expected_sequence(std::uint8_t first) -> Ksuid::Payload {
  Ksuid::Payload p{};
  for (std::size_t i = 0; i < p.size(); ++i) {
    p[i] = static_cast<std::uint8_t>(first + i);
  }
  return p;
}

TEST(GeneratorTest, PayloadComesFromSource) {
  Generator gen{std::make_shared<SequenceSource>()};
  auto id = gen.new_random_with_time(at_unix(1632859955));
  ASSERT_TRUE(id) << id.error().message();
  EXPECT_EQ(id->timestamp(), 232859955u);
  EXPECT_TRUE(std::ranges::equal(id->payload(), expected_sequence(0)));

  auto second = gen.new_random_with_time(at_unix(1632859955));
  ASSERT_TRUE(second);
  EXPECT_TRUE(std::ranges::equal(second->payload(), expected_sequence(16)));
  EXPECT_LT(*id, *second);
}

TEST(GeneratorTest, ShortReadsAreRetried) {
  auto source = std::make_shared<SequenceSource>(3);
  Generator gen{source};
  auto id = gen.new_random_with_time(at_unix(1600000000));
  ASSERT_TRUE(id);
  EXPECT_TRUE(std::ranges::equal(id->payload(), expected_sequence(0)));
  EXPECT_EQ(source->reads(), 6); // 3+3+3+3+3+1
}

TEST(GeneratorTest, ExhaustedSourceFails) {
  Generator gen{std::make_shared<ExhaustibleSource>(20)};
  ASSERT_TRUE(gen.new_random());

  // Only 4 bytes left for a 16 byte payload.
  auto id = gen.new_random();
  ASSERT_FALSE(id);
  EXPECT_EQ(id.error(), make_error_code(Error::RandomSourceError));
}

TEST(GeneratorTest, FailingSourceFails) {
  Generator gen{std::make_shared<FailingSource>()};
  auto id = gen.new_random();
  ASSERT_FALSE(id);
  EXPECT_EQ(id.error(), make_error_code(Error::RandomSourceError));
}

TEST(GeneratorTest, NullSourceFallsBackToSystem) {
  Generator gen{nullptr};
  auto id = gen.new_random();
  ASSERT_TRUE(id);
  EXPECT_FALSE(id->is_nil());
}

TEST(GeneratorTest, SetSourceSwapsAndResets) {
  Generator gen{std::make_shared<FailingSource>()};
  ASSERT_FALSE(gen.new_random());

  gen.set_source(std::make_shared<SequenceSource>());
  auto fixed = gen.new_random();
  ASSERT_TRUE(fixed);
  EXPECT_TRUE(std::ranges::equal(fixed->payload(), expected_sequence(0)));

  gen.set_source(nullptr);
  auto system = gen.new_random();
  ASSERT_TRUE(system);
}

TEST(GeneratorTest, UsesCurrentTime) {
  Generator gen;
  const auto before = std::chrono::floor<std::chrono::seconds>(Clock::now());
  auto id = gen.new_random();
  const auto after = Clock::now();
  ASSERT_TRUE(id);
  EXPECT_GE(id->time(), before);
  EXPECT_LE(id->time(), after);
}

TEST(GeneratorTest, ConcurrentCallersGetDistinctIds) {
  Generator gen;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 500;

  std::mutex mu;
  std::vector<Ksuid> all;
  std::atomic<int> failures{0};
  {
    std::vector<std::jthread> workers;
    for (int t = 0; t < kThreads; ++t) {
      workers.emplace_back([&] {
        std::vector<Ksuid> local;
        local.reserve(kPerThread);
        for (int i = 0; i < kPerThread; ++i) {
          auto id = gen.new_random();
          if (!id) {
            failures.fetch_add(1, std::memory_order_relaxed);
            continue;
          }
          local.push_back(*id);
        }
        std::lock_guard lock(mu);
        all.insert(all.end(), local.begin(), local.end());
      });
    }
  }

  EXPECT_EQ(failures.load(), 0);
  ankerl::unordered_dense::set<Ksuid> unique(all.begin(), all.end());
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(GeneratorTest, DefaultGeneratorHelpers) {
  EXPECT_EQ(new_string().size(), kStringEncodedLength);
  EXPECT_FALSE(Ksuid{new_bytes()}.is_nil());
  EXPECT_FALSE(new_ksuid().is_nil());

  auto at = new_random_with_time(at_unix(1507608047));
  ASSERT_TRUE(at);
  EXPECT_EQ(at->timestamp(), 107608047u);
}

TEST(GeneratorTest, SetRandomSourceAffectsDefaultGenerator) {
  set_random_source(std::make_shared<SequenceSource>());
  auto id = new_random();
  set_random_source(nullptr);

  ASSERT_TRUE(id);
  EXPECT_TRUE(std::ranges::equal(id->payload(), expected_sequence(0)));

  auto after_reset = new_random();
  ASSERT_TRUE(after_reset);
}

TEST(GeneratorDeathTest, GenerateAbortsWhenSourceFails) {
  Generator gen{std::make_shared<FailingSource>()};
  EXPECT_DEATH((void)gen.generate(), "");
}

} // namespace
} // namespace ksuid
