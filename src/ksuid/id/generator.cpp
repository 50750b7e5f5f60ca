#include "ksuid/id/generator.hpp"

#include "ksuid/util/log.hpp"

#include <cstdlib>
#include <span>
#include <utility>

namespace ksuid {

Generator::Generator() : source_(std::make_shared<SystemRandomSource>()) {}

Generator::Generator(std::shared_ptr<RandomSource> source)
    : source_(source ? std::move(source)
                     : std::make_shared<SystemRandomSource>()) {}

auto Generator::fill_buffer() -> Result<void> {
  std::size_t filled = 0;
  while (filled < buffer_.size()) {
    auto n = source_->read(std::span<std::uint8_t>{buffer_}.subspan(filled));
    if (!n) {
      log::debug("random source read failed: {}", n.error().message());
      return fail(Error::RandomSourceError);
    }
    if (*n == 0) {
      log::debug("random source exhausted after {} of {} bytes", filled,
                 buffer_.size());
      return fail(Error::RandomSourceError);
    }
    filled += *n;
  }
  return ok();
}

auto Generator::new_random() -> Result<Ksuid> {
  return new_random_with_time(Clock::now());
}

auto Generator::new_random_with_time(TimePoint t) -> Result<Ksuid> {
  std::lock_guard lock(mutex_);
  if (auto res = fill_buffer(); !res) {
    return fail(res.error());
  }
  return ok(Ksuid{to_corrected_timestamp(t), buffer_});
}

auto Generator::generate() noexcept -> Ksuid {
  auto id = new_random();
  if (!id) {
    log::error("Couldn't generate KSUID: {}", id.error().message());
    log::stop();
    std::abort();
  }
  return *id;
}

auto Generator::set_source(std::shared_ptr<RandomSource> source) -> void {
  std::lock_guard lock(mutex_);
  if (source) {
    source_ = std::move(source);
    log::debug("KSUID random source replaced");
  } else {
    source_ = std::make_shared<SystemRandomSource>();
    log::debug("KSUID random source reset to system default");
  }
}

auto default_generator() -> Generator & {
  static Generator instance;
  return instance;
}

auto new_ksuid() noexcept -> Ksuid { return default_generator().generate(); }

auto new_random() -> Result<Ksuid> { return default_generator().new_random(); }

auto new_random_with_time(TimePoint t) -> Result<Ksuid> {
  return default_generator().new_random_with_time(t);
}

auto new_string() -> std::string { return new_ksuid().str(); }

auto new_bytes() -> Ksuid::Bytes { return new_ksuid().bytes(); }

auto set_random_source(std::shared_ptr<RandomSource> source) -> void {
  default_generator().set_source(std::move(source));
}

} // namespace ksuid
