#pragma once

#include "errors.hpp"
#include "option.hpp"
#include "preclude.hpp"

#include <chrono>
#include <concepts>
#include <cstdint>
#include <memory>
#include <mutex>

// Default layout, most significant bit first:
//
//   1 bit : unused, always 0
//  41 bits: ticks since epoch (one tick is 2^23 ns, about 8.4 ms)
//  10 bits: machine ID
//  12 bits: sequence number
namespace snowflake {

struct IDParts {
  std::uint64_t time;
  std::uint64_t machineID;
  std::uint64_t sequence;
};

class Layout {
public:
  static auto create(GeneratorOption const& option) -> ext::expected<Layout, ConfigError>;

  // ((nanos - epoch) >> clockShift) & timeMask, wraps after 2^timeBits ticks
  auto truncate(std::uint64_t nanosSinceUnixEpoch) const noexcept -> std::uint64_t
  {
    return ((nanosSinceUnixEpoch - mEpochStartNanos) >> mClockShift) & mTimeMask;
  }
  auto compose(std::uint64_t time, std::uint64_t seq) const noexcept -> std::uint64_t
  {
    return (time << mTimeShift) | mMachineIDShifted | seq;
  }
  auto decompose(std::uint64_t id) const noexcept -> IDParts;

  auto machineID() const noexcept -> std::uint64_t { return mMachineIDShifted >> mMachineShift; }
  auto machineBits() const noexcept -> std::uint64_t { return mMachineBits; }
  auto sequenceBits() const noexcept -> std::uint64_t { return mSequenceBits; }
  auto timeBits() const noexcept -> std::uint64_t { return mTimeBits; }
  auto machineShift() const noexcept -> std::uint64_t { return mMachineShift; }
  auto timeShift() const noexcept -> std::uint64_t { return mTimeShift; }
  auto sequenceMask() const noexcept -> std::uint64_t { return mSequenceMask; }
  auto machineMask() const noexcept -> std::uint64_t { return mMachineMask; }
  auto timeMask() const noexcept -> std::uint64_t { return mTimeMask; }
  auto clockShift() const noexcept -> std::uint64_t { return mClockShift; }
  auto epochStartNanos() const noexcept -> std::uint64_t { return mEpochStartNanos; }
  auto tickNanos() const noexcept -> std::uint64_t { return std::uint64_t{1} << mClockShift; }

private:
  Layout() = default;

  std::uint64_t mEpochStartNanos = 0;
  std::uint64_t mMachineBits = 0;
  std::uint64_t mSequenceBits = 0;
  std::uint64_t mTimeBits = 0;
  std::uint64_t mMachineShift = 0;
  std::uint64_t mTimeShift = 0;
  std::uint64_t mSequenceMask = 0;
  std::uint64_t mMachineMask = 0;
  std::uint64_t mTimeMask = 0;
  std::uint64_t mClockShift = 0;
  std::uint64_t mMachineIDShifted = 0;
};

template <typename C>
concept NanoClock = requires {
  { C::now() } -> std::convertible_to<std::uint64_t>;
};

// nanoseconds since the Unix epoch
struct SystemClock {
  static auto now() noexcept -> std::uint64_t
  {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
  }
};

// Safe for concurrent use. When the sequence of the current tick is exhausted, or the clock went
// backwards and the sequence runs out, the stored time is pushed one tick ahead of the clock
// instead of waiting for it.
template <NanoClock Clock>
class BasicGenerator {
public:
  explicit BasicGenerator(Layout const& layout) noexcept : mLayout(layout) {}
  BasicGenerator(BasicGenerator const&) = delete;
  auto operator=(BasicGenerator const&) -> BasicGenerator& = delete;

  static auto create(GeneratorOption const& option) -> ext::expected<std::unique_ptr<BasicGenerator>, ConfigError>
  {
    auto layout = Layout::create(option);
    if (!layout) {
      return ext::make_unexpected(layout.error());
    }
    return std::make_unique<BasicGenerator>(*layout);
  }

  auto next() -> std::uint64_t
  {
    auto lock = std::lock_guard(mMt);
    auto newTime = mLayout.truncate(Clock::now());
    if (newTime > mTime) {
      mTime = newTime;
      mSeq = 0;
    } else if (mSeq == mLayout.sequenceMask()) {
      mTime++;
      mSeq = 0;
    } else {
      mSeq++;
    }
    return mLayout.compose(mTime, mSeq);
  }

  auto machineID() const noexcept -> std::uint64_t { return mLayout.machineID(); }
  auto layout() const noexcept -> Layout const& { return mLayout; }

private:
  Layout const mLayout;
  std::mutex mMt;
  std::uint64_t mTime = 0;
  std::uint64_t mSeq = 0;
};

using Generator = BasicGenerator<SystemClock>;
}; // namespace snowflake
