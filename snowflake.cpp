#include "snowflake.hpp"

#include <format>

namespace snowflake {
constexpr std::uint64_t kNanosPerSecond = 1'000'000'000;

static auto lowMask(std::uint64_t bits) noexcept -> std::uint64_t { return (std::uint64_t{1} << bits) - 1; }

auto Layout::create(GeneratorOption const& option) -> ext::expected<Layout, ConfigError>
{
  auto machineBits = option.machineBits == 0 ? kDefaultMachineBits : option.machineBits;
  auto sequenceBits = option.sequenceBits == 0 ? kDefaultSequenceBits : option.sequenceBits;
  auto timeBits = option.timeBits;

  // each width is checked on its own first so the sum cannot wrap
  auto widthsFit = machineBits < kMaxBits && sequenceBits < kMaxBits && timeBits < kMaxBits;
  if (widthsFit && timeBits == 0) {
    if (machineBits + sequenceBits < kMaxBits) {
      timeBits = kMaxBits - machineBits - sequenceBits;
    } else {
      widthsFit = false;
    }
  }
  if (!widthsFit || machineBits + sequenceBits + timeBits != kMaxBits) {
    auto err = ConfigError{
        .code = GeneratorErr::InvalidBitsSum,
        .message = std::format("invalid config: SequenceBits + MachineBits + TimeBits must equal {} (got {} + {} + {})",
                               kMaxBits, sequenceBits, machineBits, timeBits),
    };
    spdlog::error("{}", err.message);
    return ext::make_unexpected(std::move(err));
  }

  auto machineMax = lowMask(machineBits);
  if (option.machineID > machineMax) {
    auto err = ConfigError{
        .code = GeneratorErr::MachineIDOutOfRange,
        .message = std::format("invalid machine id {}; must be in range [0, {}]", option.machineID, machineMax),
    };
    spdlog::error("{}", err.message);
    return ext::make_unexpected(std::move(err));
  }

  auto layout = Layout();
  layout.mEpochStartNanos = option.epochStartUnixSeconds * kNanosPerSecond;
  layout.mMachineBits = machineBits;
  layout.mSequenceBits = sequenceBits;
  layout.mTimeBits = timeBits;
  layout.mMachineShift = sequenceBits;
  layout.mTimeShift = sequenceBits + machineBits;
  layout.mSequenceMask = lowMask(sequenceBits);
  layout.mMachineMask = machineMax;
  layout.mTimeMask = lowMask(timeBits);
  layout.mClockShift = kClockBits - timeBits;
  layout.mMachineIDShifted = option.machineID << layout.mMachineShift;

  spdlog::debug("snowflake layout: machine id {} time {} bits, machine {} bits, sequence {} bits, tick {} ns",
                option.machineID, timeBits, machineBits, sequenceBits, layout.tickNanos());
  return layout;
}

auto Layout::decompose(std::uint64_t id) const noexcept -> IDParts
{
  return {
      .time = (id >> mTimeShift) & mTimeMask,
      .machineID = (id >> mMachineShift) & mMachineMask,
      .sequence = id & mSequenceMask,
  };
}
}; // namespace snowflake
