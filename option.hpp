#pragma once

#include <cstdint>

constexpr std::uint64_t kDefaultMachineBits = 10;
constexpr std::uint64_t kDefaultSequenceBits = 12;
constexpr std::uint64_t kMaxBits = 63;
// width of the nanosecond clock reading the time field is cut from
constexpr std::uint64_t kClockBits = 64;

// A zero bit width means "use the default", so no field can be configured with 0 bits.
struct GeneratorOption {
  std::uint64_t machineID = 0;
  std::uint64_t epochStartUnixSeconds = 0;
  std::uint64_t machineBits = 0;
  std::uint64_t sequenceBits = 0;
  std::uint64_t timeBits = 0;
};
