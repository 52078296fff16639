#include "snowflake.hpp"
#include <charconv>
#include <chrono>
#include <cstdio>
#include <string_view>

auto parseUint(std::string_view s) -> ext::expected<std::uint64_t, std::errc>
{
  auto value = std::uint64_t{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc()) {
    return ext::make_unexpected(ec);
  }
  if (ptr != s.data() + s.size()) {
    return ext::make_unexpected(std::errc::invalid_argument);
  }
  return value;
}

auto main(int argc, char** argv) -> int
{
  if (argc < 2 || argc > 3) {
    std::fprintf(stderr, "usage: %s <machine-id> [count]\n", argv[0]);
    return 1;
  }
  auto machineID = parseUint(argv[1]);
  if (!machineID) {
    std::fprintf(stderr, "bad machine id '%s': %s\n", argv[1], std::make_error_code(machineID.error()).message().c_str());
    return 1;
  }
  auto count = ext::expected<std::uint64_t, std::errc>(5);
  if (argc == 3) {
    count = parseUint(argv[2]);
    if (!count) {
      std::fprintf(stderr, "bad count '%s': %s\n", argv[2], std::make_error_code(count.error()).message().c_str());
      return 1;
    }
  }

  auto gen = snowflake::Generator::create(GeneratorOption{.machineID = *machineID});
  if (!gen) {
    std::fprintf(stderr, "%s\n", gen.error().message.c_str());
    return 1;
  }
  auto& g = **gen;

  for (std::uint64_t i = 0; i < *count; i++) {
    auto id = g.next();
    auto parts = g.layout().decompose(id);
    std::printf("%llu time=%llu machine=%llu seq=%llu\n", static_cast<unsigned long long>(id),
                static_cast<unsigned long long>(parts.time), static_cast<unsigned long long>(parts.machineID),
                static_cast<unsigned long long>(parts.sequence));
  }

  using namespace std::chrono;
  constexpr int kRounds = 1'000'000;
  auto sink = std::uint64_t{};
  auto start = steady_clock::now();
  for (int i = 0; i < kRounds; i++) {
    sink += g.next();
  }
  auto elapsed = duration_cast<duration<double>>(steady_clock::now() - start).count();
  spdlog::info("generated {} ids in {:.3f}s ({:.0f} ids/s, checksum {:x})", kRounds, elapsed, kRounds / elapsed, sink);
  return 0;
}
