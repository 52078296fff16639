#pragma once
#include <string>
#include <system_error>

enum class GeneratorErr {
  Ok = 0,
  InvalidBitsSum,
  MachineIDOutOfRange,
};
struct GeneratorErrCategory : std::error_category {
  auto name() const noexcept -> char const* override;
  auto message(int ev) const -> std::string override;
};
auto generatorErrCategory() -> GeneratorErrCategory const&;
auto make_error_code(GeneratorErr e) -> std::error_code;
auto make_error_condition(GeneratorErr e) -> std::error_condition;

namespace std {
template <>
struct is_error_code_enum<GeneratorErr> : true_type {};
} // namespace std

struct ConfigError {
  std::error_code code;
  std::string message;
};
