#pragma once
#include <string>
#include <system_error>

namespace snowid {
enum class GeneratorErr {
  Ok = 0,
  InvalidDatacenterId,
  InvalidMachineId,
  ClockMovedBackwards,
};
struct GeneratorErrCategory : std::error_category {
  auto name() const noexcept -> char const* override;
  auto message(int ev) const -> std::string override;
};
auto generatorErrCategory() -> GeneratorErrCategory const&;
auto make_error_code(GeneratorErr e) -> std::error_code;
auto make_error_condition(GeneratorErr e) -> std::error_condition;
} // namespace snowid

namespace std {
template <>
struct is_error_code_enum<snowid::GeneratorErr> : true_type {};
} // namespace std
