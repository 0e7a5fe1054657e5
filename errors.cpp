#include "errors.hpp"

namespace snowid {
auto GeneratorErrCategory::name() const noexcept -> char const* { return "GeneratorError"; }
auto GeneratorErrCategory::message(int ev) const -> std::string
{
  switch (static_cast<GeneratorErr>(ev)) {
  case GeneratorErr::Ok:
    return "Ok";
  case GeneratorErr::InvalidDatacenterId:
    return "InvalidDatacenterId";
  case GeneratorErr::InvalidMachineId:
    return "InvalidMachineId";
  case GeneratorErr::ClockMovedBackwards:
    return "ClockMovedBackwards";
  default:
    return "Unknown";
  }
}
auto generatorErrCategory() -> GeneratorErrCategory const&
{
  static GeneratorErrCategory category;
  return category;
}
auto make_error_code(GeneratorErr e) -> std::error_code { return {static_cast<int>(e), generatorErrCategory()}; }
auto make_error_condition(GeneratorErr e) -> std::error_condition
{
  return {static_cast<int>(e), generatorErrCategory()};
}
} // namespace snowid
