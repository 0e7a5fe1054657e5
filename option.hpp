#pragma once

#include "clock.hpp"
#include "errors.hpp"
#include "layout.hpp"

#include <cstdint>
#include <memory>
#include <system_error>

namespace snowid {
struct GeneratorOption {
  std::int64_t datacenterId = 0;
  std::int64_t machineId = 0;
  // nullptr selects the system clock
  std::shared_ptr<ClockSource> clock = nullptr;
};

inline auto checkGeneratorOption(GeneratorOption const& opt) -> std::error_code
{
  if (opt.datacenterId < 0 || opt.datacenterId > static_cast<std::int64_t>(kMaxDatacenterId)) {
    return GeneratorErr::InvalidDatacenterId;
  }
  if (opt.machineId < 0 || opt.machineId > static_cast<std::int64_t>(kMaxMachineId)) {
    return GeneratorErr::InvalidMachineId;
  }
  return {};
}
} // namespace snowid
