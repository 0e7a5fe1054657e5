#include "layout.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>

namespace snowid {
auto format(std::uint64_t id) -> std::string
{
  auto parts = decode(id);
  auto tm = fmt::gmtime(static_cast<std::time_t>(parts.timestamp / 1000));
  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}, #{}, @({}, {})", tm, parts.timestamp % 1000, parts.sequence,
                     parts.datacenterId, parts.machineId);
}
} // namespace snowid
