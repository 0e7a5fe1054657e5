#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

namespace snowid {
class ClockSource {
public:
  virtual ~ClockSource() = default;
  // milliseconds since the unix epoch
  virtual auto now() -> std::uint64_t = 0;
};

class SystemClock : public ClockSource {
public:
  auto now() -> std::uint64_t override
  {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
  }
};

inline auto systemClock() -> std::shared_ptr<ClockSource>
{
  static auto clock = std::make_shared<SystemClock>();
  return clock;
}
} // namespace snowid
