#pragma once

#include "clock.hpp"
#include "errors.hpp"
#include "layout.hpp"
#include "option.hpp"
#include "preclude.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace snowid {
class Generator {
  // Only create() can construct a Generator, after validating the option.
  class Passkey {
    friend class Generator;
    Passkey() = default;
  };

public:
  Generator(Passkey, std::uint64_t datacenterId, std::uint64_t machineId, std::shared_ptr<ClockSource> clock) noexcept;
  Generator(Generator const&) = delete;
  auto operator=(Generator const&) -> Generator& = delete;

  static auto create(GeneratorOption const& option) -> ext::expected<std::unique_ptr<Generator>, std::error_code>;

  // Thread-safe. Fails with GeneratorErr::ClockMovedBackwards when the clock
  // reads earlier than the last minted millisecond; the state is left as is.
  auto mint() -> ext::expected<std::uint64_t, std::error_code>;

  // {"Snowflake":{...}} JSON object with the bit layout and the current minting state.
  auto describe() -> std::string;

  auto datacenterId() const -> std::uint64_t { return mDatacenterId; }
  auto machineId() const -> std::uint64_t { return mMachineId; }
  auto lastTimestamp() -> std::optional<std::uint64_t>;

private:
  auto tilNextMillis(std::uint64_t lastTimestamp) -> std::uint64_t;

private:
  std::uint64_t const mDatacenterId;
  std::uint64_t const mMachineId;
  std::shared_ptr<ClockSource> mClock;
  std::mutex mMt;
  std::uint64_t mSequence = 0;
  // unix milliseconds of the last successful mint
  std::optional<std::uint64_t> mLastTimestamp;
};
} // namespace snowid
