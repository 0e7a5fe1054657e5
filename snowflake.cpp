#include "snowflake.hpp"

#include <fmt/format.h>

namespace snowid {
Generator::Generator(Passkey, std::uint64_t datacenterId, std::uint64_t machineId, std::shared_ptr<ClockSource> clock) noexcept
    : mDatacenterId(datacenterId), mMachineId(machineId), mClock(std::move(clock))
{
}

auto Generator::create(GeneratorOption const& option) -> ext::expected<std::unique_ptr<Generator>, std::error_code>
{
  if (auto ec = checkGeneratorOption(option); ec) {
    return ext::make_unexpected(ec);
  }
  auto clock = option.clock ? option.clock : systemClock();
  spdlog::debug("snowid generator created, datacenter {} machine {}", option.datacenterId, option.machineId);
  return std::make_unique<Generator>(Passkey{}, static_cast<std::uint64_t>(option.datacenterId),
                                     static_cast<std::uint64_t>(option.machineId), std::move(clock));
}

auto Generator::mint() -> ext::expected<std::uint64_t, std::error_code>
{
  auto lk = std::scoped_lock(mMt);
  auto now = mClock->now();
  if (mLastTimestamp && now < *mLastTimestamp) {
    spdlog::warn("clock moved backwards, now {} ms, last {} ms, refusing to mint", now, *mLastTimestamp);
    return ext::make_unexpected(GeneratorErr::ClockMovedBackwards);
  }

  if (mLastTimestamp && now == *mLastTimestamp) {
    mSequence = (mSequence + 1) & kMaxSequence;
    if (mSequence == 0) {
      now = tilNextMillis(*mLastTimestamp);
    }
  } else {
    mSequence = 0;
  }
  mLastTimestamp = now;

  return encode(now, mDatacenterId, mMachineId, mSequence);
}

auto Generator::tilNextMillis(std::uint64_t lastTimestamp) -> std::uint64_t
{
  spdlog::trace("sequence exhausted at {} ms, spinning", lastTimestamp);
  auto now = mClock->now();
  while (now <= lastTimestamp) {
    now = mClock->now();
  }
  return now;
}

auto Generator::lastTimestamp() -> std::optional<std::uint64_t>
{
  auto lk = std::scoped_lock(mMt);
  return mLastTimestamp;
}

auto Generator::describe() -> std::string
{
  auto lk = std::scoped_lock(mMt);
  auto last = mLastTimestamp ? static_cast<std::int64_t>(*mLastTimestamp) : std::int64_t{-1};
  return fmt::format("{{\"Snowflake\":{{\"epoch\":{},\"unusedBits\":{},\"timestampBits\":{},\"datacenterIdBits\":{},"
                     "\"machineIdBits\":{},\"sequenceBits\":{},\"maxDatacenterId\":{},\"maxMachineId\":{},"
                     "\"maxSequence\":{},\"machineIdShift\":{},\"datacenterIdShift\":{},\"timestampShift\":{},"
                     "\"datacenterId\":{},\"machineId\":{},\"sequence\":{},\"lastTimestamp\":{}}}}}",
                     kEpoch, kUnusedBits, kTimestampBits, kDatacenterIdBits, kMachineIdBits, kSequenceBits,
                     kMaxDatacenterId, kMaxMachineId, kMaxSequence, kMachineIdShift, kDatacenterIdShift,
                     kTimestampShift, mDatacenterId, mMachineId, mSequence, last);
}
} // namespace snowid
