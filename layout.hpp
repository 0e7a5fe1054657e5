#pragma once

#include <cstdint>
#include <string>

namespace snowid {
// 2020-01-01T00:00:00Z
constexpr std::uint64_t kEpoch = 1577836800000;

constexpr std::uint64_t kUnusedBits = 1;
constexpr std::uint64_t kTimestampBits = 41;
constexpr std::uint64_t kDatacenterIdBits = 5;
constexpr std::uint64_t kMachineIdBits = 5;
constexpr std::uint64_t kSequenceBits = 12;
static_assert(kUnusedBits + kTimestampBits + kDatacenterIdBits + kMachineIdBits + kSequenceBits == 64);

constexpr std::uint64_t kMaxDatacenterId = ~(~std::uint64_t{0} << kDatacenterIdBits);
constexpr std::uint64_t kMaxMachineId = ~(~std::uint64_t{0} << kMachineIdBits);
constexpr std::uint64_t kMaxSequence = ~(~std::uint64_t{0} << kSequenceBits);

constexpr std::uint64_t kMachineIdShift = kSequenceBits;
constexpr std::uint64_t kDatacenterIdShift = kMachineIdShift + kMachineIdBits;
constexpr std::uint64_t kTimestampShift = kDatacenterIdShift + kDatacenterIdBits;

// Mask with bits [offset, offset + length) set, counting from the most
// significant bit. offset + length must not exceed 64.
constexpr auto diode(std::uint64_t offset, std::uint64_t length) -> std::uint64_t
{
  auto ones = length >= 64 ? ~std::uint64_t{0} : ~(~std::uint64_t{0} << length);
  return ones << (64 - offset - length);
}

struct Parts {
  std::uint64_t timestamp; // unix milliseconds
  std::uint64_t datacenterId;
  std::uint64_t machineId;
  std::uint64_t sequence;
  std::uint64_t offset; // raw timestamp field, milliseconds since kEpoch

  auto operator==(Parts const&) const -> bool = default;
};

// timestamp is in unix milliseconds. Offsets past the 41-bit field wrap.
constexpr auto encode(std::uint64_t timestamp, std::uint64_t datacenterId, std::uint64_t machineId,
                      std::uint64_t sequence) -> std::uint64_t
{
  return (timestamp - kEpoch) << kTimestampShift | datacenterId << kDatacenterIdShift | machineId << kMachineIdShift |
         sequence;
}

constexpr auto decode(std::uint64_t id) -> Parts
{
  auto offset = (id & diode(kUnusedBits, kTimestampBits)) >> kTimestampShift;
  return {
      .timestamp = offset + kEpoch,
      .datacenterId = (id & diode(kUnusedBits + kTimestampBits, kDatacenterIdBits)) >> kDatacenterIdShift,
      .machineId = (id & diode(kUnusedBits + kTimestampBits + kDatacenterIdBits, kMachineIdBits)) >> kMachineIdShift,
      .sequence = id & diode(kUnusedBits + kTimestampBits + kDatacenterIdBits + kMachineIdBits, kSequenceBits),
      .offset = offset,
  };
}

// "yyyy-mm-dd HH:MM:SS.mmm, #sequence, @(datacenter, machine)", time in UTC.
auto format(std::uint64_t id) -> std::string;
} // namespace snowid
