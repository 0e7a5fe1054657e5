#pragma once

#include "option.hpp"
#include "preclude.hpp"
#include "snowflake.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace snowid {
constexpr std::string_view kUsage = "usage: snowid [--datacenter N] [--machine N] [--count N] [--log-level LEVEL] "
                                    "[--describe] [--decode ID]";

struct CliArgs {
  GeneratorOption option;
  std::uint64_t count = 1;
  spdlog::level::level_enum logLevel = spdlog::level::info;
  bool describe = false;
  bool help = false;
  std::optional<std::uint64_t> decodeId;
};

// Reads SNOWID_DATACENTER_ID, SNOWID_MACHINE_ID and SNOWID_LOG_LEVEL first;
// flags override them. The error is a message for the user.
auto parseArgs(int argc, char const* const* argv) -> ext::expected<CliArgs, std::string>;

// Writes "<id>\t<format(id)>" lines to out. Returns the process exit code;
// a mint failure is reported on err and stops the loop.
auto mintIds(Generator& generator, std::uint64_t count, std::ostream& out, std::ostream& err) -> int;
} // namespace snowid
