#include "cli.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace snowid {
namespace {
template <typename T>
auto parseNumber(std::string_view str) -> std::optional<T>
{
  auto value = T{};
  auto last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

template <typename T>
auto parseInto(std::string_view name, std::string_view str, T& out) -> ext::expected<void, std::string>
{
  auto v = parseNumber<T>(str);
  if (!v) {
    return ext::make_unexpected(fmt::format("invalid value for {}: '{}'", name, str));
  }
  out = *v;
  return {};
}

auto parseLevel(std::string_view name, std::string_view str, spdlog::level::level_enum& out)
    -> ext::expected<void, std::string>
{
  auto level = spdlog::level::from_str(std::string(str));
  // from_str maps unknown names to off
  if (level == spdlog::level::off && str != "off") {
    return ext::make_unexpected(fmt::format("invalid value for {}: '{}'", name, str));
  }
  out = level;
  return {};
}
} // namespace

auto parseArgs(int argc, char const* const* argv) -> ext::expected<CliArgs, std::string>
{
  auto args = CliArgs{};
  if (auto env = std::getenv("SNOWID_DATACENTER_ID")) {
    if (auto r = parseInto("SNOWID_DATACENTER_ID", env, args.option.datacenterId); !r) {
      return ext::make_unexpected(r.error());
    }
  }
  if (auto env = std::getenv("SNOWID_MACHINE_ID")) {
    if (auto r = parseInto("SNOWID_MACHINE_ID", env, args.option.machineId); !r) {
      return ext::make_unexpected(r.error());
    }
  }
  if (auto env = std::getenv("SNOWID_LOG_LEVEL")) {
    if (auto r = parseLevel("SNOWID_LOG_LEVEL", env, args.logLevel); !r) {
      return ext::make_unexpected(r.error());
    }
  }

  for (int i = 1; i < argc; i++) {
    auto arg = std::string_view(argv[i]);
    if (arg == "--describe") {
      args.describe = true;
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      args.help = true;
      continue;
    }
    if (arg != "--datacenter" && arg != "--machine" && arg != "--count" && arg != "--decode" && arg != "--log-level") {
      return ext::make_unexpected(fmt::format("unknown option {}", arg));
    }
    if (i + 1 >= argc) {
      return ext::make_unexpected(fmt::format("missing value for {}", arg));
    }
    auto value = std::string_view(argv[++i]);
    auto r = ext::expected<void, std::string>{};
    if (arg == "--datacenter") {
      r = parseInto(arg, value, args.option.datacenterId);
    } else if (arg == "--machine") {
      r = parseInto(arg, value, args.option.machineId);
    } else if (arg == "--count") {
      r = parseInto(arg, value, args.count);
    } else if (arg == "--decode") {
      auto id = std::uint64_t{};
      r = parseInto(arg, value, id);
      args.decodeId = id;
    } else {
      r = parseLevel(arg, value, args.logLevel);
    }
    if (!r) {
      return ext::make_unexpected(r.error());
    }
  }
  return args;
}

auto mintIds(Generator& generator, std::uint64_t count, std::ostream& out, std::ostream& err) -> int
{
  for (std::uint64_t i = 0; i < count; i++) {
    auto id = generator.mint();
    if (!id) {
      err << "snowid: " << id.error().message() << " after " << i << " ids\n";
      return 1;
    }
    out << *id << '\t' << format(*id) << '\n';
  }
  return 0;
}
} // namespace snowid
