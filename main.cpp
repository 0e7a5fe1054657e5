#include "cli.hpp"
#include "layout.hpp"
#include "preclude.hpp"
#include "snowflake.hpp"

#include <iostream>

auto main(int argc, char** argv) -> int
{
  auto args = snowid::parseArgs(argc, argv);
  if (!args) {
    std::cerr << "snowid: " << args.error() << '\n' << snowid::kUsage << '\n';
    return 1;
  }
  if (args->help) {
    std::cout << snowid::kUsage << '\n';
    return 0;
  }
  spdlog::set_level(args->logLevel);

  if (args->decodeId) {
    auto parts = snowid::decode(*args->decodeId);
    std::cout << "timestamp=" << parts.timestamp << " datacenter=" << parts.datacenterId
              << " machine=" << parts.machineId << " sequence=" << parts.sequence << '\n'
              << snowid::format(*args->decodeId) << '\n';
    return 0;
  }

  auto generator = snowid::Generator::create(args->option);
  if (!generator) {
    std::cerr << "snowid: " << generator.error().message() << " (datacenter " << args->option.datacenterId
              << ", machine " << args->option.machineId << ", allowed 0.." << snowid::kMaxMachineId << ")\n";
    return 1;
  }
  if (args->describe) {
    std::cout << generator.value()->describe() << '\n';
    return 0;
  }

  return snowid::mintIds(*generator.value(), args->count, std::cout, std::cerr);
}
