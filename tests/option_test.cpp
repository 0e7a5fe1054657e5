#include "../option.hpp"
#include "../snowflake.hpp"
#include <gtest/gtest.h>

TEST(Option, Check)
{
  ASSERT_FALSE(snowid::checkGeneratorOption({}));
  ASSERT_FALSE(snowid::checkGeneratorOption({.datacenterId = 31, .machineId = 31}));
  ASSERT_EQ(snowid::checkGeneratorOption({.datacenterId = 32, .machineId = 0}),
            snowid::GeneratorErr::InvalidDatacenterId);
  ASSERT_EQ(snowid::checkGeneratorOption({.datacenterId = -1, .machineId = 0}),
            snowid::GeneratorErr::InvalidDatacenterId);
  ASSERT_EQ(snowid::checkGeneratorOption({.datacenterId = 0, .machineId = 32}), snowid::GeneratorErr::InvalidMachineId);
  ASSERT_EQ(snowid::checkGeneratorOption({.datacenterId = 0, .machineId = -1}), snowid::GeneratorErr::InvalidMachineId);
}

TEST(Option, CreateRejectsInvalidIdentity)
{
  auto r = snowid::Generator::create({.datacenterId = 32, .machineId = 0});
  ASSERT_FALSE(r);
  ASSERT_EQ(r.error(), snowid::GeneratorErr::InvalidDatacenterId);

  r = snowid::Generator::create({.datacenterId = 0, .machineId = -1});
  ASSERT_FALSE(r);
  ASSERT_EQ(r.error(), snowid::GeneratorErr::InvalidMachineId);
}

TEST(Option, DefaultsToSystemClock)
{
  auto r = snowid::Generator::create({.datacenterId = 31, .machineId = 0});
  ASSERT_TRUE(r);
  auto id = r.value()->mint();
  ASSERT_TRUE(id);
  ASSERT_GT(snowid::decode(*id).timestamp, snowid::kEpoch);
  ASSERT_EQ(snowid::decode(*id).datacenterId, 31u);
}
