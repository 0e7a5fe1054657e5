#include "../errors.hpp"
#include <gtest/gtest.h>

#include <system_error>

TEST(Errors, Category)
{
  std::error_code ec = snowid::GeneratorErr::ClockMovedBackwards;
  ASSERT_TRUE(ec);
  ASSERT_STREQ(ec.category().name(), "GeneratorError");
  ASSERT_EQ(ec.message(), "ClockMovedBackwards");
  ASSERT_EQ(ec, snowid::GeneratorErr::ClockMovedBackwards);
  ASSERT_NE(ec, snowid::GeneratorErr::InvalidMachineId);

  ASSERT_EQ(make_error_code(snowid::GeneratorErr::InvalidDatacenterId).message(), "InvalidDatacenterId");
  ASSERT_EQ(make_error_code(snowid::GeneratorErr::InvalidMachineId).message(), "InvalidMachineId");
  ASSERT_FALSE(make_error_code(snowid::GeneratorErr::Ok));
  ASSERT_EQ(snowid::generatorErrCategory().message(1000), "Unknown");
}

TEST(Errors, SystemError)
{
  try {
    throw std::system_error(snowid::GeneratorErr::InvalidMachineId);
  } catch (std::system_error const& e) {
    ASSERT_EQ(e.code(), snowid::GeneratorErr::InvalidMachineId);
    ASSERT_EQ(&e.code().category(), &snowid::generatorErrCategory());
  }
}
