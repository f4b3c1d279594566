#include <cstdlib>

#include <gtest/gtest.h>

#include "../../src/logging.hpp"

namespace arfidltest {

// ARFIDL_TEST_LOG_LEVEL=debug turns on compiler logging for the whole run
class ArfidlTestEnvironment : public ::testing::Environment
{
public:
  void SetUp() override
  {
    const char* level = std::getenv("ARFIDL_TEST_LOG_LEVEL");
    if (!level)
      return;
    if (auto parsed = arfidl::impl::parse_log_level(level))
      arfidl::impl::get_logger()->set_level(*parsed);
  }
};

} // namespace arfidltest

int main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);

  // Register the test environment
  ::testing::AddGlobalTestEnvironment(new arfidltest::ArfidlTestEnvironment);

  return RUN_ALL_TESTS();
}
