#include "utilities/logger.h"
#include "utilities/var_dir.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path base = fs::temp_directory_path() / "gutex_test_cache";
  gutex::setCacheRoot(base.string());
  fs::create_directories(gutex::logsDir());

  // Initialize the logger for tests
  try {
    gutex::Logger::init(gutex::logsDir() + "/gutex_tests.log",
                        gutex::LogLevel::DEBUG);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
