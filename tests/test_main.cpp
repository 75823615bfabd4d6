#include <gtest/gtest.h>

#include <iostream>

#include "chatraw/logger.hpp"

// Main function for the test executable
int main(int argc, char **argv) {
  std::cout << "Running ChatRaw Server Test Suite..." << std::endl;

  ::testing::InitGoogleTest(&argc, argv);

  // Keep routine INFO lines out of the test output
  chatraw::ServerLogger::instance().setQuietMode(true);

  int result = RUN_ALL_TESTS();

  if (result == 0) {
    std::cout << "All tests passed!" << std::endl;
  } else {
    std::cout << "Some tests failed. Check output above for details." << std::endl;
  }

  return result;
}
