#pragma once

#include <cstdlib>
#include <iostream>

// ---------------------------------------------
// Define the macro to print messages conditionally
#ifdef DEBUG_BUILD
#define DEBUG_PRINT(...)                                                     \
  do {                                                                       \
    std::cerr << __VA_ARGS__ << std::endl;                                   \
  } while (0)
#else
#define DEBUG_PRINT(...)  // No operation
#endif

// -------------------------------------------------
// Always stderr: stdout may carry a stdio tunnel or a terminal session.
#define QBEE_VERBOSE_LOG(...)                     \
  do {                                            \
    if (std::getenv("QBEE_VERBOSE") != nullptr) { \
      std::cerr << __VA_ARGS__ << std::endl;      \
    }                                             \
  } while (0)
