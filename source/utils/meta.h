// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <stdexcept>

/**
 * Used mostly to maintain input argument invariants to functions.
 */
#define verify_argument(expr)                                      \
  do {                                                             \
    if (!(expr)) {                                                 \
      throw std::invalid_argument("argument test failed: " #expr); \
    }                                                              \
  } while (0)
