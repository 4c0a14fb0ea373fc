/*!
 * @file utilities.cpp
 * @brief Common utility functions
 */

#include "Utilities/utilities.h"

std::string getLcmUrl(long ttl) {
  assert(ttl >= 0 && ttl <= 255);
  return "udpm://239.255.76.67:7667?ttl=" + std::to_string(ttl);
}
