#pragma once

#include <cstddef>
#include <string>

namespace fleetq::util {

// Random lowercase hex, 2 chars per byte. Distinguishes two runs of a
// process that got the same pid.
std::string NewRunToken(std::size_t bytes = 4);

} // namespace fleetq::util
