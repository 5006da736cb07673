#pragma once

#include <cstddef>
#include <string>

namespace roadcast::util {

// Random lowercase hex string of 2*bytes characters. Used for leader lock
// tokens; a released or expired lock is only removed by its own token.
std::string RandomToken(std::size_t bytes = 16);

} // namespace roadcast::util
